#include "slackpost/cli/commands.hpp"

#include "slackpost/cli/post_command.hpp"
#include "slackpost/common/strings.hpp"
#include "slackpost/config/config.hpp"
#include "slackpost/observability/factory.hpp"
#include "slackpost/observability/global.hpp"

#include <iostream>
#include <optional>
#include <unistd.h>

namespace slackpost::cli {

namespace {

std::string version_string() {
#ifdef SLACKPOST_VERSION
  std::string version = SLACKPOST_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef SLACKPOST_GIT_COMMIT
  const std::string commit = SLACKPOST_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "slackpost " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// Removes "<name> <value>" or "<name>=<value>" from args. A trailing name
/// with no value is removed and reported as absent.
std::optional<std::string> take_option(std::vector<std::string> &args, const std::string &name) {
  const std::string inline_prefix = name + "=";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      if (i + 1 >= args.size()) {
        args.erase(args.begin() + static_cast<long>(i));
        return std::nullopt;
      }
      std::string value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return value;
    }
    if (common::starts_with(args[i], inline_prefix)) {
      std::string value = args[i].substr(inline_prefix.size());
      args.erase(args.begin() + static_cast<long>(i));
      return value;
    }
  }
  return std::nullopt;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

/// Index of the first argument that is not a global option or its value;
/// that argument is the subcommand. Options after it belong to the subcommand.
std::size_t global_options_end(const std::vector<std::string> &args) {
  static const std::vector<std::string> kValued = {"--log", "--api-host", "--timeout-ms"};
  std::size_t i = 0;
  while (i < args.size()) {
    if (args[i] == "--verbose") {
      ++i;
      continue;
    }
    bool matched = false;
    for (const auto &name : kValued) {
      if (args[i] == name) {
        i += 2;
        matched = true;
        break;
      }
      if (common::starts_with(args[i], name + "=")) {
        ++i;
        matched = true;
        break;
      }
    }
    if (!matched) {
      return i;
    }
  }
  return args.size();
}

bool apply_global_options(std::vector<std::string> &args, config::Config &config,
                          std::string &error) {
  if (take_flag(args, "--verbose")) {
    config.observability.backend = "log";
  }
  if (auto log = take_option(args, "--log"); log.has_value()) {
    config.observability.backend = common::to_lower(common::trim(*log));
  }
  if (auto host = take_option(args, "--api-host"); host.has_value()) {
    config.api_host = common::trim(*host);
  }
  if (auto timeout = take_option(args, "--timeout-ms"); timeout.has_value()) {
    auto parsed = config::parse_timeout_ms(*timeout);
    if (!parsed.ok()) {
      error = parsed.error();
      return false;
    }
    config.timeout_ms = parsed.value();
  }

  const auto issues = config::validate_config(config);
  if (!issues.empty()) {
    error = issues.front();
    return false;
  }
  return true;
}

int run_post(std::vector<std::string> args, const config::Config &config,
             std::shared_ptr<http::HttpClient> http_client, std::ostream &out, std::ostream &err,
             const bool color) {
  PostOptions options;
  options.type = take_option(args, "--type");
  options.name = take_option(args, "--name");
  options.token = take_option(args, "--token");
  options.message = take_option(args, "--message");
  if (!args.empty()) {
    err << "Error: Unexpected argument: " << args.front() << "\n";
    err << "usage: slackpost post --type <channel|group> --name <name> --token <token> "
           "--message <text>\n";
    return 2;
  }

  slack::ApiClient client(std::move(http_client), config.api_host, config.timeout_ms);
  PostCommand command(std::move(client), out, err, color);
  return exit_code_for(command.run(options));
}

} // namespace

void print_help(std::ostream &out, const bool color) {
  const char *RESET = color ? "\033[0m" : "";
  const char *BOLD = color ? "\033[1m" : "";
  const char *DIM = color ? "\033[2m" : "";
  const char *CYAN = color ? "\033[36m" : "";
  const char *GREEN = color ? "\033[32m" : "";

  out << "\n";
  out << BOLD << CYAN << "  slackpost" << RESET << DIM
      << " - post a message to a Slack channel or group" << RESET << "\n";
  out << DIM << "  " << version_string() << RESET << "\n\n";

  out << BOLD << "  USAGE" << RESET << "\n";
  out << DIM << "  $ " << RESET << "slackpost [global options] <command> [options]\n\n";

  out << BOLD << "  COMMANDS" << RESET << "\n";
  out << "  " << GREEN << "post" << RESET << DIM << "           Post to a channel or group" << RESET
      << "\n";
  out << "  " << GREEN << "help" << RESET << DIM << "           Show this help" << RESET << "\n";
  out << "  " << GREEN << "version" << RESET << DIM << "        Show the version" << RESET
      << "\n\n";

  out << BOLD << "  POST OPTIONS" << RESET << "\n";
  out << "  --type TYPE      " << DIM << "channel or group (any prefix of channels/groups)"
      << RESET << "\n";
  out << "  --name NAME      " << DIM << "exact channel or group name" << RESET << "\n";
  out << "  --token TOKEN    " << DIM << "Slack API token" << RESET << "\n";
  out << "  --message TEXT   " << DIM << "message text" << RESET << "\n\n";

  out << BOLD << "  GLOBAL OPTIONS" << RESET << "\n";
  out << "  --log BACKEND    " << DIM << "none, log (also SLACKPOST_LOG)" << RESET << "\n";
  out << "  --verbose        " << DIM << "same as --log log" << RESET << "\n";
  out << "  --api-host HOST  " << DIM << "API host, default slack.com (also SLACKPOST_API_HOST)"
      << RESET << "\n";
  out << "  --timeout-ms N   " << DIM << "request timeout in ms, 0 for none (also SLACKPOST_TIMEOUT_MS)" << RESET
      << "\n\n";
}

int run_cli(std::vector<std::string> args, std::shared_ptr<http::HttpClient> http_client,
            std::ostream &out, std::ostream &err, const bool color) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    err << loaded.error() << "\n";
    return 2;
  }
  config::Config config = loaded.value();

  const std::size_t split = global_options_end(args);
  std::vector<std::string> globals(args.begin(), args.begin() + static_cast<long>(split));
  args.erase(args.begin(), args.begin() + static_cast<long>(split));

  std::string global_error;
  if (!apply_global_options(globals, config, global_error)) {
    err << global_error << "\n";
    return 2;
  }

  observability::set_global_observer(observability::create_observer(config));

  if (args.empty()) {
    print_help(out, color);
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  int code = 0;
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(out, color);
  } else if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    out << version_string() << "\n";
  } else if (subcommand == "post") {
    code = run_post(std::move(args), config, std::move(http_client), out, err, color);
  } else {
    err << "Unknown command: " << subcommand << "\n";
    print_help(err, color);
    code = 2;
  }

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  const bool color = isatty(STDOUT_FILENO) != 0 && isatty(STDERR_FILENO) != 0;
  return run_cli(std::move(args), std::make_shared<http::CurlHttpClient>(), std::cout, std::cerr,
                 color);
}

} // namespace slackpost::cli
