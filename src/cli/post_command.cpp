#include "slackpost/cli/post_command.hpp"

#include "slackpost/observability/global.hpp"
#include "slackpost/slack/resolver.hpp"

#include <ostream>

namespace slackpost::cli {

namespace {

constexpr const char *RESET = "\033[0m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *RED = "\033[31m";

} // namespace

std::vector<std::string> PostOptions::validate() const {
  std::vector<std::string> errors;
  if (!type.has_value()) {
    errors.emplace_back("Error: Type not specified.");
  }
  if (!name.has_value()) {
    errors.emplace_back("Error: Name not specified.");
  }
  if (!token.has_value()) {
    errors.emplace_back("Error: Token not specified.");
  }
  if (!message.has_value() || message->empty()) {
    errors.emplace_back("Error: Empty message.");
  }
  return errors;
}

int exit_code_for(const PostOutcome outcome) {
  switch (outcome) {
  case PostOutcome::Success:
    return 0;
  case PostOutcome::InputError:
  case PostOutcome::UnsupportedType:
    return 2;
  case PostOutcome::ListFailure:
  case PostOutcome::UnknownTarget:
  case PostOutcome::PostFailure:
    return 1;
  }
  return 1;
}

PostCommand::PostCommand(slack::ApiClient client, std::ostream &out, std::ostream &err,
                         const bool color)
    : client_(std::move(client)), out_(out), err_(err), color_(color) {}

void PostCommand::report_error(const std::string &line) {
  if (color_) {
    err_ << RED << line << RESET << "\n";
  } else {
    err_ << line << "\n";
  }
}

void PostCommand::report_success(const std::string &line) {
  if (color_) {
    out_ << GREEN << line << RESET << "\n";
  } else {
    out_ << line << "\n";
  }
}

PostOutcome PostCommand::run(const PostOptions &options) {
  const auto input_errors = options.validate();
  if (!input_errors.empty()) {
    for (const auto &line : input_errors) {
      report_error(line);
    }
    observability::record_error("cli.post", "missing required options");
    return PostOutcome::InputError;
  }

  const auto kind = slack::resolve_kind(*options.type);
  if (!kind.has_value()) {
    report_error("Error: Unsupported type.");
    observability::record_error("cli.post", "unsupported type: " + *options.type);
    return PostOutcome::UnsupportedType;
  }

  const slack::Resolver resolver(client_);
  const auto communities = resolver.list(*kind, *options.token);
  if (!communities.ok()) {
    report_error(communities.error().to_string());
    report_error("Error: Unknown " + std::string(slack::kind_name(*kind)) + ".");
    return PostOutcome::ListFailure;
  }

  const auto target = slack::find_by_name(communities.value(), *options.name);
  if (!target.has_value()) {
    report_error("Error: Unknown " + std::string(slack::kind_name(*kind)) + ".");
    observability::record_error("cli.post", "no " + std::string(slack::kind_name(*kind)) +
                                                " named " + *options.name);
    return PostOutcome::UnknownTarget;
  }
  observability::record_community_resolved(std::string(slack::kind_name(target->kind)),
                                           target->name, target->id);

  out_ << "Posting \"" << *options.message << "\" to " << target->label() << " ...\n";
  const auto posted = client_.post_message(target->id, *options.message, *options.token);
  if (!posted.ok()) {
    report_error(posted.error().to_string());
    return PostOutcome::PostFailure;
  }

  observability::record_message_posted(target->label());
  report_success("success");
  return PostOutcome::Success;
}

} // namespace slackpost::cli
