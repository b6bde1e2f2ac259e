#include "slackpost/config/config.hpp"

#include "slackpost/common/strings.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace slackpost::config {

namespace {

constexpr std::uint64_t kMaxTimeoutMs = 10ULL * 60ULL * 1000ULL;

} // namespace

common::Result<std::uint64_t> parse_timeout_ms(const std::string &raw) {
  const std::string value = common::trim(raw);
  std::uint64_t parsed = 0;
  const auto *begin = value.data();
  const auto *end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (value.empty() || ec != std::errc() || ptr != end) {
    return common::Result<std::uint64_t>::failure("invalid timeout_ms: " + raw);
  }
  if (parsed > kMaxTimeoutMs) {
    return common::Result<std::uint64_t>::failure("timeout_ms out of range: " + raw);
  }
  return common::Result<std::uint64_t>::success(parsed);
}

std::optional<LogBackend> parse_log_backend(const std::string &raw) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value.empty() || value == "none" || value == "noop") {
    return LogBackend::None;
  }
  if (value == "log") {
    return LogBackend::Log;
  }
  return std::nullopt;
}

std::vector<std::string> apply_env_overrides(Config &config) {
  std::vector<std::string> issues;
  if (const char *host = std::getenv("SLACKPOST_API_HOST"); host != nullptr && *host) {
    config.api_host = common::trim(host);
  }
  if (const char *timeout = std::getenv("SLACKPOST_TIMEOUT_MS"); timeout != nullptr && *timeout) {
    auto parsed = parse_timeout_ms(timeout);
    if (parsed.ok()) {
      config.timeout_ms = parsed.value();
    } else {
      issues.push_back("SLACKPOST_TIMEOUT_MS: " + parsed.error());
    }
  }
  if (const char *log = std::getenv("SLACKPOST_LOG"); log != nullptr && *log) {
    config.observability.backend = common::to_lower(common::trim(log));
  }
  return issues;
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> issues;
  if (common::trim(config.api_host).empty()) {
    issues.emplace_back("api_host must not be empty");
  } else if (config.api_host.find_first_of("/?#@ ") != std::string::npos) {
    issues.push_back("api_host must be a bare host name: " + config.api_host);
  }
  if (config.timeout_ms > kMaxTimeoutMs) {
    issues.emplace_back("timeout_ms must be at most 600000");
  }
  if (!parse_log_backend(config.observability.backend).has_value()) {
    issues.push_back("unknown log backend: " + config.observability.backend +
                     " (expected none or log)");
  }
  return issues;
}

common::Result<Config> load_config() {
  Config config;
  auto issues = apply_env_overrides(config);
  for (auto &issue : validate_config(config)) {
    issues.push_back(std::move(issue));
  }
  if (!issues.empty()) {
    std::string message = "invalid configuration:";
    for (const auto &issue : issues) {
      message += " " + issue + ";";
    }
    message.pop_back();
    return common::Result<Config>::failure(message);
  }
  return common::Result<Config>::success(config);
}

} // namespace slackpost::config
