#pragma once

#include "slackpost/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace slackpost::config {

enum class LogBackend { None, Log };

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  std::string api_host = "slack.com";
  // 0 leaves the HTTP client's own default in place (libcurl: no timeout).
  std::uint64_t timeout_ms = 0;
  ObservabilityConfig observability;
};

/// Defaults with environment overrides applied, then validated.
[[nodiscard]] common::Result<Config> load_config();

/// Returns one message per environment variable that could not be applied.
[[nodiscard]] std::vector<std::string> apply_env_overrides(Config &config);

/// Returns one message per invalid setting; an empty list means valid.
[[nodiscard]] std::vector<std::string> validate_config(const Config &config);

[[nodiscard]] common::Result<std::uint64_t> parse_timeout_ms(const std::string &raw);

/// "none" and "noop" (or empty) turn logging off, "log" writes to stderr.
[[nodiscard]] std::optional<LogBackend> parse_log_backend(const std::string &raw);

} // namespace slackpost::config
