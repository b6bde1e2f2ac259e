#include "test_framework.hpp"

#include "slackpost/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_config_tests(std::vector<slackpost::tests::TestCase> &tests) {
  using slackpost::tests::require;
  using slackpost::testing::EnvGuard;
  namespace config = slackpost::config;

  tests.push_back({"config_defaults", [] {
                     EnvGuard host("SLACKPOST_API_HOST", std::nullopt);
                     EnvGuard timeout("SLACKPOST_TIMEOUT_MS", std::nullopt);
                     EnvGuard log("SLACKPOST_LOG", std::nullopt);
                     auto loaded = config::load_config();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().api_host == "slack.com", "default host");
                     require(loaded.value().timeout_ms == 0, "no timeout unless configured");
                     require(loaded.value().observability.backend == "none", "default backend");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     EnvGuard host("SLACKPOST_API_HOST", std::string("slack.example.test"));
                     EnvGuard timeout("SLACKPOST_TIMEOUT_MS", std::string("2500"));
                     EnvGuard log("SLACKPOST_LOG", std::string("LOG"));
                     auto loaded = config::load_config();
                     require(loaded.ok(), loaded.ok() ? "" : loaded.error());
                     require(loaded.value().api_host == "slack.example.test", "host override");
                     require(loaded.value().timeout_ms == 2500, "timeout override");
                     require(loaded.value().observability.backend == "log", "backend lowered");
                   }});

  tests.push_back({"config_rejects_bad_timeout_env", [] {
                     EnvGuard host("SLACKPOST_API_HOST", std::nullopt);
                     EnvGuard timeout("SLACKPOST_TIMEOUT_MS", std::string("soon"));
                     auto loaded = config::load_config();
                     require(!loaded.ok(), "non-numeric timeout should be rejected");
                     require(slackpost::testing::contains(loaded.error(), "SLACKPOST_TIMEOUT_MS"),
                             "names the variable: " + loaded.error());
                   }});

  tests.push_back({"config_validate_host_shape", [] {
                     config::Config cfg;
                     require(config::validate_config(cfg).empty(), "defaults are valid");
                     cfg.api_host = "https://slack.com/";
                     require(!config::validate_config(cfg).empty(), "url is not a host");
                     cfg.api_host = "";
                     require(!config::validate_config(cfg).empty(), "empty host");
                   }});

  tests.push_back({"config_parse_timeout_ms", [] {
                     require(config::parse_timeout_ms("100").ok(), "plain number");
                     require(config::parse_timeout_ms("0").ok() &&
                                 config::parse_timeout_ms("0").value() == 0,
                             "zero turns the timeout off");
                     require(!config::parse_timeout_ms("12ms").ok(), "suffix rejected");
                     require(!config::parse_timeout_ms("9999999").ok(), "too large");
                   }});

  tests.push_back({"config_validate_log_backend", [] {
                     config::Config cfg;
                     for (const char *name : {"", "none", "noop", "log", " LOG "}) {
                       cfg.observability.backend = name;
                       require(config::validate_config(cfg).empty(),
                               std::string("accepted backend: ") + name);
                     }
                     cfg.observability.backend = "log,noop";
                     const auto issues = config::validate_config(cfg);
                     require(issues.size() == 1, "list is not a backend");
                     require(slackpost::testing::contains(issues.front(), "unknown log backend"),
                             issues.front());
                     cfg.observability.backend = "syslog";
                     require(!config::validate_config(cfg).empty(), "unknown name rejected");
                   }});

  tests.push_back({"config_rejects_unknown_log_env", [] {
                     EnvGuard host("SLACKPOST_API_HOST", std::nullopt);
                     EnvGuard timeout("SLACKPOST_TIMEOUT_MS", std::nullopt);
                     EnvGuard log("SLACKPOST_LOG", std::string("journal"));
                     auto loaded = config::load_config();
                     require(!loaded.ok(), "unknown backend should fail to load");
                     require(slackpost::testing::contains(loaded.error(), "journal"), loaded.error());
                   }});
}
