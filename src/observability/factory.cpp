#include "slackpost/observability/factory.hpp"

#include "slackpost/observability/log_observer.hpp"

namespace slackpost::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const auto backend = config::parse_log_backend(config.observability.backend);
  if (backend == config::LogBackend::Log) {
    return std::make_unique<LogObserver>();
  }
  // Unknown names never get here; validate_config rejects them first.
  return nullptr;
}

} // namespace slackpost::observability
