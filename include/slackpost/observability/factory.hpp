#pragma once

#include "slackpost/config/config.hpp"
#include "slackpost/observability/observer.hpp"

#include <memory>

namespace slackpost::observability {

/// Returns nullptr when logging is off. The global record helpers skip a null
/// observer.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace slackpost::observability
