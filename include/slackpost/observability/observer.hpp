#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace slackpost::observability {

struct ApiRequestEvent {
  std::string method;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct CommunityResolvedEvent {
  std::string kind;
  std::string name;
  std::string id;
};

struct MessagePostedEvent {
  std::string destination;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ApiRequestEvent, CommunityResolvedEvent, MessagePostedEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct CommunitiesListedMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, CommunitiesListedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace slackpost::observability
