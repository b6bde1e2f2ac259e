#include "slackpost/observability/global.hpp"

#include <mutex>

namespace slackpost::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_api_request(const std::string &method, std::chrono::milliseconds duration,
                        const bool success) {
  record_event(ApiRequestEvent{.method = method, .duration = duration, .success = success});
  record_metric(RequestLatencyMetric{.latency = duration});
}

void record_community_resolved(const std::string &kind, const std::string &name,
                               const std::string &id) {
  record_event(CommunityResolvedEvent{.kind = kind, .name = name, .id = id});
}

void record_message_posted(const std::string &destination) {
  record_event(MessagePostedEvent{.destination = destination});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace slackpost::observability
