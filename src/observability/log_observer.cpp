#include "slackpost/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace slackpost::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ApiRequestEvent>) {
          log_line(out_, evt.success ? "INFO" : "WARN",
                   "api.request method=" + evt.method +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, CommunityResolvedEvent>) {
          log_line(out_, "DEBUG",
                   "community.resolved kind=" + evt.kind + " name=" + evt.name + " id=" + evt.id);
        } else if constexpr (std::is_same_v<T, MessagePostedEvent>) {
          log_line(out_, "INFO", "message.posted destination=" + evt.destination);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(out_, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line(out_, "DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CommunitiesListedMetric>) {
          log_line(out_, "DEBUG", "metric.communities_listed=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_.flush(); }

} // namespace slackpost::observability
