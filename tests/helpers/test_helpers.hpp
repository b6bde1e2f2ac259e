#pragma once

#include "slackpost/http/client.hpp"
#include "slackpost/observability/observer.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace slackpost::testing {

/// Replays queued responses in order and records every request.
class MockHttpClient final : public http::HttpClient {
public:
  struct Request {
    std::string url;
    http::HttpHeaders headers;
    std::uint64_t timeout_ms = 0;
  };

  void push_body(std::string body, std::uint16_t status = 200);
  void push_network_error(std::string message, bool timeout = false);

  [[nodiscard]] http::HttpResponse get(const std::string &url, const http::HttpHeaders &headers,
                                       std::uint64_t timeout_ms) override;

  std::deque<http::HttpResponse> responses;
  std::vector<Request> requests;
};

/// Keeps every event and metric for inspection.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;
};

/// Sets or unsets an environment variable for the lifetime of the guard.
struct EnvGuard {
  EnvGuard(std::string key, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

  std::string key;
  std::optional<std::string> old_value;
};

[[nodiscard]] bool contains(const std::string &haystack, const std::string &needle);

} // namespace slackpost::testing
