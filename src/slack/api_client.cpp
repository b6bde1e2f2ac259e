#include "slackpost/slack/api_client.hpp"

#include "slackpost/observability/global.hpp"

#include <chrono>

namespace slackpost::slack {

namespace {

constexpr const char *kUnknownError = "Unknown error";

ApiError make_error(const ApiErrorCode code, const std::string &operation, std::string message) {
  return ApiError{.code = code, .operation = operation, .message = std::move(message)};
}

} // namespace

std::string ApiError::to_string() const {
  const std::string prefix = "Failed from \"" + operation + "\" with ";
  switch (code) {
  case ApiErrorCode::TransportFailure:
    return prefix + "request error: " + message;
  case ApiErrorCode::InvalidResponse:
    return prefix + "invalid response: " + message;
  case ApiErrorCode::RemoteError:
    return prefix + "error message: " + message;
  }
  return prefix + "error message: " + message;
}

ApiClient::ApiClient(std::shared_ptr<http::HttpClient> http_client, std::string host,
                     const std::uint64_t timeout_ms)
    : http_client_(std::move(http_client)), host_(std::move(host)), timeout_ms_(timeout_ms) {}

std::string ApiClient::build_url(const std::string &method, const std::string &token) const {
  return "https://" + host_ + "/api/" + method + "?token=" + token;
}

ApiResult<common::JsonFieldMap> ApiClient::call(const std::string &operation,
                                                const std::string &method,
                                                const std::string &url) const {
  using Out = ApiResult<common::JsonFieldMap>;
  if (http_client_ == nullptr) {
    return Out::failure(
        make_error(ApiErrorCode::TransportFailure, operation, "http client unavailable"));
  }

  const auto started = std::chrono::steady_clock::now();
  const auto response = http_client_->get(url, {{"Accept", "application/json"}}, timeout_ms_);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  auto fail = [&](ApiError error) {
    observability::record_api_request(method, elapsed, false);
    observability::record_error("slack.api", error.to_string());
    return Out::failure(std::move(error));
  };

  if (response.network_error) {
    std::string reason = response.network_error_message;
    if (response.timeout) {
      reason = "timeout: " + reason;
    }
    return fail(make_error(ApiErrorCode::TransportFailure, operation, reason));
  }

  if (!common::json_validate(response.body) ||
      common::json_kind_of(response.body) != common::JsonKind::Object) {
    return fail(make_error(ApiErrorCode::InvalidResponse, operation,
                           "body is not a JSON object (http status " +
                               std::to_string(response.status) + ")"));
  }

  auto fields = common::json_parse_fields(response.body);
  const auto ok_it = fields.find("ok");
  if (ok_it == fields.end() || ok_it->second.kind != common::JsonKind::Bool) {
    return fail(make_error(ApiErrorCode::InvalidResponse, operation, "missing boolean \"ok\""));
  }
  if (ok_it->second.value != "true") {
    const auto error_it = fields.find("error");
    const bool has_reason =
        error_it != fields.end() && error_it->second.kind == common::JsonKind::String;
    return fail(make_error(ApiErrorCode::RemoteError, operation,
                           has_reason ? error_it->second.value : kUnknownError));
  }

  observability::record_api_request(method, elapsed, true);
  return Out::success(std::move(fields));
}

ApiResult<std::vector<RawRecord>> ApiClient::list_communities(const CommunityKind kind,
                                                              const std::string &token) const {
  using Out = ApiResult<std::vector<RawRecord>>;
  const std::string key = collection_key(kind);
  const std::string method = key + ".list";

  auto envelope = call("list", method, build_url(method, token));
  if (!envelope.ok()) {
    return Out::failure(envelope.error());
  }

  const auto &fields = envelope.value();
  const auto results_it = fields.find(key);
  if (results_it == fields.end() || results_it->second.kind != common::JsonKind::Array) {
    ApiError error =
        make_error(ApiErrorCode::InvalidResponse, "list", "missing \"" + key + "\" array");
    observability::record_error("slack.api", error.to_string());
    return Out::failure(std::move(error));
  }

  std::vector<RawRecord> records = common::json_split_top_level_values(results_it->second.value);
  for (const auto &record : records) {
    if (common::json_kind_of(record) != common::JsonKind::Object) {
      ApiError error = make_error(ApiErrorCode::InvalidResponse, "list",
                                  "\"" + key + "\" holds a non-object entry");
      observability::record_error("slack.api", error.to_string());
      return Out::failure(std::move(error));
    }
  }

  observability::record_metric(
      observability::CommunitiesListedMetric{.count = static_cast<std::uint64_t>(records.size())});
  return Out::success(std::move(records));
}

ApiResult<void> ApiClient::post_message(const std::string &id, const std::string &text,
                                        const std::string &token) const {
  const std::string method = "chat.postMessage";
  // An encoding failure degrades to an empty text parameter.
  const std::string encoded = http::url_encode(text);
  if (encoded.empty() && !text.empty()) {
    observability::record_error("slack.api", "failed to encode message text");
  }
  const std::string url = build_url(method, token) + "&channel=" + id + "&text=" + encoded;

  auto envelope = call("postMessage", method, url);
  if (!envelope.ok()) {
    return ApiResult<void>::failure(envelope.error());
  }
  return ApiResult<void>::success();
}

} // namespace slackpost::slack
