#pragma once

#include "slackpost/common/json_util.hpp"
#include "slackpost/common/result.hpp"
#include "slackpost/http/client.hpp"
#include "slackpost/slack/community.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace slackpost::slack {

inline constexpr const char *kDefaultApiHost = "slack.com";
// 0 means no timeout of our own; libcurl then waits indefinitely.
inline constexpr std::uint64_t kDefaultTimeoutMs = 0;

enum class ApiErrorCode {
  TransportFailure,
  InvalidResponse,
  RemoteError,
};

struct ApiError {
  ApiErrorCode code = ApiErrorCode::InvalidResponse;
  // "list" or "postMessage".
  std::string operation;
  std::string message;

  [[nodiscard]] std::string to_string() const;
};

template <typename T> using ApiResult = common::Result<T, ApiError>;

/// Raw JSON text of one element of a list response.
using RawRecord = std::string;

class ApiClient {
public:
  explicit ApiClient(std::shared_ptr<http::HttpClient> http_client,
                     std::string host = kDefaultApiHost,
                     std::uint64_t timeout_ms = kDefaultTimeoutMs);

  /// https://<host>/api/<method>?token=<token>. Neither argument is encoded.
  [[nodiscard]] std::string build_url(const std::string &method, const std::string &token) const;

  /// GET <collection>.list. An empty array is a valid empty result; a missing
  /// or non-array collection key is an InvalidResponse.
  [[nodiscard]] ApiResult<std::vector<RawRecord>> list_communities(CommunityKind kind,
                                                                   const std::string &token) const;

  /// GET chat.postMessage with channel=<id>&text=<percent-encoded text>.
  [[nodiscard]] ApiResult<void> post_message(const std::string &id, const std::string &text,
                                             const std::string &token) const;

  [[nodiscard]] const std::string &host() const { return host_; }

private:
  [[nodiscard]] ApiResult<common::JsonFieldMap> call(const std::string &operation,
                                                     const std::string &method,
                                                     const std::string &url) const;

  std::shared_ptr<http::HttpClient> http_client_;
  std::string host_;
  std::uint64_t timeout_ms_;
};

} // namespace slackpost::slack
