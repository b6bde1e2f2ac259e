#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace slackpost::http {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

class HttpClient {
public:
  virtual ~HttpClient() = default;

  /// Blocking GET. Transport problems are reported through network_error,
  /// never thrown.
  [[nodiscard]] virtual HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                         std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers,
                                 std::uint64_t timeout_ms) override;
};

/// Percent-encode every byte outside the unreserved set (ALPHA DIGIT - . _ ~).
/// Returns an empty string if encoding fails.
[[nodiscard]] std::string url_encode(const std::string &value);

} // namespace slackpost::http
