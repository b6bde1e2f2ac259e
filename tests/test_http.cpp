#include "test_framework.hpp"

#include "slackpost/http/client.hpp"
#include "tests/helpers/test_helpers.hpp"

void register_http_tests(std::vector<slackpost::tests::TestCase> &tests) {
  using slackpost::tests::require;
  namespace http = slackpost::http;

  tests.push_back({"http_url_encode_reserved_characters", [] {
                     require(http::url_encode("a b&c") == "a%20b%26c",
                             "space and ampersand must be escaped: " + http::url_encode("a b&c"));
                     require(http::url_encode("x=1?y#z/") == "x%3D1%3Fy%23z%2F",
                             "query delimiters must be escaped");
                     require(http::url_encode("Az09-._~") == "Az09-._~",
                             "unreserved characters stay as-is");
                   }});

  tests.push_back({"http_url_encode_utf8_bytes", [] {
                     require(http::url_encode("caf\xC3\xA9") == "caf%C3%A9",
                             "multi-byte characters are escaped per byte");
                     require(http::url_encode("").empty(), "empty stays empty");
                   }});

  tests.push_back({"http_curl_client_reports_connection_failure", [] {
                     using slackpost::testing::EnvGuard;
                     EnvGuard http_proxy("http_proxy", std::nullopt);
                     EnvGuard http_proxy_upper("HTTP_PROXY", std::nullopt);
                     EnvGuard all_proxy("all_proxy", std::nullopt);
                     EnvGuard all_proxy_upper("ALL_PROXY", std::nullopt);
                     http::CurlHttpClient client;
                     const auto response = client.get("http://127.0.0.1:1/api/test", {}, 2000);
                     require(response.network_error, "refused connection is a network error");
                     require(!response.network_error_message.empty(), "curl error text");
                     require(response.status == 0, "no status without a response");
                   }});
}
