#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <curl/curl.h>

namespace bgcore {

struct HttpResponse {
  long status{0};
  std::string body;
};

// -----------------------------------------------------------------------------
// RestClient: thin libcurl wrapper
// -----------------------------------------------------------------------------
//
// @brief  Performs one HTTP request against a fixed base URL and returns the
//         status and body. Knows nothing about signing or the Bitget envelope.
//
// @details
// One curl easy handle is reused across calls (keeps the TLS connection
// alive) and guarded by a mutex, so the client may be shared by the decision
// loop and the resync path.
//
// Errors: a transport-level failure (DNS, connect, TLS, timeout) throws
// TransientNetworkError. HTTP error statuses are returned, not thrown.
// -----------------------------------------------------------------------------
class RestClient {
 public:
  RestClient(std::string base_url, long timeout_ms, long connect_timeout_ms);
  ~RestClient();

  RestClient(const RestClient&) = delete;
  RestClient& operator=(const RestClient&) = delete;

  // path_with_query is appended verbatim to the base URL.
  HttpResponse perform(const std::string& method,
                       const std::string& path_with_query,
                       const std::string& body,
                       const std::vector<std::string>& headers);

  const std::string& baseUrl() const { return base_url_; }

 private:
  static size_t writeCallback(char* ptr, size_t size, size_t nmemb,
                              void* userdata);

  const std::string base_url_;
  const long timeout_ms_;
  const long connect_timeout_ms_;

  std::mutex mutex_;
  CURL* curl_{nullptr};
};

}  // namespace bgcore
