#include "bgcore/exchange/rest_client.hpp"

#include "bgcore/domain/errors.hpp"

#include <stdexcept>

namespace bgcore {

namespace {

std::once_flag g_curl_init;

}  // namespace

RestClient::RestClient(std::string base_url, long timeout_ms,
                       long connect_timeout_ms)
    : base_url_(std::move(base_url)),
      timeout_ms_(timeout_ms),
      connect_timeout_ms_(connect_timeout_ms) {
  // curl_global_init is not thread-safe; run it once per process.
  std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

  curl_ = curl_easy_init();
  if (!curl_) {
    throw std::runtime_error("[RestClient] curl_easy_init failed");
  }
}

RestClient::~RestClient() {
  if (curl_) {
    curl_easy_cleanup(curl_);
    curl_ = nullptr;
  }
}

size_t RestClient::writeCallback(char* ptr, size_t size, size_t nmemb,
                                 void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

HttpResponse RestClient::perform(const std::string& method,
                                 const std::string& path_with_query,
                                 const std::string& body,
                                 const std::vector<std::string>& headers) {
  std::lock_guard lock(mutex_);

  const std::string url = base_url_ + path_with_query;
  HttpResponse response;

  struct curl_slist* header_list = nullptr;
  for (const auto& header : headers) {
    header_list = curl_slist_append(header_list, header.c_str());
  }

  curl_easy_reset(curl_);
  curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &RestClient::writeCallback);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

  if (method == "POST") {
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  }

  const CURLcode res = curl_easy_perform(curl_);
  curl_slist_free_all(header_list);

  if (res != CURLE_OK) {
    throw TransientNetworkError(std::string("[RestClient] ") + method + " " +
                                path_with_query + " failed: " +
                                curl_easy_strerror(res));
  }

  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

}  // namespace bgcore
