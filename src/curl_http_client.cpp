#include <curl/curl.h>

#include <memory>
#include <mutex>

#include "trustchain/http_client.hpp"
#include "trustchain/logging.hpp"

namespace trustchain {

namespace {

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  const size_t total = size * nmemb;
  out->append(ptr, total);
  return total;
}

struct CurlDeleter {
  void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};
using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

struct SlistDeleter {
  void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

std::optional<HttpResponse> perform(CURL* curl, const std::string& url,
                                    std::chrono::milliseconds timeout,
                                    HttpError& out_error) {
  std::string body;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  // a 3xx is returned to the caller; the request never leaves the checked host
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "trustchain/1.0");

  const CURLcode rc = curl_easy_perform(curl);
  if (rc != CURLE_OK) {
    out_error.message = curl_easy_strerror(rc);
    out_error.timed_out = rc == CURLE_OPERATION_TIMEDOUT;
    TC_LOG_DEBUG("HTTP request to {} failed: {}", url, out_error.message);
    return std::nullopt;
  }

  HttpResponse response;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  response.body = std::move(body);
  return response;
}

}  // namespace

CurlHttpClient::CurlHttpClient() {
  static std::once_flag initialized;
  std::call_once(initialized, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::optional<HttpResponse> CurlHttpClient::get(
    std::string_view url, std::chrono::milliseconds timeout,
    HttpError& out_error) const {
  out_error = {};
  CurlPtr curl(curl_easy_init());
  if (!curl) {
    out_error.message = "curl_easy_init failed";
    return std::nullopt;
  }
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  return perform(curl.get(), std::string(url), timeout, out_error);
}

std::optional<HttpResponse> CurlHttpClient::postJson(
    std::string_view url, std::string_view body,
    std::chrono::milliseconds timeout, HttpError& out_error) const {
  out_error = {};
  CurlPtr curl(curl_easy_init());
  if (!curl) {
    out_error.message = "curl_easy_init failed";
    return std::nullopt;
  }

  SlistPtr headers(
      curl_slist_append(nullptr, "Content-Type: application/json"));
  if (!headers) {
    out_error.message = "curl_slist_append failed";
    return std::nullopt;
  }
  std::string payload(body);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(payload.size()));
  return perform(curl.get(), std::string(url), timeout, out_error);
}

std::shared_ptr<HttpClient> defaultHttpClient() {
  static auto client = std::make_shared<CurlHttpClient>();
  return client;
}

}  // namespace trustchain
