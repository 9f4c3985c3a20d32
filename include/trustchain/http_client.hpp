/**
 * @file http_client.hpp
 * @brief Blocking HTTP transport used by the signer bridge, registry sync
 * and tool dispatch
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace trustchain {

struct HttpResponse {
  long status = 0;
  std::string body;

  [[nodiscard]] bool ok() const noexcept {
    return status >= 200 && status < 300;
  }
};

struct HttpError {
  std::string message;
  bool timed_out = false;
};

/**
 * @brief Minimal HTTP interface; every call carries its own timeout
 *
 * Implementations return a response for any HTTP status and std::nullopt only
 * when no response was received, with the cause in out_error.
 */
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual std::optional<HttpResponse> get(std::string_view url,
                                          std::chrono::milliseconds timeout,
                                          HttpError& out_error) const = 0;

  virtual std::optional<HttpResponse> postJson(
      std::string_view url, std::string_view body,
      std::chrono::milliseconds timeout, HttpError& out_error) const = 0;
};

/**
 * @brief libcurl implementation
 */
class CurlHttpClient final : public HttpClient {
 public:
  CurlHttpClient();

  std::optional<HttpResponse> get(std::string_view url,
                                  std::chrono::milliseconds timeout,
                                  HttpError& out_error) const override;

  std::optional<HttpResponse> postJson(std::string_view url,
                                       std::string_view body,
                                       std::chrono::milliseconds timeout,
                                       HttpError& out_error) const override;
};

/**
 * @brief Shared libcurl client
 */
std::shared_ptr<HttpClient> defaultHttpClient();

/**
 * @brief Join a base URL and a path with exactly one slash between them
 */
std::string joinUrl(std::string_view base, std::string_view path);

/**
 * @brief Host part of a URL, lowercased, without brackets or port
 */
std::string urlHost(std::string_view url);

/**
 * @brief True for localhost, 127.0.0.0/8, ::1 and 0.0.0.0
 */
bool isLoopbackUrl(std::string_view url);

}  // namespace trustchain
