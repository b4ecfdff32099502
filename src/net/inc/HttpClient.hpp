#ifndef KINDLING_NET_HTTP_CLIENT_HPP
#define KINDLING_NET_HTTP_CLIENT_HPP
/**
 * @file HttpClient.hpp
 * @brief HTTP probe and file download seam, with a libcurl implementation.
 */

#include <chrono>
#include <string>

namespace kindling {
namespace net {

/* ----------------------------- HttpResponse ----------------------------- */

/**
 * @brief Outcome of a single GET.
 */
struct HttpResponse {
  bool transportOk{false}; ///< Connection made and a status line received
  long status{0};          ///< HTTP status code
  std::string error;       ///< Transport error text when !transportOk

  /// True for a 2xx response.
  [[nodiscard]] bool ok() const noexcept { return transportOk && status >= 200 && status < 300; }
};

/* ----------------------------- HttpClient ----------------------------- */

/**
 * @brief Minimal HTTP operations used during provisioning.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /// GET @p url, discarding the body.
  [[nodiscard]] virtual HttpResponse get(const std::string& url,
                                         std::chrono::milliseconds timeout) = 0;

  /**
   * @brief Download @p url to @p destination, following redirects.
   * @param error Set on failure.
   * @return true when the file was written completely with a 2xx status.
   */
  [[nodiscard]] virtual bool download(const std::string& url, const std::string& destination,
                                      std::string& error) = 0;
};

/**
 * @brief libcurl-backed HttpClient.
 *
 * curl_global_init runs once per process on first construction.
 */
class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();

  [[nodiscard]] HttpResponse get(const std::string& url,
                                 std::chrono::milliseconds timeout) override;

  [[nodiscard]] bool download(const std::string& url, const std::string& destination,
                              std::string& error) override;
};

} // namespace net
} // namespace kindling

#endif // KINDLING_NET_HTTP_CLIENT_HPP
