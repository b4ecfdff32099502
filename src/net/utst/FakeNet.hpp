#ifndef KINDLING_NET_FAKE_NET_HPP
#define KINDLING_NET_FAKE_NET_HPP
/**
 * @file FakeNet.hpp
 * @brief Scripted HttpClient and PortScanner for unit tests.
 */

#include "src/net/inc/HttpClient.hpp"
#include "src/net/inc/PortScanner.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace kindling {
namespace net {
namespace testing {

/// HttpClient whose GET outcome is a fixed flag; records requested URLs.
class FakeHttpClient final : public HttpClient {
public:
  bool healthy{true};       ///< GET result
  bool downloadOk{true};    ///< download result
  std::size_t healthyAfter{0}; ///< Number of failing GETs before healthy applies

  HttpResponse get(const std::string& url, std::chrono::milliseconds /*timeout*/) override {
    urls.push_back(url);
    HttpResponse r;
    if (healthy && urls.size() > healthyAfter) {
      r.transportOk = true;
      r.status = 200;
    } else {
      r.error = "Connection refused";
    }
    return r;
  }

  bool download(const std::string& url, const std::string& destination,
                std::string& error) override {
    downloads.push_back(url + " -> " + destination);
    if (!downloadOk) {
      error = "HTTP 404";
    }
    return downloadOk;
  }

  std::vector<std::string> urls;
  std::vector<std::string> downloads;
};

/// PortScanner reporting every port free except those in `taken`.
class FakePortScanner final : public PortScanner {
public:
  bool isPortAvailable(std::uint16_t port) override {
    ++probes;
    return taken.count(port) == 0;
  }

  std::set<std::uint16_t> taken;
  std::size_t probes{0};
};

} // namespace testing
} // namespace net
} // namespace kindling

#endif // KINDLING_NET_FAKE_NET_HPP
