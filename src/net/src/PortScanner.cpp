/**
 * @file PortScanner.cpp
 * @brief bind()-based port availability probe.
 */

#include "src/net/inc/PortScanner.hpp"

#include <arpa/inet.h>  // htons, htonl
#include <netinet/in.h> // sockaddr_in, INADDR_ANY
#include <sys/socket.h> // socket, bind, setsockopt
#include <unistd.h>     // close

namespace kindling {

namespace net {

bool BindPortScanner::isPortAvailable(std::uint16_t port) {
  const int SOCK = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (SOCK < 0) {
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);

  const bool FREE = ::bind(SOCK, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
  ::close(SOCK);
  return FREE;
}

std::optional<std::uint16_t> findAvailablePort(PortScanner& scanner, std::uint16_t first,
                                               std::uint16_t last) {
  for (std::uint32_t port = first; port <= last; ++port) {
    if (scanner.isPortAvailable(static_cast<std::uint16_t>(port))) {
      return static_cast<std::uint16_t>(port);
    }
  }
  return std::nullopt;
}

} // namespace net

} // namespace kindling
