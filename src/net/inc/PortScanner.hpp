#ifndef KINDLING_NET_PORT_SCANNER_HPP
#define KINDLING_NET_PORT_SCANNER_HPP
/**
 * @file PortScanner.hpp
 * @brief Free TCP port discovery on the host.
 */

#include <cstdint>
#include <optional>

namespace kindling {
namespace net {

/**
 * @brief Answers whether a host TCP port can be bound.
 */
class PortScanner {
public:
  virtual ~PortScanner() = default;
  [[nodiscard]] virtual bool isPortAvailable(std::uint16_t port) = 0;
};

/**
 * @brief PortScanner that attempts bind() on 0.0.0.0:port.
 *
 * The probe socket is closed immediately, so a port reported free can still
 * be taken by another process before the registry binds it.
 */
class BindPortScanner final : public PortScanner {
public:
  [[nodiscard]] bool isPortAvailable(std::uint16_t port) override;
};

/**
 * @brief First available port in the inclusive range [first, last].
 * @return Port, or nullopt when every port in the range is taken.
 */
[[nodiscard]] std::optional<std::uint16_t> findAvailablePort(PortScanner& scanner,
                                                             std::uint16_t first,
                                                             std::uint16_t last);

} // namespace net
} // namespace kindling

#endif // KINDLING_NET_PORT_SCANNER_HPP
