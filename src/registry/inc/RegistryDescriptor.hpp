#ifndef KINDLING_REGISTRY_REGISTRY_DESCRIPTOR_HPP
#define KINDLING_REGISTRY_REGISTRY_DESCRIPTOR_HPP
/**
 * @file RegistryDescriptor.hpp
 * @brief Observed state of the local registry container.
 *
 * Nothing here is persisted; every preparation run rebuilds the descriptor
 * from live Docker and cluster state.
 */

#include <cstdint>
#include <string>

namespace kindling {
namespace registry {

/* ----------------------------- RegistryPhase ----------------------------- */

/**
 * @brief Two-phase bring-up progress.
 *
 * ABSENT -> CREATED (container running, host port published)
 *        -> NETWORK_JOINED (attached to the cluster network)
 *        -> VALIDATED (mirror config, in-cluster HTTP and DNS all confirmed)
 */
enum class RegistryPhase : std::uint8_t {
  ABSENT = 0,
  CREATED,
  NETWORK_JOINED,
  VALIDATED,
};

/// Human-readable name for RegistryPhase.
[[nodiscard]] const char* toString(RegistryPhase phase) noexcept;

/* ----------------------------- RegistryHealth ----------------------------- */

enum class RegistryHealth : std::uint8_t {
  UNKNOWN = 0, ///< Not yet checked
  HEALTHY,     ///< Container running and /v2/ answered 2xx
  UNHEALTHY,   ///< Retry attempts exhausted
};

/// Human-readable name for RegistryHealth.
[[nodiscard]] const char* toString(RegistryHealth health) noexcept;

/* ----------------------------- RegistryDescriptor ----------------------------- */

struct RegistryDescriptor {
  std::uint16_t hostPort{0};                   ///< Host side of the port binding
  RegistryPhase phase{RegistryPhase::ABSENT};
  RegistryHealth health{RegistryHealth::UNKNOWN};
  std::uint32_t healthAttempts{0};             ///< Attempts used by the last health check
  bool reused{false};                          ///< Container existed before this run
  bool restarted{false};                       ///< Container was stopped and has been started
  bool networkConnected{false};                ///< Attached to the cluster network
  std::string networkAddress;                  ///< Address on the cluster network
  bool mirrorConfigured{false};                ///< Node containerd routes to the registry
  bool reachableFromCluster{false};            ///< In-cluster HTTP probe succeeded
  bool dnsResolves{false};                     ///< In-cluster name lookup succeeded
  std::string resolvedAddress;                 ///< Address returned by the lookup

  /// Fixed container name.
  [[nodiscard]] static const char* containerName() noexcept;

  /// "localhost:<hostPort>".
  [[nodiscard]] std::string externalUrl() const;

  /// "<containerName>:5000".
  [[nodiscard]] static std::string internalEndpoint();

  [[nodiscard]] bool healthy() const noexcept { return health == RegistryHealth::HEALTHY; }

  /// Multi-line human-readable summary.
  [[nodiscard]] std::string toString() const;
};

} // namespace registry
} // namespace kindling

#endif // KINDLING_REGISTRY_REGISTRY_DESCRIPTOR_HPP
