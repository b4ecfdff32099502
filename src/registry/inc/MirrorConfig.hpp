#ifndef KINDLING_REGISTRY_MIRROR_CONFIG_HPP
#define KINDLING_REGISTRY_MIRROR_CONFIG_HPP
/**
 * @file MirrorConfig.hpp
 * @brief containerd registry mirror stanzas and their verification.
 *
 * The cluster is created with two mirror entries, both resolving to the
 * registry's in-network endpoint:
 *
 *   [plugins."io.containerd.grpc.v1.cri".registry.mirrors."localhost:<port>"]
 *     endpoint = ["http://kindling-registry:5000"]
 *   [plugins."io.containerd.grpc.v1.cri".registry.mirrors."kindling-registry:5000"]
 *     endpoint = ["http://kindling-registry:5000"]
 *
 * so images tagged for either the host-side or the internal address pull
 * through the registry container.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace kindling {
namespace registry {

/// Table header line for a mirror host, e.g. "localhost:6000".
[[nodiscard]] std::string mirrorStanza(std::string_view mirrorHost);

/// endpoint line pointing at the registry's internal endpoint.
[[nodiscard]] std::string mirrorEndpointLine();

/// Both mirror tables for @p hostPort, ready to embed as a containerd patch.
[[nodiscard]] std::string containerdMirrorPatch(std::uint16_t hostPort);

/**
 * @brief Result of scanning a containerd config.toml.
 */
struct MirrorCheck {
  bool stanzaFound{false};   ///< Table for localhost:<port> present
  bool endpointFound{false}; ///< That table names the internal endpoint

  [[nodiscard]] bool ok() const noexcept { return stanzaFound && endpointFound; }
};

/**
 * @brief Check that @p configToml routes localhost:<hostPort> to the registry.
 *
 * The endpoint line must appear inside the localhost:<hostPort> table.
 * Whitespace around '=' and inside the brackets is ignored.
 */
[[nodiscard]] MirrorCheck inspectMirrorConfig(std::string_view configToml,
                                              std::uint16_t hostPort);

/// Lines of @p configToml mentioning registry mirrors, for diagnostics.
[[nodiscard]] std::string mirrorSnippet(std::string_view configToml);

} // namespace registry
} // namespace kindling

#endif // KINDLING_REGISTRY_MIRROR_CONFIG_HPP
