#ifndef KINDLING_CLUSTER_KIND_CONFIG_HPP
#define KINDLING_CLUSTER_KIND_CONFIG_HPP
/**
 * @file KindConfig.hpp
 * @brief kind cluster configuration rendering.
 *
 * The generated config embeds the containerd mirror patch for the local
 * registry so nodes can pull from it without any post-creation edits.
 */

#include "src/platform/inc/HostInfo.hpp"
#include "src/platform/inc/Platform.hpp"

#include <cstdint>
#include <string>

namespace kindling {
namespace cluster {

/**
 * @brief Inputs that vary between kind configs.
 */
struct KindConfig {
  std::uint16_t registryPort{0}; ///< Registry host port used in the mirror stanza
  std::string nodeImage;         ///< Explicit node image; empty selects kind's default
};

/**
 * @brief Render a single control-plane kind config as YAML.
 *
 * The node is labelled ingress-ready=true and maps host ports 80 and 443.
 */
[[nodiscard]] std::string renderKindConfig(const KindConfig& config);

/**
 * @brief True when the amd64 node image should be pinned.
 *
 * Only in lenient mode, on an arm64 host, for a linux/amd64 target.
 */
[[nodiscard]] bool shouldPinAmd64Node(bool strict, const platform::HostInfo& host,
                                      platform::Platform target) noexcept;

} // namespace cluster
} // namespace kindling

#endif // KINDLING_CLUSTER_KIND_CONFIG_HPP
