#ifndef KINDLING_KUBE_MANIFESTS_HPP
#define KINDLING_KUBE_MANIFESTS_HPP
/**
 * @file Manifests.hpp
 * @brief YAML manifests applied during preparation.
 */

#include "src/naming/inc/ResourceName.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace kindling {
namespace kube {

/// ServiceAccount @p name in namespace @p ns.
[[nodiscard]] std::string serviceAccountManifest(std::string_view name,
                                                 const naming::ResourceName& ns);

/**
 * @brief kube-public/local-registry-hosting ConfigMap.
 *
 * Advertises the host-side registry address to in-cluster tooling, following
 * the KEP-1755 "localRegistryHosting.v1" convention.
 */
[[nodiscard]] std::string registryHostingConfigMap(std::uint16_t hostPort);

} // namespace kube
} // namespace kindling

#endif // KINDLING_KUBE_MANIFESTS_HPP
