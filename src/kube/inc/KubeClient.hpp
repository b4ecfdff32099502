#ifndef KINDLING_KUBE_KUBE_CLIENT_HPP
#define KINDLING_KUBE_KUBE_CLIENT_HPP
/**
 * @file KubeClient.hpp
 * @brief Cluster API operations used by readiness and platform checks.
 */

#include "src/common/inc/Status.hpp"
#include "src/naming/inc/ResourceName.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace kindling {
namespace kube {

/**
 * @brief OS and architecture reported by a node.
 */
struct NodeInfo {
  std::string architecture; ///< status.nodeInfo.architecture
  std::string os;           ///< status.nodeInfo.operatingSystem, empty if unavailable
};

/**
 * @brief Cluster API client.
 *
 * Methods block until the API answers or the client's own timeout expires.
 * None of them throws.
 */
class KubeClient {
public:
  virtual ~KubeClient() = default;

  /// True when the API server answers.
  [[nodiscard]] virtual bool ping() = 0;

  /// True when the caller may create deployments in @p ns.
  [[nodiscard]] virtual bool canDeployTo(const naming::ResourceName& ns) = 0;

  [[nodiscard]] virtual bool namespaceExists(const naming::ResourceName& ns) = 0;

  /// Create @p ns; an already existing namespace counts as success.
  [[nodiscard]] virtual common::Status createNamespace(const naming::ResourceName& ns) = 0;

  /**
   * @brief Create or update the objects described by a YAML manifest.
   * @param error Set to the API error on failure.
   */
  [[nodiscard]] virtual bool applyManifest(std::string_view manifest, std::string& error) = 0;

  /// True when at least one IngressClass is installed.
  [[nodiscard]] virtual bool hasIngressController() = 0;

  /// OS and architecture of the first node, or nullopt when unavailable.
  [[nodiscard]] virtual std::optional<NodeInfo> firstNodeInfo() = 0;

  /// True when at least one node reports Ready.
  [[nodiscard]] virtual bool nodesReady() = 0;
};

} // namespace kube
} // namespace kindling

#endif // KINDLING_KUBE_KUBE_CLIENT_HPP
