#ifndef KINDLING_KUBE_KUBECTL_CLIENT_HPP
#define KINDLING_KUBE_KUBECTL_CLIENT_HPP
/**
 * @file KubectlClient.hpp
 * @brief KubeClient implemented by invoking the kubectl binary.
 *
 * Uses whatever context the current kubeconfig selects. Manifests are handed
 * to kubectl through a scoped temporary file.
 */

#include "src/common/inc/Log.hpp"
#include "src/exec/inc/CommandRunner.hpp"
#include "src/kube/inc/KubeClient.hpp"

#include <chrono>

namespace kindling {
namespace kube {

class KubectlClient final : public KubeClient {
public:
  KubectlClient(exec::CommandRunner& runner, common::Logger log,
                std::chrono::milliseconds timeout = exec::DEFAULT_COMMAND_TIMEOUT);

  [[nodiscard]] bool ping() override;
  [[nodiscard]] bool canDeployTo(const naming::ResourceName& ns) override;
  [[nodiscard]] bool namespaceExists(const naming::ResourceName& ns) override;
  [[nodiscard]] common::Status createNamespace(const naming::ResourceName& ns) override;
  [[nodiscard]] bool applyManifest(std::string_view manifest, std::string& error) override;
  [[nodiscard]] bool hasIngressController() override;
  [[nodiscard]] std::optional<NodeInfo> firstNodeInfo() override;
  [[nodiscard]] bool nodesReady() override;

private:
  exec::CommandRunner& runner_;
  common::Logger log_;
  std::chrono::milliseconds timeout_;
};

} // namespace kube
} // namespace kindling

#endif // KINDLING_KUBE_KUBECTL_CLIENT_HPP
