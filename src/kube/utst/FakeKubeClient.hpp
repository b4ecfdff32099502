#ifndef KINDLING_KUBE_FAKE_KUBE_CLIENT_HPP
#define KINDLING_KUBE_FAKE_KUBE_CLIENT_HPP
/**
 * @file FakeKubeClient.hpp
 * @brief In-memory KubeClient for unit tests.
 */

#include "src/kube/inc/KubeClient.hpp"

#include <functional>
#include <set>
#include <string>
#include <vector>

namespace kindling {
namespace kube {
namespace testing {

class FakeKubeClient final : public KubeClient {
public:
  bool reachable{true};
  bool allowed{true};
  bool canCreateNamespaces{true};
  bool applyOk{true};
  bool ingress{true};
  bool ready{true};
  std::optional<NodeInfo> node{NodeInfo{"amd64", "linux"}};
  std::set<std::string> namespaces{"default", "kube-system", "kube-public"};

  std::vector<std::string> applied;
  std::vector<std::string> created;

  /// Runs before firstNodeInfo() answers.
  std::function<void()> onNodeQuery;

  bool ping() override { return reachable; }

  bool canDeployTo(const naming::ResourceName& /*ns*/) override { return allowed; }

  bool namespaceExists(const naming::ResourceName& ns) override {
    return namespaces.count(ns.str()) != 0;
  }

  common::Status createNamespace(const naming::ResourceName& ns) override {
    if (!canCreateNamespaces) {
      return common::Status::failure(common::ErrorKind::PROVISIONING,
                                     "Failed to create namespace " + ns.str(), "forbidden",
                                     "kubectl create namespace " + ns.str());
    }
    namespaces.insert(ns.str());
    created.push_back(ns.str());
    return common::Status::success();
  }

  bool applyManifest(std::string_view manifest, std::string& error) override {
    if (!applyOk) {
      error = "admission webhook denied the request";
      return false;
    }
    applied.emplace_back(manifest);
    return true;
  }

  bool hasIngressController() override { return ingress; }

  std::optional<NodeInfo> firstNodeInfo() override {
    if (onNodeQuery) {
      onNodeQuery();
    }
    return node;
  }

  bool nodesReady() override { return ready; }
};

} // namespace testing
} // namespace kube
} // namespace kindling

#endif // KINDLING_KUBE_FAKE_KUBE_CLIENT_HPP
