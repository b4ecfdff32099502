/**
 * @file ReadinessChecker.cpp
 * @brief Readiness sequence over a KubeClient.
 */

#include "src/readiness/inc/ReadinessChecker.hpp"
#include "src/common/inc/Defaults.hpp"
#include "src/kube/inc/Manifests.hpp"

#include <utility>

#include <fmt/core.h>

namespace kindling {

namespace readiness {

using common::ErrorKind;
using common::Status;

ReadinessChecker::ReadinessChecker(kube::KubeClient& kube, common::Logger log)
    : kube_(kube), log_(std::move(log)) {}

Status ReadinessChecker::verify(const naming::ResourceName& ns, const ReadinessPolicy& policy,
                                ReadinessChecks& checks, bool& namespaceCreated,
                                std::vector<std::string>& warnings) {
  namespaceCreated = false;

  checks.connectivity = kube_.ping();
  if (!checks.connectivity) {
    log_->error("Cannot connect to Kubernetes cluster");
    return Status::failure(ErrorKind::CONNECTIVITY, "Cannot connect to Kubernetes cluster",
                           "No cluster is reachable through the current kubeconfig context",
                           "Ensure a cluster is running and accessible (kubectl cluster-info)");
  }

  checks.permissions = kube_.canDeployTo(ns);
  if (!checks.permissions) {
    log_->error("Insufficient permissions in namespace {}", ns);
    return Status::failure(
        ErrorKind::PERMISSION, fmt::format("Insufficient permissions in namespace {}", ns),
        "The current user or service account cannot create deployments",
        fmt::format("Check RBAC with: kubectl auth can-i create deployments --namespace {}", ns));
  }

  checks.namespaceExists = kube_.namespaceExists(ns);
  if (!checks.namespaceExists) {
    if (policy.createNamespace) {
      const Status CREATED = kube_.createNamespace(ns);
      if (!CREATED.ok()) {
        log_->error("Failed to create namespace {}: {}", ns, CREATED.guidance.hint);
        return CREATED;
      }
      checks.namespaceExists = true;
      namespaceCreated = true;
      log_->info("Created namespace {}", ns);
    } else {
      warnings.push_back(fmt::format("Namespace {} does not exist - deployment may fail", ns));
      log_->warn("{}", warnings.back());
    }
  }

  if (policy.setupRbac) {
    std::string error;
    checks.rbacConfigured =
        kube_.applyManifest(kube::serviceAccountManifest(common::SERVICE_ACCOUNT_NAME, ns), error);
    if (*checks.rbacConfigured) {
      log_->info("ServiceAccount {} configured in {}", common::SERVICE_ACCOUNT_NAME, ns);
    } else {
      warnings.push_back(fmt::format("RBAC setup failed in namespace {}: {}", ns, error));
      log_->warn("{}", warnings.back());
    }
  }

  if (policy.checkIngress) {
    checks.ingressController = kube_.hasIngressController();
    if (!*checks.ingressController) {
      warnings.push_back("No ingress controller found - external access may not work");
      log_->warn("{}", warnings.back());
    }
  }

  return Status::success();
}

} // namespace readiness

} // namespace kindling
