/**
 * @file PlatformValidator.cpp
 * @brief Cluster platform detection and strict/lenient validation.
 */

#include "src/platform/inc/PlatformValidator.hpp"

#include <utility>

#include <fmt/core.h>

namespace kindling {

namespace platform {

namespace {

using common::ErrorKind;
using common::Status;

} // namespace

std::string PlatformVerdict::toString() const {
  return fmt::format("target={} cluster={} compatible={} emulation={}",
                     platform::toString(target),
                     cluster ? platform::toString(*cluster) : "unknown",
                     compatible ? "yes" : "no", requiresEmulation ? "yes" : "no");
}

PlatformValidator::PlatformValidator(kube::KubeClient& kube, HostInfo host, common::Logger log)
    : kube_(kube), host_(std::move(host)), log_(std::move(log)) {}

std::optional<Platform> PlatformValidator::detectClusterPlatform() {
  const auto NODE = kube_.firstNodeInfo();
  if (!NODE) {
    return std::nullopt;
  }

  const auto DETECTED = platformFromNode(NODE->os, NODE->architecture);
  if (!DETECTED) {
    log_->warn("Unsupported cluster node platform: os='{}' arch='{}'", NODE->os,
               NODE->architecture);
    return std::nullopt;
  }

  log_->debug("Detected cluster platform {}", toString(*DETECTED));
  return DETECTED;
}

Status PlatformValidator::validate(Platform target, bool strict, PlatformVerdict& verdict,
                                   std::vector<std::string>& warnings) {
  verdict = PlatformVerdict{};
  verdict.target = target;
  verdict.cluster = detectClusterPlatform();

  if (!verdict.cluster) {
    if (strict) {
      return Status::failure(
          ErrorKind::PLATFORM_MISMATCH, "Unable to detect cluster platform for validation",
          "Cluster architecture detection failed",
          "Ensure the cluster is running and kubectl can access node information "
          "(kubectl get nodes -o wide), or disable strict platform validation");
    }
    warnings.push_back(fmt::format(
        "Could not detect cluster platform; skipping validation for target {}",
        toString(target)));
    log_->warn("{}", warnings.back());
    return Status::success();
  }

  verdict.verified = true;
  const Platform CLUSTER = *verdict.cluster;
  const Compatibility COMPAT = checkCompatibility(target, CLUSTER);

  // amd64 node image running under emulation on an arm64 host
  if (!strict && target == Platform::LINUX_AMD64 && CLUSTER == Platform::LINUX_AMD64 &&
      host_.isArm64()) {
    verdict.compatible = true;
    verdict.requiresEmulation = true;
    warnings.push_back(fmt::format(
        "Cluster runs {} under emulation on an arm64 host ({}); expect reduced performance",
        toString(CLUSTER), host_.machine));
    log_->warn("{}", warnings.back());
    return Status::success();
  }

  verdict.compatible = COMPAT.compatible;
  verdict.requiresEmulation = COMPAT.requiresEmulation;

  if (COMPAT.compatible) {
    log_->info("Platform compatible: {} on {}", toString(target), toString(CLUSTER));
    return Status::success();
  }

  if (strict) {
    return Status::failure(
        ErrorKind::PLATFORM_MISMATCH,
        fmt::format("Platform mismatch: building for {} but cluster runs {}", toString(target),
                    toString(CLUSTER)),
        "Images built for the target platform cannot run on the cluster nodes",
        fmt::format("Either: (1) recreate the cluster with {} nodes, or (2) disable strict "
                    "platform validation to continue with emulation",
                    toString(target)));
  }

  warnings.push_back(fmt::format(
      "Platform mismatch: building for {} but cluster runs {}. Images may fail to run or "
      "require emulation.",
      toString(target), toString(CLUSTER)));
  log_->warn("{}", warnings.back());
  return Status::success();
}

} // namespace platform

} // namespace kindling
