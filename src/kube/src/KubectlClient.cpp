/**
 * @file KubectlClient.cpp
 * @brief kubectl invocations behind KubeClient.
 */

#include "src/kube/inc/KubectlClient.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <utility>

#include <fmt/core.h>

namespace kindling {

namespace kube {

namespace {

using common::ErrorKind;
using common::Status;
using exec::CmdResult;
using exec::CommandLine;
using helpers::strings::contains;
using helpers::strings::splitLines;
using helpers::strings::trim;

} // namespace

KubectlClient::KubectlClient(exec::CommandRunner& runner, common::Logger log,
                             std::chrono::milliseconds timeout)
    : runner_(runner), log_(std::move(log)), timeout_(timeout) {}

bool KubectlClient::ping() {
  CommandLine cmd("kubectl");
  cmd.arg("cluster-info").arg("--request-timeout=10s");
  const CmdResult R = runner_.run(cmd, timeout_);
  if (!R.ok()) {
    log_->debug("kubectl cluster-info failed: {}", trim(R.err));
  }
  return R.ok();
}

bool KubectlClient::canDeployTo(const naming::ResourceName& ns) {
  CommandLine cmd("kubectl");
  cmd.arg("auth").arg("can-i").arg("create").arg("deployments").arg("--namespace").arg(ns);
  const CmdResult R = runner_.run(cmd, timeout_);
  return R.ok() && trim(R.out) == "yes";
}

bool KubectlClient::namespaceExists(const naming::ResourceName& ns) {
  CommandLine cmd("kubectl");
  cmd.arg("get").arg("namespace").arg(ns).arg("-o").arg("name");
  return runner_.run(cmd, timeout_).ok();
}

Status KubectlClient::createNamespace(const naming::ResourceName& ns) {
  CommandLine cmd("kubectl");
  cmd.arg("create").arg("namespace").arg(ns);
  const CmdResult R = runner_.run(cmd, timeout_);
  if (R.ok() || contains(R.err, "AlreadyExists")) {
    return Status::success();
  }
  return Status::failure(ErrorKind::PROVISIONING,
                         fmt::format("Failed to create namespace {}", ns),
                         std::string(trim(R.err)),
                         fmt::format("kubectl create namespace {}", ns));
}

bool KubectlClient::applyManifest(std::string_view manifest, std::string& error) {
  helpers::files::TempFile file =
      helpers::files::TempFile::create("kindling-manifest-", ".yaml", manifest, error);
  if (!file.valid()) {
    return false;
  }

  CommandLine cmd("kubectl");
  cmd.arg("apply").arg("-f").arg(file);
  const CmdResult R = runner_.run(cmd, timeout_);
  if (!R.ok()) {
    error = std::string(trim(R.err));
    return false;
  }
  log_->debug("kubectl apply: {}", trim(R.out));
  return true;
}

bool KubectlClient::hasIngressController() {
  CommandLine cmd("kubectl");
  cmd.arg("get").arg("ingressclasses").arg("-o").arg("name");
  const CmdResult R = runner_.run(cmd, timeout_);
  return R.ok() && !splitLines(R.out).empty();
}

std::optional<NodeInfo> KubectlClient::firstNodeInfo() {
  CommandLine archCmd("kubectl");
  archCmd.arg("get").arg("nodes").arg("-o").arg(
      "jsonpath={.items[0].status.nodeInfo.architecture}");
  const CmdResult ARCH = runner_.run(archCmd, timeout_);
  if (!ARCH.ok() || trim(ARCH.out).empty()) {
    log_->debug("node architecture query failed: {}", trim(ARCH.err));
    return std::nullopt;
  }

  NodeInfo info;
  info.architecture = std::string(trim(ARCH.out));

  CommandLine osCmd("kubectl");
  osCmd.arg("get").arg("nodes").arg("-o").arg(
      "jsonpath={.items[0].status.nodeInfo.operatingSystem}");
  const CmdResult OS = runner_.run(osCmd, timeout_);
  if (OS.ok()) {
    info.os = std::string(trim(OS.out));
  }
  return info;
}

bool KubectlClient::nodesReady() {
  CommandLine cmd("kubectl");
  cmd.arg("get").arg("nodes").arg("--no-headers");
  const CmdResult R = runner_.run(cmd, timeout_);
  if (!R.ok()) {
    return false;
  }
  for (const std::string& line : splitLines(R.out)) {
    const auto FIELDS = helpers::strings::splitWhitespace(line);
    if (FIELDS.size() >= 2 && FIELDS[1] == "Ready") {
      return true;
    }
  }
  return false;
}

} // namespace kube

} // namespace kindling
