/**
 * @file ClusterManager.cpp
 * @brief kind install, create, drift check and kubeconfig export.
 */

#include "src/cluster/inc/ClusterManager.hpp"
#include "src/cluster/inc/KindConfig.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/platform/inc/PlatformValidator.hpp"

#include <sys/stat.h> // chmod

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace kindling {

namespace cluster {

namespace {

namespace fs = std::filesystem;

using common::ErrorKind;
using common::Status;
using exec::CmdResult;
using exec::CommandLine;
using helpers::files::TempFile;
using helpers::strings::splitLines;
using helpers::strings::tailLines;
using helpers::strings::trim;
using platform::Platform;

constexpr auto EXECUTABLE_PERMS = fs::perms::owner_all | fs::perms::group_read |
                                  fs::perms::group_exec | fs::perms::others_read |
                                  fs::perms::others_exec;

} // namespace

ClusterManager::ClusterManager(exec::CommandRunner& runner, net::HttpClient& http,
                               exec::Sleeper& sleeper, kube::KubeClient& kube,
                               platform::HostInfo host, common::Logger log, ClusterOptions options)
    : runner_(runner), http_(http), sleeper_(sleeper), kube_(kube), host_(std::move(host)),
      log_(std::move(log)), options_(std::move(options)),
      docker_(runner, log_, options_.commandTimeout) {}

/* ----------------------------- ensure ----------------------------- */

Status ClusterManager::ensure(const ClusterDescriptor& cluster, std::uint16_t registryPort,
                              Platform target, readiness::ReadinessChecks& checks,
                              std::vector<std::string>& warnings) {
  checks.toolInstalled = toolInstalled();
  if (!*checks.toolInstalled) {
    log_->info("kind not found, installing {}", options_.kindVersion);
    installTool(warnings);
    checks.toolInstalled = toolInstalled();
    if (!*checks.toolInstalled) {
      return Status::failure(
          ErrorKind::PROVISIONING, "kind is not installed and automatic installation failed",
          "The kind binary could not be downloaded or is not on PATH",
          "Install kind manually (https://kind.sigs.k8s.io/docs/user/quick-start/#installation) "
          "and make sure 'kind version' works");
    }
  }

  const std::vector<std::string> CLUSTERS = listClusters();
  const bool EXISTS =
      std::find(CLUSTERS.begin(), CLUSTERS.end(), cluster.name.str()) != CLUSTERS.end();

  if (!EXISTS) {
    const Status CREATED = createCluster(cluster, registryPort, target);
    if (!CREATED.ok()) {
      return CREATED;
    }
    waitForCluster();
    checks.clusterCreated = true;
    exportKubeconfig(cluster, warnings);
    return Status::success();
  }

  // Node queries use the current context; export first so they reach this cluster.
  log_->info("kind cluster {} already exists", cluster.name);
  exportKubeconfig(cluster, warnings);
  const Status PLATFORM_STATUS = checkExistingPlatform(cluster, target);
  if (!PLATFORM_STATUS.ok()) {
    return PLATFORM_STATUS;
  }
  checks.clusterCreated = true;
  return Status::success();
}

/* ----------------------------- Tool ----------------------------- */

bool ClusterManager::toolInstalled() {
  CommandLine cmd("kind");
  cmd.arg("version");
  const CmdResult R = runner_.run(cmd, options_.commandTimeout);
  if (R.ok()) {
    log_->debug("{}", trim(R.out));
  }
  return R.ok();
}

bool ClusterManager::installTool(std::vector<std::string>& warnings) {
  const std::string URL =
      fmt::format("https://kind.sigs.k8s.io/dl/{}/kind-{}-{}", options_.kindVersion,
                  host_.downloadOs(), host_.downloadArch());

  std::string error;
  const TempFile DOWNLOAD = TempFile::create("kindling-kind-", "", "", error);
  if (!DOWNLOAD.valid()) {
    warnings.push_back(fmt::format("Failed to install kind: {}", error));
    return false;
  }

  log_->debug("Downloading {}", URL);
  if (!http_.download(URL, DOWNLOAD.path(), error)) {
    warnings.push_back(fmt::format("Failed to download kind from {}: {}", URL, error));
    log_->warn("{}", warnings.back());
    return false;
  }
  if (::chmod(DOWNLOAD.path().c_str(), 0755) != 0) {
    warnings.push_back(fmt::format("Failed to make kind executable: {}", std::strerror(errno)));
    return false;
  }

  std::vector<std::string> dirs = options_.installDirs;
  const std::string HOME = helpers::files::homeDirectory();
  if (!HOME.empty()) {
    dirs.push_back(HOME + "/.local/bin");
  }

  for (const std::string& dir : dirs) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    const fs::path DEST = fs::path(dir) / "kind";
    fs::copy_file(DOWNLOAD.path(), DEST, fs::copy_options::overwrite_existing, ec);
    if (!ec) {
      fs::permissions(DEST, EXECUTABLE_PERMS, fs::perm_options::replace, ec);
    }
    if (ec) {
      log_->debug("Cannot install kind to {}: {}", DEST.string(), ec.message());
      continue;
    }
    log_->info("Installed kind {} to {}", options_.kindVersion, DEST.string());
    return true;
  }

  warnings.push_back("Failed to move kind executable to PATH - it may need manual installation");
  log_->warn("{}", warnings.back());
  return false;
}

/* ----------------------------- Cluster ----------------------------- */

std::vector<std::string> ClusterManager::listClusters() {
  CommandLine cmd("kind");
  cmd.arg("get").arg("clusters");
  const CmdResult R = runner_.run(cmd, options_.commandTimeout);
  if (!R.ok()) {
    log_->debug("kind get clusters failed: {}", trim(R.err));
    return {};
  }
  // "No kind clusters found." goes to stderr, stdout holds names only
  return splitLines(R.out);
}

Status ClusterManager::createCluster(const ClusterDescriptor& cluster, std::uint16_t registryPort,
                                     Platform target) {
  KindConfig config;
  config.registryPort = registryPort;
  if (shouldPinAmd64Node(cluster.strictMode, host_, target)) {
    config.nodeImage = common::KIND_AMD64_NODE_IMAGE;
    log_->info("arm64 host with amd64 target: using amd64 node image under emulation");
  } else if (cluster.strictMode) {
    log_->info("Strict mode: creating cluster with native node image");
  }

  std::string error;
  const TempFile CONFIG_FILE =
      TempFile::create("kindling-kind-config-", ".yaml", renderKindConfig(config), error);
  if (!CONFIG_FILE.valid()) {
    return Status::failure(ErrorKind::PROVISIONING, "Failed to write kind configuration", error,
                           "Check that $TMPDIR (or /tmp) is writable");
  }

  CommandLine cmd("kind");
  cmd.arg("create")
      .arg("cluster")
      .arg("--name")
      .arg(cluster.name)
      .arg("--config")
      .arg(CONFIG_FILE);

  log_->info("Creating kind cluster {} (registry mirror localhost:{})", cluster.name,
             registryPort);
  const CmdResult R = runner_.run(cmd, options_.createTimeout);
  if (!R.ok()) {
    log_->error("kind create cluster failed:\n{}", R.err);
    return Status::failure(
        ErrorKind::PROVISIONING, fmt::format("Kind cluster creation failed for {}", cluster.name),
        R.timedOut ? std::string("kind create cluster did not finish before the timeout")
                   : std::string(trim(tailLines(R.err, 5))),
        fmt::format("Check Docker has enough resources, clean up with 'kind delete cluster "
                    "--name {}' and retry",
                    cluster.name));
  }
  log_->info("kind cluster {} created", cluster.name);
  return Status::success();
}

void ClusterManager::waitForCluster() {
  log_->debug("Waiting {} ms for cluster to stabilize", options_.stabilization.count());
  sleeper_.sleepFor(options_.stabilization);

  if (!kube_.nodesReady()) {
    log_->warn("Cluster nodes may not be fully ready yet");
  }

  for (std::uint32_t attempt = 1; attempt <= options_.networkWaitAttempts; ++attempt) {
    if (docker_.clusterNetworkExists()) {
      log_->info("Docker network {} is available", common::CLUSTER_NETWORK);
      return;
    }
    if (attempt < options_.networkWaitAttempts) {
      sleeper_.sleepFor(options_.networkWaitDelay);
    }
  }
  log_->warn("Docker network {} not found - registry connectivity may be impaired",
             common::CLUSTER_NETWORK);
}

Status ClusterManager::checkExistingPlatform(const ClusterDescriptor& cluster, Platform target) {
  if (!cluster.strictMode) {
    return Status::success();
  }

  platform::PlatformValidator validator(kube_, host_, log_);
  const auto DETECTED = validator.detectClusterPlatform();
  if (!DETECTED) {
    return Status::failure(
        ErrorKind::PLATFORM_MISMATCH,
        fmt::format("Could not detect platform of existing cluster {}", cluster.name),
        "Cluster architecture detection failed",
        fmt::format("Ensure cluster '{}' is running and kubectl can access node information",
                    cluster.name));
  }

  if (!platform::checkCompatibility(target, *DETECTED).compatible) {
    return Status::failure(
        ErrorKind::PLATFORM_MISMATCH,
        fmt::format("Existing cluster {} is {} but target platform is {}", cluster.name,
                    platform::toString(*DETECTED), platform::toString(target)),
        "The cluster was created for a different architecture",
        fmt::format("To deploy {} images either:\n  (1) delete the cluster: kind delete cluster "
                    "--name {}\n  (2) disable strict platform validation to allow emulation",
                    platform::toString(target), cluster.name));
  }

  log_->info("Existing cluster {} platform {} matches target", cluster.name,
             platform::toString(*DETECTED));
  return Status::success();
}

void ClusterManager::exportKubeconfig(const ClusterDescriptor& cluster,
                                      std::vector<std::string>& warnings) {
  CommandLine cmd("kind");
  cmd.arg("export").arg("kubeconfig").arg("--name").arg(cluster.name);
  const CmdResult R = runner_.run(cmd, options_.commandTimeout);
  if (!R.ok()) {
    warnings.push_back(fmt::format("Failed to export kubeconfig for cluster {}: {}", cluster.name,
                                   trim(R.err)));
    log_->warn("{}", warnings.back());
  }
}

} // namespace cluster

} // namespace kindling
