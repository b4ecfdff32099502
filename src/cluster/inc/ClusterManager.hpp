#ifndef KINDLING_CLUSTER_CLUSTER_MANAGER_HPP
#define KINDLING_CLUSTER_CLUSTER_MANAGER_HPP
/**
 * @file ClusterManager.hpp
 * @brief kind binary installation and cluster lifecycle.
 *
 * ensure() converges on a running cluster with the registry mirror baked in:
 *   1. kind installed? otherwise download the release binary
 *   2. cluster listed? otherwise create it from a generated config,
 *      then wait for nodes and the docker network
 *   3. export kubeconfig
 *   4. cluster already existed and strict: re-check its platform
 */

#include "src/common/inc/Defaults.hpp"
#include "src/common/inc/Log.hpp"
#include "src/common/inc/Status.hpp"
#include "src/docker/inc/DockerCli.hpp"
#include "src/exec/inc/CommandRunner.hpp"
#include "src/exec/inc/Sleeper.hpp"
#include "src/kube/inc/KubeClient.hpp"
#include "src/naming/inc/ResourceName.hpp"
#include "src/net/inc/HttpClient.hpp"
#include "src/platform/inc/HostInfo.hpp"
#include "src/platform/inc/Platform.hpp"
#include "src/readiness/inc/ReadinessChecks.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace kindling {
namespace cluster {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Cluster identity and validation mode.
 */
struct ClusterDescriptor {
  naming::ResourceName name; ///< kind cluster name
  bool strictMode{true};     ///< Platform drift is fatal
};

/**
 * @brief Tunables for cluster provisioning.
 */
struct ClusterOptions {
  std::string kindVersion{common::KIND_VERSION};          ///< Release downloaded when missing
  std::chrono::milliseconds stabilization{5000};          ///< Pause after creation
  std::chrono::milliseconds commandTimeout{30'000};       ///< Per kind/docker invocation
  std::chrono::milliseconds createTimeout{300'000};       ///< kind create cluster
  std::uint32_t networkWaitAttempts{10};                  ///< Polls for the kind network
  std::chrono::milliseconds networkWaitDelay{1000};       ///< Between polls
  std::vector<std::string> installDirs{"/usr/local/bin"}; ///< Tried before ~/.local/bin
};

/* ----------------------------- ClusterManager ----------------------------- */

class ClusterManager {
public:
  ClusterManager(exec::CommandRunner& runner, net::HttpClient& http, exec::Sleeper& sleeper,
                 kube::KubeClient& kube, platform::HostInfo host, common::Logger log,
                 ClusterOptions options = {});

  /**
   * @brief Converge on a running, reachable cluster.
   * @param registryPort Host port of the registry, written into the mirror config.
   * @param target       Platform images will be built for.
   * @param checks       toolInstalled and clusterCreated are recorded here.
   * @return PROVISIONING when kind is unavailable or creation fails;
   *         PLATFORM_MISMATCH for strict drift on an existing cluster.
   */
  [[nodiscard]] common::Status ensure(const ClusterDescriptor& cluster, std::uint16_t registryPort,
                                      platform::Platform target, readiness::ReadinessChecks& checks,
                                      std::vector<std::string>& warnings);

  /// True when `kind version` runs.
  [[nodiscard]] bool toolInstalled();

  /**
   * @brief Download the kind release for this host and place it on PATH.
   * @return true when the binary was placed. Failures are appended to @p warnings.
   */
  bool installTool(std::vector<std::string>& warnings);

  /// Names printed by `kind get clusters`; empty on error.
  [[nodiscard]] std::vector<std::string> listClusters();

  /// Create @p cluster with the registry mirror for @p registryPort.
  [[nodiscard]] common::Status createCluster(const ClusterDescriptor& cluster,
                                             std::uint16_t registryPort,
                                             platform::Platform target);

  /// Strict check of an existing cluster's node platform against @p target.
  [[nodiscard]] common::Status checkExistingPlatform(const ClusterDescriptor& cluster,
                                                     platform::Platform target);

  /// Point the current kubeconfig context at @p cluster. Failure is a warning.
  void exportKubeconfig(const ClusterDescriptor& cluster, std::vector<std::string>& warnings);

private:
  void waitForCluster();

  exec::CommandRunner& runner_;
  net::HttpClient& http_;
  exec::Sleeper& sleeper_;
  kube::KubeClient& kube_;
  platform::HostInfo host_;
  common::Logger log_;
  ClusterOptions options_;
  docker::DockerCli docker_;
};

} // namespace cluster
} // namespace kindling

#endif // KINDLING_CLUSTER_CLUSTER_MANAGER_HPP
