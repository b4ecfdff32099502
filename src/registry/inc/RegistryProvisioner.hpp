#ifndef KINDLING_REGISTRY_REGISTRY_PROVISIONER_HPP
#define KINDLING_REGISTRY_REGISTRY_PROVISIONER_HPP
/**
 * @file RegistryProvisioner.hpp
 * @brief Local registry lifecycle: port, container, health, cluster wiring.
 *
 * Bring-up is split around cluster creation:
 *
 *  Phase 1 (before the cluster exists):
 *    resolvePort()      reuse the existing container's port or pick a free one
 *    ensureContainer()  create, start or reuse the container; health check
 *
 *  Phase 2 (after the cluster network exists):
 *    joinClusterNetwork()     attach the container to the kind network
 *    publishHostingConfig()   advertise the registry inside the cluster
 *    validateClusterAccess()  containerd mirror, in-cluster HTTP and DNS
 *
 * Only Phase 1 can fail. Phase 2 problems become warnings.
 */

#include "src/common/inc/Log.hpp"
#include "src/common/inc/Status.hpp"
#include "src/docker/inc/DockerCli.hpp"
#include "src/exec/inc/CommandRunner.hpp"
#include "src/exec/inc/Sleeper.hpp"
#include "src/helpers/inc/Backoff.hpp"
#include "src/kube/inc/KubeClient.hpp"
#include "src/naming/inc/ResourceName.hpp"
#include "src/net/inc/HttpClient.hpp"
#include "src/net/inc/PortScanner.hpp"
#include "src/registry/inc/ProbePod.hpp"
#include "src/registry/inc/RegistryDescriptor.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace kindling {
namespace registry {

/* ----------------------------- Options ----------------------------- */

/**
 * @brief Tunables for registry provisioning.
 */
struct RegistryOptions {
  std::uint16_t portStart{6000}; ///< First candidate host port
  std::uint16_t portEnd{6100};   ///< Last candidate host port (inclusive)

  /// Container health retry schedule.
  helpers::backoff::BackoffPolicy health{};

  /// In-cluster HTTP probe retry schedule.
  helpers::backoff::BackoffPolicy reachability{
      helpers::backoff::BackoffPolicy::fixed(3, std::chrono::milliseconds(3000))};

  std::chrono::milliseconds httpTimeout{3000};        ///< Per GET of /v2/
  std::chrono::milliseconds commandTimeout{30'000};   ///< Per docker invocation
  std::chrono::milliseconds probePodTimeout{90'000};  ///< Per kubectl run
  unsigned logTailLines{20};                          ///< Lines dumped on health failure
};

/* ----------------------------- HealthResult ----------------------------- */

struct HealthResult {
  bool healthy{false};
  std::uint32_t attempts{0};
};

/* ----------------------------- RegistryProvisioner ----------------------------- */

class RegistryProvisioner {
public:
  RegistryProvisioner(exec::CommandRunner& runner, net::HttpClient& http, exec::Sleeper& sleeper,
                      net::PortScanner& ports, common::Logger log, RegistryOptions options = {});

  /**
   * @brief Choose the registry host port.
   *
   * An existing container (running or stopped) keeps its bound port.
   * Otherwise the first free port in [portStart, portEnd] is taken.
   *
   * @return PROVISIONING failure when no port is free.
   */
  [[nodiscard]] common::Status resolvePort(RegistryDescriptor& reg);

  /**
   * @brief Phase 1: make sure the registry container is running.
   *
   * Running containers are reused, stopped ones started, absent ones created
   * on reg.hostPort (resolved first when zero). Health is checked afterwards
   * but an unhealthy registry only adds a warning.
   *
   * @return PROVISIONING failure when the container cannot be created or started.
   */
  [[nodiscard]] common::Status ensureContainer(RegistryDescriptor& reg,
                                               std::vector<std::string>& warnings);

  /**
   * @brief Poll container status and GET /v2/ with capped exponential backoff.
   *
   * Performs at most options.health.maxAttempts attempts. On exhaustion the
   * container's recent log lines are written to the debug log.
   */
  [[nodiscard]] HealthResult validateHealth(std::uint16_t hostPort);

  /// Phase 2: attach to the cluster network and record the address.
  void joinClusterNetwork(RegistryDescriptor& reg, std::vector<std::string>& warnings);

  /// Apply kube-public/local-registry-hosting. Failures are logged only.
  void publishHostingConfig(kube::KubeClient& kube, const RegistryDescriptor& reg);

  /**
   * @brief Phase 2: confirm the cluster can actually use the registry.
   *
   * Runs the containerd mirror check, the in-cluster HTTP probe (retried) and
   * the in-cluster DNS probe. Each failure appends a warning. The phase
   * becomes VALIDATED only when all three pass on a joined registry.
   */
  void validateClusterAccess(RegistryDescriptor& reg, const naming::ResourceName& cluster,
                             std::vector<std::string>& warnings);

  /// True when node containerd routes localhost:<hostPort> to the registry.
  [[nodiscard]] bool validateMirrorConfig(const naming::ResourceName& cluster,
                                          std::uint16_t hostPort);

  /// In-cluster HTTP probe with retries.
  [[nodiscard]] bool probeReachability();

  /// In-cluster DNS probe; fills @p address on success.
  [[nodiscard]] bool probeDns(std::string& address);

private:
  void recordHealth(RegistryDescriptor& reg, std::vector<std::string>& warnings);

  exec::CommandRunner& runner_;
  net::HttpClient& http_;
  exec::Sleeper& sleeper_;
  net::PortScanner& ports_;
  common::Logger log_;
  RegistryOptions options_;
  docker::DockerCli docker_;
  std::uint32_t probeSequence_{0};
};

} // namespace registry
} // namespace kindling

#endif // KINDLING_REGISTRY_REGISTRY_PROVISIONER_HPP
