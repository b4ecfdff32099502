#ifndef KINDLING_PREPARE_ORCHESTRATOR_HPP
#define KINDLING_PREPARE_ORCHESTRATOR_HPP
/**
 * @file Orchestrator.hpp
 * @brief Single entry point that prepares a cluster for deployment.
 *
 * Order of operations:
 *   1. validate namespace and cluster names
 *   2. development only: registry port, registry Phase 1, kind cluster,
 *      registry Phase 2
 *   3. readiness checks with the environment policy
 *   4. platform validation
 *
 * Fatal failures stop the sequence. The report collected so far is returned
 * with the failure.
 */

#include "src/cluster/inc/ClusterManager.hpp"
#include "src/common/inc/Defaults.hpp"
#include "src/common/inc/Log.hpp"
#include "src/common/inc/Status.hpp"
#include "src/exec/inc/CommandRunner.hpp"
#include "src/exec/inc/Sleeper.hpp"
#include "src/kube/inc/KubeClient.hpp"
#include "src/net/inc/HttpClient.hpp"
#include "src/net/inc/PortScanner.hpp"
#include "src/platform/inc/HostInfo.hpp"
#include "src/platform/inc/Platform.hpp"
#include "src/prepare/inc/Environment.hpp"
#include "src/prepare/inc/PreparationReport.hpp"
#include "src/prepare/inc/PrepareConfig.hpp"

#include <string>

namespace kindling {
namespace prepare {

/* ----------------------------- Request ----------------------------- */

struct PrepareRequest {
  Environment environment{Environment::DEVELOPMENT};
  std::string ns{common::DEFAULT_NAMESPACE};                  ///< Unvalidated caller input
  platform::Platform target{platform::Platform::LINUX_AMD64}; ///< Image build platform
  bool strict{true};                                          ///< Platform problems are fatal
};

struct PrepareOutcome {
  common::Status status{};  ///< First fatal failure, if any
  PreparationReport report; ///< Always populated, partial on failure
};

/* ----------------------------- Orchestrator ----------------------------- */

class Orchestrator {
public:
  Orchestrator(exec::CommandRunner& runner, net::HttpClient& http, exec::Sleeper& sleeper,
               net::PortScanner& ports, kube::KubeClient& kube, platform::HostInfo host,
               common::Logger log, PrepareConfig config = {});

  /**
   * @brief Run the full preparation sequence.
   *
   * Safe to repeat: an existing registry container and cluster are reused,
   * never recreated.
   */
  [[nodiscard]] PrepareOutcome prepare(const PrepareRequest& request);

private:
  exec::CommandRunner& runner_;
  net::HttpClient& http_;
  exec::Sleeper& sleeper_;
  net::PortScanner& ports_;
  kube::KubeClient& kube_;
  platform::HostInfo host_;
  common::Logger log_;
  PrepareConfig config_;
};

} // namespace prepare
} // namespace kindling

#endif // KINDLING_PREPARE_ORCHESTRATOR_HPP
