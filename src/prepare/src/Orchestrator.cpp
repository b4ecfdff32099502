/**
 * @file Orchestrator.cpp
 * @brief Environment-driven preparation sequence.
 */

#include "src/prepare/inc/Orchestrator.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/naming/inc/ResourceName.hpp"
#include "src/platform/inc/PlatformValidator.hpp"
#include "src/readiness/inc/ReadinessChecker.hpp"
#include "src/registry/inc/RegistryProvisioner.hpp"

#include <cstdint>
#include <optional>
#include <utility>

#include <fmt/core.h>

namespace kindling {

namespace prepare {

namespace {

using common::ErrorKind;
using common::Status;
using naming::ResourceName;

/// Validate @p text as a name of the given @p role ("namespace", "cluster").
Status checkName(const std::string& text, const char* role, std::optional<ResourceName>& out) {
  naming::NameCheck check = naming::validateName(text);
  if (!check.ok()) {
    return Status::failure(ErrorKind::VALIDATION,
                           fmt::format("Invalid {} name '{}'", role, text), check.detail,
                           "Use 1-63 lower-case letters, digits or '-', starting and ending "
                           "with a letter or digit");
  }
  out = std::move(check.name);
  return Status::success();
}

readiness::ReadinessPolicy readinessPolicy(const EnvironmentPolicy& env) noexcept {
  readiness::ReadinessPolicy policy{};
  policy.createNamespace = env.createNamespace;
  policy.setupRbac = env.setupRbac;
  policy.checkIngress = env.checkIngress;
  return policy;
}

} // namespace

Orchestrator::Orchestrator(exec::CommandRunner& runner, net::HttpClient& http,
                           exec::Sleeper& sleeper, net::PortScanner& ports,
                           kube::KubeClient& kube, platform::HostInfo host, common::Logger log,
                           PrepareConfig config)
    : runner_(runner), http_(http), sleeper_(sleeper), ports_(ports), kube_(kube),
      host_(std::move(host)), log_(std::move(log)), config_(std::move(config)) {}

/* ----------------------------- prepare ----------------------------- */

PrepareOutcome Orchestrator::prepare(const PrepareRequest& request) {
  const std::uint64_t START_MS = helpers::clock::getMonotonicMs();
  const EnvironmentPolicy POLICY = policyFor(request.environment);

  PrepareOutcome out{};
  PreparationReport& report = out.report;
  report.environment = request.environment;
  report.ns = request.ns;
  report.cluster = POLICY.useDevCluster ? config_.clusterName : common::DEFAULT_CLUSTER_NAME;

  auto finish = [&](Status status) -> PrepareOutcome {
    if (!status.ok()) {
      log_->error("{}", status.guidance.message);
    }
    out.status = std::move(status);
    report.ready = out.status.ok() && report.checks.ready();
    report.elapsedMs = helpers::clock::getMonotonicMs() - START_MS;
    log_->info("{}", report.summary());
    return std::move(out);
  };

  std::optional<ResourceName> ns;
  Status status = checkName(request.ns, "namespace", ns);
  if (!status.ok()) {
    return finish(std::move(status));
  }
  std::optional<ResourceName> clusterName;
  status = checkName(report.cluster, "cluster", clusterName);
  if (!status.ok()) {
    return finish(std::move(status));
  }

  log_->info("Preparing {} environment: cluster {}, namespace {}, target {}{}",
             toString(request.environment), *clusterName, *ns, platform::toString(request.target),
             request.strict ? "" : " (lenient)");

  if (POLICY.provisionLocal) {
    registry::RegistryProvisioner provisioner(runner_, http_, sleeper_, ports_, log_,
                                              config_.registryOptions);
    registry::RegistryDescriptor reg{};

    status = provisioner.resolvePort(reg);
    if (!status.ok()) {
      return finish(std::move(status));
    }
    status = provisioner.ensureContainer(reg, report.warnings);
    report.localRegistry = reg;
    if (!status.ok()) {
      report.checks.registryCreated = false;
      return finish(std::move(status));
    }
    report.checks.registryCreated = true;

    cluster::ClusterManager manager(runner_, http_, sleeper_, kube_, host_, log_,
                                    config_.clusterOptions);
    const cluster::ClusterDescriptor CLUSTER{*clusterName, request.strict};
    status = manager.ensure(CLUSTER, reg.hostPort, request.target, report.checks,
                            report.warnings);
    if (!status.ok()) {
      return finish(std::move(status));
    }

    provisioner.joinClusterNetwork(reg, report.warnings);
    provisioner.publishHostingConfig(kube_, reg);
    provisioner.validateClusterAccess(reg, *clusterName, report.warnings);
    report.localRegistry = reg;
    log_->info("Registry {} phase {}", reg.externalUrl(), registry::toString(reg.phase));
  }

  readiness::ReadinessChecker checker(kube_, log_);
  status = checker.verify(*ns, readinessPolicy(POLICY), report.checks, report.namespaceCreated,
                          report.warnings);
  if (!status.ok()) {
    return finish(std::move(status));
  }

  platform::PlatformValidator validator(kube_, host_, log_);
  platform::PlatformVerdict verdict{};
  status = validator.validate(request.target, request.strict, verdict, report.warnings);
  report.platformVerdict = verdict;
  report.checks.platformCompatible = verdict.compatible;
  return finish(std::move(status));
}

} // namespace prepare

} // namespace kindling
