/**
 * @file RegistryProvisioner.cpp
 * @brief Registry container lifecycle and cluster-side validation.
 */

#include "src/registry/inc/RegistryProvisioner.hpp"
#include "src/common/inc/Defaults.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/kube/inc/Manifests.hpp"
#include "src/registry/inc/MirrorConfig.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>

namespace kindling {

namespace registry {

namespace {

using common::ErrorKind;
using common::REGISTRY_CONTAINER_NAME;
using common::REGISTRY_INTERNAL_PORT;
using common::Status;
using docker::ContainerState;
using docker::JoinResult;
using exec::CmdResult;
using helpers::backoff::firstDelay;
using helpers::backoff::nextDelay;
using helpers::strings::trim;

Status missingPortBinding() {
  return Status::failure(
      ErrorKind::PROVISIONING,
      fmt::format("Registry container {} has no host port bound to {}/tcp",
                  REGISTRY_CONTAINER_NAME, REGISTRY_INTERNAL_PORT),
      "The container was created outside kindling or with a different configuration",
      fmt::format("Remove it and retry: docker rm -f {}", REGISTRY_CONTAINER_NAME));
}

} // namespace

RegistryProvisioner::RegistryProvisioner(exec::CommandRunner& runner, net::HttpClient& http,
                                         exec::Sleeper& sleeper, net::PortScanner& ports,
                                         common::Logger log, RegistryOptions options)
    : runner_(runner), http_(http), sleeper_(sleeper), ports_(ports), log_(std::move(log)),
      options_(options), docker_(runner, log_, options.commandTimeout) {}

/* ----------------------------- Phase 1 ----------------------------- */

Status RegistryProvisioner::resolvePort(RegistryDescriptor& reg) {
  if (docker_.registryState() != ContainerState::ABSENT) {
    const auto EXISTING = docker_.publishedPort(REGISTRY_INTERNAL_PORT);
    if (EXISTING) {
      reg.hostPort = *EXISTING;
      reg.reused = true;
      log_->info("Reusing registry port {} from existing container", reg.hostPort);
      return Status::success();
    }
    return missingPortBinding();
  }

  const auto FREE = net::findAvailablePort(ports_, options_.portStart, options_.portEnd);
  if (!FREE) {
    return Status::failure(
        ErrorKind::PROVISIONING,
        fmt::format("No available port for the local registry in range {}-{}",
                    options_.portStart, options_.portEnd),
        "Every port in the registry range is bound by another process",
        fmt::format("Free a port in {}-{} or configure registry.portStart/portEnd",
                    options_.portStart, options_.portEnd));
  }

  reg.hostPort = *FREE;
  log_->info("Selected free registry port {}", reg.hostPort);
  return Status::success();
}

Status RegistryProvisioner::ensureContainer(RegistryDescriptor& reg,
                                            std::vector<std::string>& warnings) {
  const ContainerState STATE = docker_.registryState();
  log_->debug("Registry container {} is {}", REGISTRY_CONTAINER_NAME, docker::toString(STATE));

  switch (STATE) {
  case ContainerState::RUNNING:
  case ContainerState::STOPPED: {
    const auto PORT = docker_.publishedPort(REGISTRY_INTERNAL_PORT);
    if (!PORT) {
      return missingPortBinding();
    }
    reg.hostPort = *PORT;
    reg.reused = true;

    if (STATE == ContainerState::STOPPED) {
      log_->info("Starting stopped registry container {}", REGISTRY_CONTAINER_NAME);
      const CmdResult R = docker_.startRegistry();
      if (!R.ok()) {
        return Status::failure(
            ErrorKind::PROVISIONING,
            fmt::format("Failed to start registry container {}", REGISTRY_CONTAINER_NAME),
            std::string(trim(R.err)),
            fmt::format("Inspect with 'docker logs {0}' or remove it with 'docker rm -f {0}'",
                        REGISTRY_CONTAINER_NAME));
      }
      reg.restarted = true;
    }
    break;
  }
  case ContainerState::ABSENT: {
    if (reg.hostPort == 0) {
      const Status PORT_STATUS = resolvePort(reg);
      if (!PORT_STATUS.ok()) {
        return PORT_STATUS;
      }
    }
    log_->info("Creating registry container {} on port {}", REGISTRY_CONTAINER_NAME,
               reg.hostPort);
    const CmdResult R = docker_.runRegistry(reg.hostPort);
    if (!R.ok()) {
      return Status::failure(
          ErrorKind::PROVISIONING,
          fmt::format("Failed to create registry container on port {}", reg.hostPort),
          std::string(trim(R.err)),
          "Check that Docker is running (docker info) and the port is not in use");
    }
    reg.reused = false;
    break;
  }
  }

  reg.phase = RegistryPhase::CREATED;
  recordHealth(reg, warnings);
  return Status::success();
}

HealthResult RegistryProvisioner::validateHealth(std::uint16_t hostPort) {
  const helpers::backoff::BackoffPolicy& POLICY = options_.health;
  const std::string URL = fmt::format("http://{}:{}/v2/", common::REGISTRY_HOST, hostPort);

  HealthResult result;
  auto delay = firstDelay(POLICY);

  for (std::uint32_t attempt = 1; attempt <= POLICY.maxAttempts; ++attempt) {
    result.attempts = attempt;

    if (docker_.registryState() == ContainerState::RUNNING) {
      const net::HttpResponse RESP = http_.get(URL, options_.httpTimeout);
      if (RESP.ok()) {
        result.healthy = true;
        log_->info("Registry healthy at {} (attempt {})", URL, attempt);
        return result;
      }
      log_->debug("Registry health attempt {}/{}: {}", attempt, POLICY.maxAttempts,
                  RESP.transportOk ? fmt::format("HTTP {}", RESP.status) : RESP.error);
    } else {
      log_->debug("Registry health attempt {}/{}: container not running", attempt,
                  POLICY.maxAttempts);
    }

    if (attempt < POLICY.maxAttempts) {
      sleeper_.sleepFor(delay);
      delay = nextDelay(POLICY, delay);
    }
  }

  log_->warn("Registry failed health check after {} attempts", result.attempts);
  log_->warn("Last {} lines of {} output:\n{}", options_.logTailLines, REGISTRY_CONTAINER_NAME,
              helpers::strings::tailLines(docker_.registryLogs(options_.logTailLines),
                                          options_.logTailLines));
  return result;
}

void RegistryProvisioner::recordHealth(RegistryDescriptor& reg,
                                       std::vector<std::string>& warnings) {
  const HealthResult HEALTH = validateHealth(reg.hostPort);
  reg.healthAttempts = HEALTH.attempts;
  reg.health = HEALTH.healthy ? RegistryHealth::HEALTHY : RegistryHealth::UNHEALTHY;
  if (!HEALTH.healthy) {
    warnings.push_back(fmt::format(
        "Local registry at {} did not pass health checks after {} attempts - pushes may fail",
        reg.externalUrl(), HEALTH.attempts));
  }
}

/* ----------------------------- Phase 2 ----------------------------- */

void RegistryProvisioner::joinClusterNetwork(RegistryDescriptor& reg,
                                             std::vector<std::string>& warnings) {
  if (!docker_.clusterNetworkExists()) {
    warnings.push_back(fmt::format("Cluster network '{}' not found - registry not connected",
                                   common::CLUSTER_NETWORK));
    log_->warn("{}", warnings.back());
    return;
  }

  auto attached = [this]() {
    const auto NETS = docker_.registryNetworks();
    return std::find(NETS.begin(), NETS.end(), common::CLUSTER_NETWORK) != NETS.end();
  };

  if (attached()) {
    log_->debug("Registry already attached to network {}", common::CLUSTER_NETWORK);
  } else {
    std::string error;
    const JoinResult JOIN = docker_.joinClusterNetwork(error);
    if (JOIN == JoinResult::FAILED || !attached()) {
      if (!error.empty()) {
        log_->warn("docker network connect failed: {}", error);
      }
      warnings.push_back("Failed to connect registry to cluster network - deployment may fail");
      return;
    }
    log_->info("Connected registry to network {}", common::CLUSTER_NETWORK);
  }

  reg.networkConnected = true;
  reg.networkAddress = docker_.registryClusterAddress();
  reg.phase = RegistryPhase::NETWORK_JOINED;

  recordHealth(reg, warnings);
}

void RegistryProvisioner::publishHostingConfig(kube::KubeClient& kube,
                                               const RegistryDescriptor& reg) {
  std::string error;
  if (!kube.applyManifest(kube::registryHostingConfigMap(reg.hostPort), error)) {
    log_->warn("Failed to publish local-registry-hosting ConfigMap: {}", error);
    return;
  }
  log_->debug("Published local-registry-hosting for {}", reg.externalUrl());
}

void RegistryProvisioner::validateClusterAccess(RegistryDescriptor& reg,
                                                const naming::ResourceName& cluster,
                                                std::vector<std::string>& warnings) {
  reg.mirrorConfigured = validateMirrorConfig(cluster, reg.hostPort);
  if (!reg.mirrorConfigured) {
    warnings.push_back(fmt::format(
        "Containerd mirror configuration for {} not found on cluster nodes - image pulls "
        "may fail",
        reg.externalUrl()));
  }

  reg.reachableFromCluster = probeReachability();
  if (!reg.reachableFromCluster) {
    warnings.push_back("Registry is not reachable from within cluster - deployment may fail");
  }

  reg.dnsResolves = probeDns(reg.resolvedAddress);
  if (!reg.dnsResolves) {
    warnings.push_back(fmt::format(
        "Registry hostname '{}' does not resolve inside the cluster - image pulls by "
        "internal name may fail",
        REGISTRY_CONTAINER_NAME));
  }

  if (reg.networkConnected && reg.mirrorConfigured && reg.reachableFromCluster &&
      reg.dnsResolves) {
    reg.phase = RegistryPhase::VALIDATED;
    log_->info("Registry validated from inside cluster {}", cluster);
  }
}

bool RegistryProvisioner::validateMirrorConfig(const naming::ResourceName& cluster,
                                               std::uint16_t hostPort) {
  const naming::NameCheck NODE = naming::validateName(fmt::format("{}-control-plane", cluster));
  if (!NODE.ok()) {
    log_->warn("Cannot derive node container name for {}: {}", cluster, NODE.detail);
    return false;
  }

  const CmdResult R = docker_.readContainerdConfig(*NODE.name);
  if (!R.ok()) {
    log_->warn("Could not read containerd config from {}: {}", *NODE.name, trim(R.err));
    return false;
  }

  const MirrorCheck CHECK = inspectMirrorConfig(R.out, hostPort);
  if (!CHECK.ok()) {
    log_->warn("Mirror config incomplete on {} (stanza={}, endpoint={})", *NODE.name,
               CHECK.stanzaFound, CHECK.endpointFound);
    log_->debug("Registry mirror section:\n{}", mirrorSnippet(R.out));
    return false;
  }
  return true;
}

bool RegistryProvisioner::probeReachability() {
  const helpers::backoff::BackoffPolicy& POLICY = options_.reachability;
  auto delay = firstDelay(POLICY);

  for (std::uint32_t attempt = 1; attempt <= POLICY.maxAttempts; ++attempt) {
    auto pod = ProbePod::create(runner_, log_, options_.probePodTimeout, ++probeSequence_);
    if (!pod) {
      return false;
    }
    if (pod->probeHttp().succeeded) {
      log_->info("Registry reachable from cluster (attempt {})", attempt);
      return true;
    }
    log_->debug("In-cluster registry probe attempt {}/{} failed", attempt, POLICY.maxAttempts);

    if (attempt < POLICY.maxAttempts) {
      sleeper_.sleepFor(delay);
      delay = nextDelay(POLICY, delay);
    }
  }
  return false;
}

bool RegistryProvisioner::probeDns(std::string& address) {
  auto pod = ProbePod::create(runner_, log_, options_.probePodTimeout, ++probeSequence_);
  if (!pod) {
    return false;
  }

  const ProbeOutcome OUTCOME = pod->probeDns();
  if (!OUTCOME.succeeded) {
    return false;
  }
  address = parseResolvedAddress(OUTCOME.output);
  log_->info("Registry name {} resolves in cluster{}", REGISTRY_CONTAINER_NAME,
             address.empty() ? std::string() : fmt::format(" to {}", address));
  return true;
}

} // namespace registry

} // namespace kindling
