/**
 * @file RegistryDescriptor.cpp
 * @brief RegistryDescriptor formatting.
 */

#include "src/registry/inc/RegistryDescriptor.hpp"
#include "src/common/inc/Defaults.hpp"

#include <fmt/core.h>

namespace kindling {

namespace registry {

/* ----------------------------- toString ----------------------------- */

const char* toString(RegistryPhase phase) noexcept {
  switch (phase) {
  case RegistryPhase::ABSENT:
    return "absent";
  case RegistryPhase::CREATED:
    return "created";
  case RegistryPhase::NETWORK_JOINED:
    return "network-joined";
  case RegistryPhase::VALIDATED:
    return "validated";
  }
  return "unknown";
}

const char* toString(RegistryHealth health) noexcept {
  switch (health) {
  case RegistryHealth::UNKNOWN:
    return "unknown";
  case RegistryHealth::HEALTHY:
    return "healthy";
  case RegistryHealth::UNHEALTHY:
    return "unhealthy";
  }
  return "unknown";
}

/* ----------------------------- RegistryDescriptor ----------------------------- */

const char* RegistryDescriptor::containerName() noexcept {
  return common::REGISTRY_CONTAINER_NAME;
}

std::string RegistryDescriptor::externalUrl() const {
  return fmt::format("{}:{}", common::REGISTRY_HOST, hostPort);
}

std::string RegistryDescriptor::internalEndpoint() {
  return fmt::format("{}:{}", common::REGISTRY_CONTAINER_NAME, common::REGISTRY_INTERNAL_PORT);
}

std::string RegistryDescriptor::toString() const {
  std::string out;
  out += fmt::format("  Container:   {} ({}{})\n", containerName(), registry::toString(phase),
                     restarted ? ", restarted" : (reused ? ", reused" : ""));
  out += fmt::format("  External:    {}\n", externalUrl());
  out += fmt::format("  Internal:    {}\n", internalEndpoint());
  out += fmt::format("  Health:      {} ({} attempt{})\n", registry::toString(health),
                     healthAttempts, healthAttempts == 1 ? "" : "s");
  out += fmt::format("  Network:     {}{}\n", networkConnected ? "connected" : "not connected",
                     networkAddress.empty() ? "" : fmt::format(" ({})", networkAddress));
  out += fmt::format("  Mirror:      {}\n", mirrorConfigured ? "configured" : "not verified");
  out += fmt::format("  In-cluster:  HTTP {}, DNS {}{}\n", reachableFromCluster ? "ok" : "failed",
                     dnsResolves ? "ok" : "failed",
                     resolvedAddress.empty() ? "" : fmt::format(" -> {}", resolvedAddress));
  return out;
}

} // namespace registry

} // namespace kindling
