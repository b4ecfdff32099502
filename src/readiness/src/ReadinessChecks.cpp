/**
 * @file ReadinessChecks.cpp
 * @brief ReadinessChecks counting and rendering.
 */

#include "src/readiness/inc/ReadinessChecks.hpp"

#include <initializer_list>

#include <fmt/core.h>

namespace kindling {

namespace readiness {

namespace {

void appendOptional(std::string& out, const char* name, const std::optional<bool>& value) {
  if (value) {
    out += fmt::format(" {}={}", name, *value);
  }
}

} // namespace

std::size_t ReadinessChecks::passed() const noexcept {
  std::size_t n = 0;
  n += connectivity ? 1 : 0;
  n += permissions ? 1 : 0;
  n += namespaceExists ? 1 : 0;
  for (const auto* opt : {&ingressController, &rbacConfigured, &toolInstalled, &clusterCreated,
                          &registryCreated, &platformCompatible}) {
    n += opt->value_or(false) ? 1 : 0;
  }
  return n;
}

std::string ReadinessChecks::toString() const {
  std::string out = fmt::format("connectivity={} permissions={} namespaceExists={}",
                                connectivity, permissions, namespaceExists);
  appendOptional(out, "ingressController", ingressController);
  appendOptional(out, "rbacConfigured", rbacConfigured);
  appendOptional(out, "toolInstalled", toolInstalled);
  appendOptional(out, "clusterCreated", clusterCreated);
  appendOptional(out, "registryCreated", registryCreated);
  appendOptional(out, "platformCompatible", platformCompatible);
  return out;
}

} // namespace readiness

} // namespace kindling
