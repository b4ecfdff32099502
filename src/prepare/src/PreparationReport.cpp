/**
 * @file PreparationReport.cpp
 * @brief Human, JSON and summary renderings of PreparationReport.
 */

#include "src/prepare/inc/PreparationReport.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

namespace kindling {

namespace prepare {

namespace {

using helpers::strings::jsonEscape;

const char* yesNo(bool v) noexcept { return v ? "yes" : "no"; }

std::string optionalCheck(const std::optional<bool>& v) {
  return v ? std::string(*v ? "pass" : "fail") : std::string("skipped");
}

std::string jsonOptional(const char* name, const std::optional<bool>& v) {
  return v ? fmt::format(",\n    \"{}\": {}", name, *v) : std::string();
}

std::string registryJson(const registry::RegistryDescriptor& reg) {
  std::string out = "{\n";
  out += fmt::format("    \"containerName\": \"{}\",\n", reg.containerName());
  out += fmt::format("    \"externalUrl\": \"{}\",\n", jsonEscape(reg.externalUrl()));
  out += fmt::format("    \"internalEndpoint\": \"{}\",\n", jsonEscape(reg.internalEndpoint()));
  out += fmt::format("    \"hostPort\": {},\n", reg.hostPort);
  out += fmt::format("    \"phase\": \"{}\",\n", registry::toString(reg.phase));
  out += fmt::format("    \"healthy\": {},\n", reg.healthy());
  out += fmt::format("    \"healthAttempts\": {},\n", reg.healthAttempts);
  out += fmt::format("    \"reused\": {},\n", reg.reused);
  out += fmt::format("    \"restarted\": {},\n", reg.restarted);
  out += fmt::format("    \"networkConnected\": {},\n", reg.networkConnected);
  out += fmt::format("    \"networkAddress\": \"{}\",\n", jsonEscape(reg.networkAddress));
  out += fmt::format("    \"mirrorConfigured\": {},\n", reg.mirrorConfigured);
  out += fmt::format("    \"reachableFromCluster\": {},\n", reg.reachableFromCluster);
  out += fmt::format("    \"dnsResolves\": {},\n", reg.dnsResolves);
  out += fmt::format("    \"resolvedAddress\": \"{}\"\n", jsonEscape(reg.resolvedAddress));
  out += "  }";
  return out;
}

std::string platformJson(const platform::PlatformVerdict& v) {
  std::string out = "{\n";
  out += fmt::format("    \"target\": \"{}\",\n", platform::toString(v.target));
  if (v.cluster) {
    out += fmt::format("    \"cluster\": \"{}\",\n", platform::toString(*v.cluster));
  } else {
    out += "    \"cluster\": null,\n";
  }
  out += fmt::format("    \"compatible\": {},\n", v.compatible);
  out += fmt::format("    \"requiresEmulation\": {},\n", v.requiresEmulation);
  out += fmt::format("    \"verified\": {}\n", v.verified);
  out += "  }";
  return out;
}

} // namespace

/* ----------------------------- Human ----------------------------- */

std::string PreparationReport::toString() const {
  std::string out;
  out += fmt::format("Cluster:     {} ({})\n", cluster, prepare::toString(environment));
  out += fmt::format("Namespace:   {}{}\n", ns, namespaceCreated ? " (created)" : "");
  out += fmt::format("Ready:       {}\n", yesNo(ready));
  out += fmt::format("Elapsed:     {} ms\n", elapsedMs);

  out += "\nChecks:\n";
  out += fmt::format("  connectivity       {}\n", checks.connectivity ? "pass" : "fail");
  out += fmt::format("  permissions        {}\n", checks.permissions ? "pass" : "fail");
  out += fmt::format("  namespaceExists    {}\n", checks.namespaceExists ? "pass" : "fail");
  out += fmt::format("  ingressController  {}\n", optionalCheck(checks.ingressController));
  out += fmt::format("  rbacConfigured     {}\n", optionalCheck(checks.rbacConfigured));
  out += fmt::format("  toolInstalled      {}\n", optionalCheck(checks.toolInstalled));
  out += fmt::format("  clusterCreated     {}\n", optionalCheck(checks.clusterCreated));
  out += fmt::format("  registryCreated    {}\n", optionalCheck(checks.registryCreated));
  out += fmt::format("  platformCompatible {}\n", optionalCheck(checks.platformCompatible));

  if (localRegistry) {
    out += "\nRegistry:\n";
    out += localRegistry->toString();
  }

  if (platformVerdict) {
    out += fmt::format("\nPlatform:    {}\n", platformVerdict->toString());
  }

  if (!warnings.empty()) {
    out += "\nWarnings:\n";
    for (const std::string& w : warnings) {
      out += fmt::format("  - {}\n", w);
    }
  }
  return out;
}

/* ----------------------------- JSON ----------------------------- */

std::string PreparationReport::toJson() const {
  std::string out = "{\n";
  out += fmt::format("  \"summary\": \"{}\",\n", jsonEscape(summary()));
  out += fmt::format("  \"ready\": {},\n", ready);
  out += fmt::format("  \"cluster\": \"{}\",\n", jsonEscape(cluster));
  out += fmt::format("  \"namespace\": \"{}\",\n", jsonEscape(ns));
  out += fmt::format("  \"environment\": \"{}\",\n", prepare::toString(environment));
  out += fmt::format("  \"namespaceCreated\": {},\n", namespaceCreated);
  out += fmt::format("  \"elapsedMs\": {},\n", elapsedMs);

  out += "  \"checks\": {\n";
  out += fmt::format("    \"connectivity\": {},\n", checks.connectivity);
  out += fmt::format("    \"permissions\": {},\n", checks.permissions);
  out += fmt::format("    \"namespaceExists\": {}", checks.namespaceExists);
  out += jsonOptional("ingressController", checks.ingressController);
  out += jsonOptional("rbacConfigured", checks.rbacConfigured);
  out += jsonOptional("toolInstalled", checks.toolInstalled);
  out += jsonOptional("clusterCreated", checks.clusterCreated);
  out += jsonOptional("registryCreated", checks.registryCreated);
  out += jsonOptional("platformCompatible", checks.platformCompatible);
  out += "\n  },\n";

  if (localRegistry) {
    out += fmt::format("  \"localRegistry\": {},\n", registryJson(*localRegistry));
  }
  if (platformVerdict) {
    out += fmt::format("  \"platform\": {},\n", platformJson(*platformVerdict));
  }

  out += "  \"warnings\": [";
  for (std::size_t i = 0; i < warnings.size(); ++i) {
    out += fmt::format("{}\n    \"{}\"", i == 0 ? "" : ",", jsonEscape(warnings[i]));
  }
  out += warnings.empty() ? "]\n" : "\n  ]\n";
  out += "}\n";
  return out;
}

/* ----------------------------- Summary ----------------------------- */

std::string PreparationReport::summary() const {
  if (!ready) {
    const char* reason = !checks.connectivity      ? "cluster unreachable"
                         : !checks.permissions     ? "insufficient permissions"
                         : !checks.namespaceExists ? "namespace missing"
                                                   : "preparation failed";
    return fmt::format("Cluster {} not ready for deployment to namespace '{}': {}. {} warning{}.",
                       cluster, ns, reason, warnings.size(), warnings.size() == 1 ? "" : "s");
  }
  const std::size_t PASSED = checks.passed();
  return fmt::format(
      "Cluster prepared. Namespace '{}' {}. {} check{} passed. Ready for deployment.", ns,
      namespaceCreated ? "created" : "verified", PASSED, PASSED == 1 ? "" : "s");
}

} // namespace prepare

} // namespace kindling
