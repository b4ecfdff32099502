/**
 * @file Manifests.cpp
 * @brief yaml-cpp emitters for ServiceAccount and ConfigMap objects.
 */

#include "src/kube/inc/Manifests.hpp"
#include "src/common/inc/Defaults.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace kindling {

namespace kube {

std::string serviceAccountManifest(std::string_view name, const naming::ResourceName& ns) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "apiVersion" << YAML::Value << "v1";
  out << YAML::Key << "kind" << YAML::Value << "ServiceAccount";
  out << YAML::Key << "metadata" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << std::string(name);
  out << YAML::Key << "namespace" << YAML::Value << ns.str();
  out << YAML::EndMap;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

std::string registryHostingConfigMap(std::uint16_t hostPort) {
  const std::string HOSTING =
      fmt::format("host: \"{}:{}\"\nhelp: \"{}\"\n", common::REGISTRY_HOST, hostPort,
                  common::REGISTRY_HOSTING_HELP_URL);

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "apiVersion" << YAML::Value << "v1";
  out << YAML::Key << "kind" << YAML::Value << "ConfigMap";
  out << YAML::Key << "metadata" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << "local-registry-hosting";
  out << YAML::Key << "namespace" << YAML::Value << "kube-public";
  out << YAML::EndMap;
  out << YAML::Key << "data" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "localRegistryHosting.v1" << YAML::Value << YAML::Literal << HOSTING;
  out << YAML::EndMap;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

} // namespace kube

} // namespace kindling
