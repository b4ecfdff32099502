/**
 * @file KindConfig.cpp
 * @brief yaml-cpp emitter for kind Cluster configs.
 */

#include "src/cluster/inc/KindConfig.hpp"
#include "src/common/inc/Defaults.hpp"
#include "src/registry/inc/MirrorConfig.hpp"

#include <yaml-cpp/yaml.h>

namespace kindling {

namespace cluster {

namespace {

std::string initConfigurationPatch() {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "kind" << YAML::Value << "InitConfiguration";
  out << YAML::Key << "nodeRegistration" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "kubeletExtraArgs" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "node-labels" << YAML::Value << YAML::DoubleQuoted << "ingress-ready=true";
  out << YAML::EndMap;
  out << YAML::EndMap;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

void emitPortMapping(YAML::Emitter& out, std::uint16_t port) {
  out << YAML::BeginMap;
  out << YAML::Key << "containerPort" << YAML::Value << port;
  out << YAML::Key << "hostPort" << YAML::Value << port;
  out << YAML::Key << "protocol" << YAML::Value << "TCP";
  out << YAML::EndMap;
}

} // namespace

std::string renderKindConfig(const KindConfig& config) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "kind" << YAML::Value << "Cluster";
  out << YAML::Key << "apiVersion" << YAML::Value << "kind.x-k8s.io/v1alpha4";

  out << YAML::Key << "containerdConfigPatches" << YAML::Value << YAML::BeginSeq;
  out << YAML::Literal << registry::containerdMirrorPatch(config.registryPort);
  out << YAML::EndSeq;

  out << YAML::Key << "nodes" << YAML::Value << YAML::BeginSeq;
  out << YAML::BeginMap;
  out << YAML::Key << "role" << YAML::Value << "control-plane";
  if (!config.nodeImage.empty()) {
    out << YAML::Key << "image" << YAML::Value << config.nodeImage;
  }
  out << YAML::Key << "kubeadmConfigPatches" << YAML::Value << YAML::BeginSeq;
  out << YAML::Literal << initConfigurationPatch();
  out << YAML::EndSeq;
  out << YAML::Key << "extraPortMappings" << YAML::Value << YAML::BeginSeq;
  emitPortMapping(out, common::INGRESS_HTTP_PORT);
  emitPortMapping(out, common::INGRESS_HTTPS_PORT);
  out << YAML::EndSeq;
  out << YAML::EndMap;
  out << YAML::EndSeq;

  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

bool shouldPinAmd64Node(bool strict, const platform::HostInfo& host,
                        platform::Platform target) noexcept {
  return !strict && host.isArm64() && target == platform::Platform::LINUX_AMD64;
}

} // namespace cluster

} // namespace kindling
