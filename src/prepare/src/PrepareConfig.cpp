/**
 * @file PrepareConfig.cpp
 * @brief yaml-cpp loader for PrepareConfig.
 */

#include "src/prepare/inc/PrepareConfig.hpp"
#include "src/common/inc/Log.hpp"
#include "src/naming/inc/ResourceName.hpp"

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace kindling {

namespace prepare {

namespace {

using common::ErrorKind;
using common::Status;

Status invalidKey(const std::string& key, const std::string& detail) {
  return Status::failure(ErrorKind::VALIDATION, fmt::format("Invalid configuration key '{}'", key),
                         detail, "Fix or remove the key; every key is optional");
}

/// Read @p parent[@p key] as T when present. Conversion errors name the key.
template <typename T>
Status readKey(const YAML::Node& parent, const char* key, const std::string& path, T& out) {
  const YAML::Node NODE = parent[key];
  if (!NODE) {
    return Status::success();
  }
  try {
    out = NODE.as<T>();
  } catch (const YAML::Exception& e) {
    return invalidKey(path + key, e.msg);
  }
  return Status::success();
}

Status readPort(const YAML::Node& parent, const char* key, const std::string& path,
                std::uint16_t& out) {
  long value = out;
  Status status = readKey(parent, key, path, value);
  if (!status.ok()) {
    return status;
  }
  if (value < 1 || value > 65535) {
    return invalidKey(path + key, fmt::format("port {} outside 1-65535", value));
  }
  out = static_cast<std::uint16_t>(value);
  return Status::success();
}

Status readMillis(const YAML::Node& parent, const char* key, const std::string& path,
                  std::chrono::milliseconds& out) {
  long long value = out.count();
  Status status = readKey(parent, key, path, value);
  if (!status.ok()) {
    return status;
  }
  if (value <= 0) {
    return invalidKey(path + key, fmt::format("duration {} ms must be positive", value));
  }
  out = std::chrono::milliseconds(value);
  return Status::success();
}

Status readAttempts(const YAML::Node& parent, const char* key, const std::string& path,
                    std::uint32_t& out) {
  long value = out;
  Status status = readKey(parent, key, path, value);
  if (!status.ok()) {
    return status;
  }
  if (value < 1 || value > 1000) {
    return invalidKey(path + key, fmt::format("attempt count {} outside 1-1000", value));
  }
  out = static_cast<std::uint32_t>(value);
  return Status::success();
}

Status applyCluster(const YAML::Node& node, PrepareConfig& config) {
  Status status;
  const std::string P = "cluster.";
  std::string name = config.clusterName;
  status = readKey(node, "name", P, name);
  if (!status.ok()) {
    return status;
  }
  const naming::NameCheck CHECK = naming::validateName(name);
  if (!CHECK.ok()) {
    return invalidKey(P + "name", CHECK.detail);
  }
  config.clusterName = name;

  cluster::ClusterOptions& opts = config.clusterOptions;
  status = readKey(node, "kindVersion", P, opts.kindVersion);
  if (!status.ok()) {
    return status;
  }
  if (opts.kindVersion.empty() || opts.kindVersion.front() != 'v') {
    return invalidKey(P + "kindVersion", "expected a release tag such as v0.20.0");
  }
  status = readMillis(node, "stabilizationMs", P, opts.stabilization);
  if (!status.ok()) {
    return status;
  }
  return Status::success();
}

Status applyRegistry(const YAML::Node& node, PrepareConfig& config) {
  Status status;
  const std::string P = "registry.";
  registry::RegistryOptions& reg = config.registryOptions;
  status = readPort(node, "portStart", P, reg.portStart);
  if (!status.ok()) {
    return status;
  }
  status = readPort(node, "portEnd", P, reg.portEnd);
  if (!status.ok()) {
    return status;
  }
  if (reg.portStart > reg.portEnd) {
    return invalidKey(P + "portEnd", fmt::format("range {}-{} is empty", reg.portStart,
                                                 reg.portEnd));
  }

  if (const YAML::Node HEALTH = node["health"]) {
    const std::string H = P + "health.";
    status = readAttempts(HEALTH, "maxAttempts", H, reg.health.maxAttempts);
    if (!status.ok()) {
      return status;
    }
    status = readMillis(HEALTH, "initialDelayMs", H, reg.health.initialDelay);
    if (!status.ok()) {
      return status;
    }
    status = readKey(HEALTH, "factor", H, reg.health.factor);
    if (!status.ok()) {
      return status;
    }
    if (reg.health.factor < 1.0) {
      return invalidKey(H + "factor", "backoff factor must be at least 1.0");
    }
    status = readMillis(HEALTH, "maxDelayMs", H, reg.health.maxDelay);
    if (!status.ok()) {
      return status;
    }
  }

  status = readAttempts(node, "reachabilityAttempts", P, reg.reachability.maxAttempts);
  if (!status.ok()) {
    return status;
  }
  status = readMillis(node, "reachabilityDelayMs", P, reg.reachability.initialDelay);
  if (!status.ok()) {
    return status;
  }
  reg.reachability.maxDelay = reg.reachability.initialDelay;
  return Status::success();
}

Status applyTimeouts(const YAML::Node& node, PrepareConfig& config) {
  Status status;
  const std::string P = "timeouts.";
  status = readMillis(node, "commandMs", P, config.registryOptions.commandTimeout);
  if (!status.ok()) {
    return status;
  }
  config.clusterOptions.commandTimeout = config.registryOptions.commandTimeout;
  status = readMillis(node, "createClusterMs", P, config.clusterOptions.createTimeout);
  if (!status.ok()) {
    return status;
  }
  status = readMillis(node, "probePodMs", P, config.registryOptions.probePodTimeout);
  if (!status.ok()) {
    return status;
  }
  return Status::success();
}

Status applyLog(const YAML::Node& node, PrepareConfig& config) {
  Status status;
  std::string level;
  status = readKey(node, "level", "log.", level);
  if (!status.ok()) {
    return status;
  }
  if (level.empty()) {
    return Status::success();
  }
  config.logLevel = common::parseLevel(level);
  if (!config.logLevel) {
    return invalidKey("log.level", fmt::format("unknown level '{}'", level));
  }
  return Status::success();
}

Status apply(const YAML::Node& root, PrepareConfig& config) {
  Status status;
  if (root.IsNull()) {
    return Status::success();
  }
  if (!root.IsMap()) {
    return Status::failure(ErrorKind::VALIDATION, "Configuration must be a YAML mapping",
                           "The document root is a scalar or sequence",
                           "Start the file with top-level keys such as 'cluster:'");
  }
  if (const YAML::Node N = root["cluster"]) {
    status = applyCluster(N, config);
    if (!status.ok()) {
      return status;
    }
  }
  if (const YAML::Node N = root["registry"]) {
    status = applyRegistry(N, config);
    if (!status.ok()) {
      return status;
    }
  }
  if (const YAML::Node N = root["timeouts"]) {
    status = applyTimeouts(N, config);
    if (!status.ok()) {
      return status;
    }
  }
  if (const YAML::Node N = root["log"]) {
    status = applyLog(N, config);
    if (!status.ok()) {
      return status;
    }
  }
  return Status::success();
}

} // namespace

Status parseConfig(std::string_view yaml, PrepareConfig& config) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception& e) {
    return Status::failure(ErrorKind::VALIDATION, "Configuration is not valid YAML", e.what(),
                           "Check indentation and quoting");
  }
  return apply(root, config);
}

Status loadConfig(const std::string& path, PrepareConfig& config) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile& e) {
    return Status::failure(ErrorKind::VALIDATION,
                           fmt::format("Cannot read configuration file {}", path), e.what(),
                           "Check the --config path");
  } catch (const YAML::Exception& e) {
    return Status::failure(ErrorKind::VALIDATION,
                           fmt::format("Configuration file {} is not valid YAML", path), e.what(),
                           "Check indentation and quoting");
  }
  return apply(root, config);
}

} // namespace prepare

} // namespace kindling
