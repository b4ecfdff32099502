/**
 * @file DockerCli.cpp
 * @brief docker CLI invocations and output parsing.
 */

#include "src/docker/inc/DockerCli.hpp"
#include "src/common/inc/Defaults.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <charconv>
#include <utility>

namespace kindling {

namespace docker {

namespace {

using common::CLUSTER_NETWORK;
using common::REGISTRY_CONTAINER_NAME;
using exec::CmdResult;
using exec::CommandLine;
using helpers::strings::contains;
using helpers::strings::splitLines;
using helpers::strings::splitWhitespace;
using helpers::strings::toLower;
using helpers::strings::trim;

} // namespace

/* ----------------------------- ContainerState toString ----------------------------- */

const char* toString(ContainerState state) noexcept {
  switch (state) {
  case ContainerState::ABSENT:
    return "absent";
  case ContainerState::RUNNING:
    return "running";
  case ContainerState::STOPPED:
    return "stopped";
  }
  return "unknown";
}

/* ----------------------------- DockerCli ----------------------------- */

DockerCli::DockerCli(exec::CommandRunner& runner, common::Logger log,
                     std::chrono::milliseconds timeout)
    : runner_(runner), log_(std::move(log)), timeout_(timeout) {}

ContainerState DockerCli::registryState() {
  CommandLine ps("docker");
  ps.arg("ps").arg("-a").argf("--filter=name={}", REGISTRY_CONTAINER_NAME).arg(
      "--format={{.Names}}");
  const CmdResult LIST = runner_.run(ps, timeout_);
  if (!LIST.ok()) {
    log_->debug("docker ps failed: {}", trim(LIST.err));
    return ContainerState::ABSENT;
  }

  bool found = false;
  for (const std::string& line : splitLines(LIST.out)) {
    if (line == REGISTRY_CONTAINER_NAME) {
      found = true;
      break;
    }
  }
  if (!found) {
    return ContainerState::ABSENT;
  }

  CommandLine inspect("docker");
  inspect.arg("inspect").arg(REGISTRY_CONTAINER_NAME).arg("--format={{.State.Status}}");
  const CmdResult STATUS = runner_.run(inspect, timeout_);
  if (STATUS.ok() && trim(STATUS.out) == "running") {
    return ContainerState::RUNNING;
  }
  return ContainerState::STOPPED;
}

std::optional<std::uint16_t> DockerCli::publishedPort(std::uint16_t containerPort) {
  CommandLine cmd("docker");
  cmd.arg("inspect").arg(REGISTRY_CONTAINER_NAME).argf(
      "--format={{{{with index .HostConfig.PortBindings \"{}/tcp\"}}}}"
      "{{{{(index . 0).HostPort}}}}{{{{end}}}}",
      containerPort);
  const CmdResult R = runner_.run(cmd, timeout_);
  if (!R.ok()) {
    return std::nullopt;
  }

  const std::string_view TEXT = trim(R.out);
  unsigned value = 0;
  const auto [ptr, ec] = std::from_chars(TEXT.data(), TEXT.data() + TEXT.size(), value);
  if (ec != std::errc{} || ptr != TEXT.data() + TEXT.size() || value == 0 || value > 65535) {
    log_->debug("no published port for {}/tcp: '{}'", containerPort, TEXT);
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(value);
}

CmdResult DockerCli::startRegistry() {
  CommandLine cmd("docker");
  cmd.arg("start").arg(REGISTRY_CONTAINER_NAME);
  return runner_.run(cmd, timeout_);
}

CmdResult DockerCli::runRegistry(std::uint16_t hostPort) {
  CommandLine cmd("docker");
  cmd.arg("run")
      .arg("-d")
      .arg("--restart=always")
      .arg("-p")
      .argf("{}:{}", hostPort, common::REGISTRY_INTERNAL_PORT)
      .arg("--name")
      .arg(REGISTRY_CONTAINER_NAME)
      .arg(common::REGISTRY_IMAGE);
  return runner_.run(cmd, timeout_);
}

std::string DockerCli::registryLogs(unsigned lines) {
  CommandLine cmd("docker");
  cmd.arg("logs").arg("--tail").argf("{}", lines).arg(REGISTRY_CONTAINER_NAME);
  const CmdResult R = runner_.run(cmd, timeout_);
  // docker logs replays the container's stderr on our stderr
  return R.out + R.err;
}

bool DockerCli::clusterNetworkExists() {
  CommandLine cmd("docker");
  cmd.arg("network").arg("ls").argf("--filter=name={}", CLUSTER_NETWORK).arg("--format={{.Name}}");
  const CmdResult R = runner_.run(cmd, timeout_);
  if (!R.ok()) {
    return false;
  }
  for (const std::string& line : splitLines(R.out)) {
    if (line == CLUSTER_NETWORK) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> DockerCli::registryNetworks() {
  CommandLine cmd("docker");
  cmd.arg("inspect").arg(REGISTRY_CONTAINER_NAME).arg(
      "--format={{range $net, $v := .NetworkSettings.Networks}}{{$net}} {{end}}");
  const CmdResult R = runner_.run(cmd, timeout_);
  if (!R.ok()) {
    return {};
  }
  return splitWhitespace(R.out);
}

JoinResult DockerCli::joinClusterNetwork(std::string& error) {
  CommandLine cmd("docker");
  cmd.arg("network").arg("connect").arg(CLUSTER_NETWORK).arg(REGISTRY_CONTAINER_NAME);
  const CmdResult R = runner_.run(cmd, timeout_);
  if (R.ok()) {
    return JoinResult::JOINED;
  }

  const std::string LOWER = toLower(R.err);
  if (contains(LOWER, "already") || contains(LOWER, "duplicate")) {
    return JoinResult::ALREADY_JOINED;
  }
  error = std::string(trim(R.err));
  return JoinResult::FAILED;
}

std::string DockerCli::registryClusterAddress() {
  CommandLine cmd("docker");
  cmd.arg("inspect").arg(REGISTRY_CONTAINER_NAME).argf(
      "--format={{{{with index .NetworkSettings.Networks \"{}\"}}}}{{{{.IPAddress}}}}{{{{end}}}}",
      CLUSTER_NETWORK);
  const CmdResult R = runner_.run(cmd, timeout_);
  return R.ok() ? std::string(trim(R.out)) : std::string();
}

CmdResult DockerCli::readContainerdConfig(const naming::ResourceName& node) {
  CommandLine cmd("docker");
  cmd.arg("exec").arg(node).arg("cat").arg(common::CONTAINERD_CONFIG_PATH);
  return runner_.run(cmd, timeout_);
}

} // namespace docker

} // namespace kindling
