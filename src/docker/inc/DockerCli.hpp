#ifndef KINDLING_DOCKER_DOCKER_CLI_HPP
#define KINDLING_DOCKER_DOCKER_CLI_HPP
/**
 * @file DockerCli.hpp
 * @brief Typed wrappers over the docker CLI for container and network state.
 *
 * Inspection uses Go templates (--format) so no JSON parsing is needed.
 * Container names are string constants or validated ResourceNames.
 */

#include "src/common/inc/Log.hpp"
#include "src/exec/inc/CommandRunner.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kindling {
namespace docker {

/* ----------------------------- ContainerState ----------------------------- */

/**
 * @brief Lifecycle state of a named container.
 */
enum class ContainerState : std::uint8_t {
  ABSENT = 0, ///< No container with this name
  RUNNING,    ///< State.Status == running
  STOPPED,    ///< Exists in any other state (created, exited, paused, ...)
};

/// Human-readable name for ContainerState.
[[nodiscard]] const char* toString(ContainerState state) noexcept;

/* ----------------------------- NetworkJoin ----------------------------- */

/**
 * @brief Outcome of connecting a container to a network.
 */
enum class JoinResult : std::uint8_t {
  JOINED = 0,       ///< Newly connected
  ALREADY_JOINED,   ///< Docker reported an existing endpoint
  FAILED,           ///< Any other error
};

/* ----------------------------- DockerCli ----------------------------- */

class DockerCli {
public:
  DockerCli(exec::CommandRunner& runner, common::Logger log,
            std::chrono::milliseconds timeout = exec::DEFAULT_COMMAND_TIMEOUT);

  /// State of the registry container.
  [[nodiscard]] ContainerState registryState();

  /**
   * @brief Host port bound to @p containerPort/tcp.
   *
   * Reads HostConfig.PortBindings, which persists while a container is
   * stopped, so a restarted container keeps its previous port.
   */
  [[nodiscard]] std::optional<std::uint16_t> publishedPort(std::uint16_t containerPort);

  /// Start the stopped registry container.
  [[nodiscard]] exec::CmdResult startRegistry();

  /// docker run the registry image detached with restart=always.
  [[nodiscard]] exec::CmdResult runRegistry(std::uint16_t hostPort);

  /// Last @p lines lines of the registry container's output.
  [[nodiscard]] std::string registryLogs(unsigned lines);

  /// True when the cluster network exists.
  [[nodiscard]] bool clusterNetworkExists();

  /// Networks the registry container is attached to.
  [[nodiscard]] std::vector<std::string> registryNetworks();

  /// Connect the registry container to the cluster network.
  [[nodiscard]] JoinResult joinClusterNetwork(std::string& error);

  /// Registry container address on the cluster network, empty if none.
  [[nodiscard]] std::string registryClusterAddress();

  /**
   * @brief Read containerd's configuration from a kind node container.
   * @param node Node container name, e.g. "<cluster>-control-plane".
   */
  [[nodiscard]] exec::CmdResult readContainerdConfig(const naming::ResourceName& node);

private:
  exec::CommandRunner& runner_;
  common::Logger log_;
  std::chrono::milliseconds timeout_;
};

} // namespace docker
} // namespace kindling

#endif // KINDLING_DOCKER_DOCKER_CLI_HPP
