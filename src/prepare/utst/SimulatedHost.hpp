#ifndef KINDLING_PREPARE_SIMULATED_HOST_HPP
#define KINDLING_PREPARE_SIMULATED_HOST_HPP
/**
 * @file SimulatedHost.hpp
 * @brief Stateful CommandRunner modelling the docker daemon, kind and kubectl run.
 *
 * State survives across commands so repeated preparation runs observe what
 * earlier runs created:
 *  - one registry container (absent, running or stopped) and its networks
 *  - kind clusters, each with the containerd config built from its kind config
 *  - the "kind" docker network, present while any cluster exists
 *
 * Probe pods succeed only when the registry is running and attached to the
 * cluster network.
 */

#include "src/common/inc/Defaults.hpp"
#include "src/exec/inc/CommandRunner.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <system_error>
#include <set>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace kindling {
namespace prepare {
namespace testing {

class SimulatedHost final : public exec::CommandRunner {
public:
  using CommandRunner::run;

  enum class Registry : std::uint8_t { ABSENT = 0, RUNNING, STOPPED };

  /// Cluster created through `kind create cluster`.
  struct KindCluster {
    std::string containerdConfig; ///< Node /etc/containerd/config.toml
    std::string nodeImage;        ///< Pinned node image, empty for the default
  };

  bool kindInstalled{true};
  Registry registryState{Registry::ABSENT};
  std::uint16_t registryPort{0};
  std::set<std::string> registryNetworks{"bridge"};
  std::map<std::string, KindCluster> clusters;

  /// Put a stopped registry bound to @p port in place, as a previous run would leave it.
  void givenStoppedRegistry(std::uint16_t port) {
    registryState = Registry::STOPPED;
    registryPort = port;
  }

  exec::CmdResult run(const exec::CommandLine& cmd,
                      std::chrono::milliseconds /*timeout*/) override {
    calls_.push_back(cmd.display());
    const std::vector<std::string>& A = cmd.argv();
    if (A.front() == "docker") {
      return docker(A);
    }
    if (A.front() == "kind") {
      return kind(A);
    }
    if (A.front() == "kubectl") {
      return kubectl(A);
    }
    return exec::CmdResult::failure("command not found", exec::EXIT_NOT_FOUND);
  }

  [[nodiscard]] const std::vector<std::string>& calls() const noexcept { return calls_; }

  /// Number of executed commands containing @p pattern.
  [[nodiscard]] std::size_t count(const std::string& pattern) const {
    return static_cast<std::size_t>(
        std::count_if(calls_.begin(), calls_.end(), [&](const std::string& c) {
          return c.find(pattern) != std::string::npos;
        }));
  }

private:
  static constexpr char REGISTRY_IP[] = "172.18.0.3";

  [[nodiscard]] bool joined() const {
    return registryState == Registry::RUNNING &&
           registryNetworks.count(common::CLUSTER_NETWORK) != 0;
  }

  static bool has(const std::vector<std::string>& argv, const std::string& needle) {
    return std::any_of(argv.begin(), argv.end(), [&](const std::string& a) {
      return a.find(needle) != std::string::npos;
    });
  }

  exec::CmdResult docker(const std::vector<std::string>& a) {
    using exec::CmdResult;
    const std::string& VERB = a.at(1);

    if (VERB == "ps") {
      return CmdResult::success(registryState == Registry::ABSENT
                                    ? std::string()
                                    : std::string(common::REGISTRY_CONTAINER_NAME) + "\n");
    }
    if (VERB == "inspect") {
      if (registryState == Registry::ABSENT) {
        return CmdResult::failure("Error: No such object: kindling-registry");
      }
      if (has(a, "State.Status")) {
        return CmdResult::success(registryState == Registry::RUNNING ? "running\n" : "exited\n");
      }
      if (has(a, "PortBindings")) {
        return CmdResult::success(std::to_string(registryPort) + "\n");
      }
      if (has(a, "range $net")) {
        std::string out;
        for (const std::string& net : registryNetworks) {
          out += net + " ";
        }
        return CmdResult::success(out + "\n");
      }
      if (has(a, "IPAddress")) {
        return CmdResult::success(
            registryNetworks.count(common::CLUSTER_NETWORK) != 0 ? REGISTRY_IP : "");
      }
      return CmdResult::failure("unsupported inspect format");
    }
    if (VERB == "run") {
      if (registryState != Registry::ABSENT) {
        return CmdResult::failure("Conflict. The container name is already in use", 125);
      }
      const auto P = std::find(a.begin(), a.end(), "-p");
      if (P == a.end() || P + 1 == a.end()) {
        return CmdResult::failure("missing -p", 125);
      }
      unsigned port = 0;
      const std::string& MAPPING = *(P + 1);
      const auto PARSED = std::from_chars(MAPPING.data(), MAPPING.data() + MAPPING.size(), port);
      if (PARSED.ec != std::errc{}) {
        return CmdResult::failure("invalid port mapping " + MAPPING, 125);
      }
      registryState = Registry::RUNNING;
      registryPort = static_cast<std::uint16_t>(port);
      return CmdResult::success("f00dcafe\n");
    }
    if (VERB == "start") {
      if (registryState == Registry::ABSENT) {
        return CmdResult::failure("Error: No such container: kindling-registry");
      }
      registryState = Registry::RUNNING;
      return CmdResult::success(std::string(common::REGISTRY_CONTAINER_NAME) + "\n");
    }
    if (VERB == "logs") {
      return CmdResult::success("");
    }
    if (VERB == "network" && a.at(2) == "ls") {
      return CmdResult::success(clusters.empty() ? std::string()
                                                 : std::string(common::CLUSTER_NETWORK) + "\n");
    }
    if (VERB == "network" && a.at(2) == "connect") {
      if (clusters.empty()) {
        return CmdResult::failure("Error: No such network: kind");
      }
      if (!registryNetworks.insert(common::CLUSTER_NETWORK).second) {
        return CmdResult::failure(
            "Error response from daemon: endpoint with name kindling-registry already exists "
            "in network kind");
      }
      return CmdResult::success("");
    }
    if (VERB == "exec") {
      for (const auto& [name, cluster] : clusters) {
        if (a.at(2) == name + "-control-plane") {
          return CmdResult::success(cluster.containerdConfig);
        }
      }
      return CmdResult::failure("Error: No such container: " + a.at(2));
    }
    return CmdResult::failure("unknown docker command");
  }

  exec::CmdResult kind(const std::vector<std::string>& a) {
    using exec::CmdResult;
    if (!kindInstalled) {
      return CmdResult::failure("kind: not found", exec::EXIT_NOT_FOUND);
    }
    const std::string& VERB = a.at(1);

    if (VERB == "version") {
      return CmdResult::success("kind v0.20.0 go1.20.4 linux/amd64\n");
    }
    if (VERB == "get") {
      std::string out;
      for (const auto& entry : clusters) {
        out += entry.first + "\n";
      }
      CmdResult r = CmdResult::success(out);
      if (clusters.empty()) {
        r.err = "No kind clusters found.\n";
      }
      return r;
    }
    if (VERB == "create") {
      const std::string& NAME = a.at(a.size() - 3);
      if (clusters.count(NAME) != 0) {
        return CmdResult::failure("ERROR: failed to create cluster: node(s) already exist");
      }
      KindCluster cluster;
      try {
        const YAML::Node CONFIG = YAML::LoadFile(a.back());
        cluster.containerdConfig = "version = 2\n\n"
                                   "[plugins.\"io.containerd.grpc.v1.cri\".registry]\n";
        for (const YAML::Node& patch : CONFIG["containerdConfigPatches"]) {
          cluster.containerdConfig += patch.as<std::string>();
        }
        if (CONFIG["nodes"][0]["image"]) {
          cluster.nodeImage = CONFIG["nodes"][0]["image"].as<std::string>();
        }
      } catch (const YAML::Exception& e) {
        return CmdResult::failure(std::string("ERROR: invalid config: ") + e.what());
      }
      clusters.emplace(NAME, cluster);
      return CmdResult::success("");
    }
    if (VERB == "export") {
      return clusters.count(a.back()) != 0
                 ? CmdResult::success("")
                 : CmdResult::failure("ERROR: unknown cluster \"" + a.back() + "\"");
    }
    return CmdResult::failure("unknown kind command");
  }

  exec::CmdResult kubectl(const std::vector<std::string>& a) {
    using exec::CmdResult;
    const std::string& VERB = a.at(1);

    if (VERB == "delete") {
      return CmdResult::success("");
    }
    if (VERB == "run") {
      if (clusters.empty()) {
        return CmdResult::failure("The connection to the server localhost:8080 was refused");
      }
      if (has(a, "nslookup")) {
        if (!joined()) {
          return CmdResult::success(
              "** server can't find kindling-registry: NXDOMAIN\nPROBE_FAILED\n");
        }
        return CmdResult::success(std::string("Server:\t\t10.96.0.10\n"
                                              "Address:\t10.96.0.10:53\n\n"
                                              "Name:\tkindling-registry\n"
                                              "Address: ") +
                                  REGISTRY_IP + "\n\nPROBE_OK\n");
      }
      return CmdResult::success(joined() ? "{\"repositories\":[]}\nPROBE_OK\n"
                                         : "PROBE_FAILED\n");
    }
    return CmdResult::failure("unknown kubectl command");
  }

  std::vector<std::string> calls_;
};

} // namespace testing
} // namespace prepare
} // namespace kindling

#endif // KINDLING_PREPARE_SIMULATED_HOST_HPP
