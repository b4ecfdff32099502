#ifndef KINDLING_PREPARE_PREPARE_CONFIG_HPP
#define KINDLING_PREPARE_PREPARE_CONFIG_HPP
/**
 * @file PrepareConfig.hpp
 * @brief YAML configuration for kindling-prepare.
 *
 * Every key is optional; missing keys keep the defaults below.
 *
 * @code{.yaml}
 * cluster:
 *   name: kindling
 *   kindVersion: v0.20.0
 *   stabilizationMs: 5000
 * registry:
 *   portStart: 6000
 *   portEnd: 6100
 *   health:
 *     maxAttempts: 10
 *     initialDelayMs: 500
 *     factor: 1.5
 *     maxDelayMs: 5000
 *   reachabilityAttempts: 3
 *   reachabilityDelayMs: 3000
 * timeouts:
 *   commandMs: 30000
 *   createClusterMs: 300000
 *   probePodMs: 90000
 * log:
 *   level: info
 * @endcode
 */

#include "src/cluster/inc/ClusterManager.hpp"
#include "src/common/inc/Defaults.hpp"
#include "src/common/inc/Status.hpp"
#include "src/registry/inc/RegistryProvisioner.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace kindling {
namespace prepare {

struct PrepareConfig {
  std::string clusterName{common::DEV_CLUSTER_NAME}; ///< Development cluster name
  registry::RegistryOptions registryOptions{};
  cluster::ClusterOptions clusterOptions{};
  std::optional<spdlog::level::level_enum> logLevel; ///< Overrides --verbose when set
};

/**
 * @brief Parse YAML text into @p config.
 * @return VALIDATION failure naming the offending key.
 */
[[nodiscard]] common::Status parseConfig(std::string_view yaml, PrepareConfig& config);

/// Read and parse a YAML file.
[[nodiscard]] common::Status loadConfig(const std::string& path, PrepareConfig& config);

} // namespace prepare
} // namespace kindling

#endif // KINDLING_PREPARE_PREPARE_CONFIG_HPP
