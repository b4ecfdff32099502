#ifndef KINDLING_PREPARE_ENVIRONMENT_HPP
#define KINDLING_PREPARE_ENVIRONMENT_HPP
/**
 * @file Environment.hpp
 * @brief Deployment environments and what preparation does in each.
 */

#include <cstdint>
#include <optional>
#include <string_view>

namespace kindling {
namespace prepare {

/* ----------------------------- Environment ----------------------------- */

enum class Environment : std::uint8_t {
  DEVELOPMENT = 0, ///< Local kind cluster plus registry
  STAGING,         ///< Existing cluster, verify only
  TESTING,         ///< Existing cluster, verify only
  PRODUCTION,      ///< Existing cluster, namespace and RBAC managed
};

/// Lower-case name ("development", ...).
[[nodiscard]] const char* toString(Environment env) noexcept;

/// Parse a lower-case environment name.
[[nodiscard]] std::optional<Environment> parseEnvironment(std::string_view text) noexcept;

/* ----------------------------- Policy ----------------------------- */

/**
 * @brief Preparation steps enabled for an environment.
 */
struct EnvironmentPolicy {
  bool provisionLocal{false};  ///< Registry and kind cluster
  bool useDevCluster{false};   ///< Cluster named by config instead of "default"
  bool createNamespace{false}; ///< Create a missing namespace
  bool setupRbac{false};       ///< Apply the application ServiceAccount
  bool checkIngress{true};     ///< Look for an ingress controller
};

[[nodiscard]] EnvironmentPolicy policyFor(Environment env) noexcept;

} // namespace prepare
} // namespace kindling

#endif // KINDLING_PREPARE_ENVIRONMENT_HPP
