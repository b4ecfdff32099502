#ifndef KINDLING_PREPARE_PREPARATION_REPORT_HPP
#define KINDLING_PREPARE_PREPARATION_REPORT_HPP
/**
 * @file PreparationReport.hpp
 * @brief Aggregated outcome of one preparation run.
 */

#include "src/platform/inc/PlatformValidator.hpp"
#include "src/prepare/inc/Environment.hpp"
#include "src/readiness/inc/ReadinessChecks.hpp"
#include "src/registry/inc/RegistryDescriptor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kindling {
namespace prepare {

struct PreparationReport {
  std::string cluster; ///< Cluster name used
  std::string ns;      ///< Target namespace
  Environment environment{Environment::DEVELOPMENT};

  /// Set when a registry was provisioned.
  std::optional<registry::RegistryDescriptor> localRegistry;

  /// Set once platform validation ran.
  std::optional<platform::PlatformVerdict> platformVerdict;

  readiness::ReadinessChecks checks{};
  std::vector<std::string> warnings;
  bool ready{false};            ///< Required checks passed and no fatal failure
  bool namespaceCreated{false}; ///< Namespace was created by this run
  std::uint64_t elapsedMs{0};

  /// Multi-line human-readable block.
  [[nodiscard]] std::string toString() const;

  /// Single JSON object.
  [[nodiscard]] std::string toJson() const;

  /// One-line natural-language summary.
  [[nodiscard]] std::string summary() const;
};

} // namespace prepare
} // namespace kindling

#endif // KINDLING_PREPARE_PREPARATION_REPORT_HPP
