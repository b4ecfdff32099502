#ifndef KINDLING_READINESS_READINESS_CHECKS_HPP
#define KINDLING_READINESS_READINESS_CHECKS_HPP
/**
 * @file ReadinessChecks.hpp
 * @brief Per-check outcome record shared by every preparation stage.
 *
 * The three mandatory checks are always present. The optional ones are set
 * only when the stage that owns them actually ran.
 */

#include <cstddef>
#include <optional>
#include <string>

namespace kindling {
namespace readiness {

/* ----------------------------- ReadinessChecks ----------------------------- */

struct ReadinessChecks {
  bool connectivity{false};    ///< API server answered
  bool permissions{false};     ///< Deployments may be created in the namespace
  bool namespaceExists{false}; ///< Namespace present (possibly just created)

  std::optional<bool> ingressController;  ///< IngressClass installed
  std::optional<bool> rbacConfigured;     ///< ServiceAccount applied
  std::optional<bool> toolInstalled;      ///< kind binary available
  std::optional<bool> clusterCreated;     ///< kind cluster present
  std::optional<bool> registryCreated;    ///< Registry container present
  std::optional<bool> platformCompatible; ///< Target runs on the cluster

  /// Ready for deployment: connectivity, permissions and namespace all hold.
  [[nodiscard]] bool ready() const noexcept {
    return connectivity && permissions && namespaceExists;
  }

  /// Number of checks that ran and passed.
  [[nodiscard]] std::size_t passed() const noexcept;

  /// "name=value" pairs, attempted checks only.
  [[nodiscard]] std::string toString() const;
};

} // namespace readiness
} // namespace kindling

#endif // KINDLING_READINESS_READINESS_CHECKS_HPP
