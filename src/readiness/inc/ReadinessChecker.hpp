#ifndef KINDLING_READINESS_READINESS_CHECKER_HPP
#define KINDLING_READINESS_READINESS_CHECKER_HPP
/**
 * @file ReadinessChecker.hpp
 * @brief Namespace, permission and ingress readiness of the target cluster.
 *
 * Checks run in order and stop at the first fatal one:
 *   connectivity -> permissions -> namespace -> service account -> ingress
 */

#include "src/common/inc/Log.hpp"
#include "src/common/inc/Status.hpp"
#include "src/kube/inc/KubeClient.hpp"
#include "src/naming/inc/ResourceName.hpp"
#include "src/readiness/inc/ReadinessChecks.hpp"

#include <string>
#include <vector>

namespace kindling {
namespace readiness {

/**
 * @brief Which optional readiness actions to take.
 */
struct ReadinessPolicy {
  bool createNamespace{false}; ///< Create a missing namespace instead of warning
  bool setupRbac{false};       ///< Apply the application ServiceAccount
  bool checkIngress{true};     ///< Look for an IngressClass
};

class ReadinessChecker {
public:
  ReadinessChecker(kube::KubeClient& kube, common::Logger log);

  /**
   * @brief Run the readiness sequence against @p ns.
   * @param checks            Filled as checks complete, also on failure.
   * @param namespaceCreated  Set when this call created the namespace.
   * @return CONNECTIVITY, PERMISSION or PROVISIONING failure; success otherwise.
   */
  [[nodiscard]] common::Status verify(const naming::ResourceName& ns,
                                      const ReadinessPolicy& policy, ReadinessChecks& checks,
                                      bool& namespaceCreated, std::vector<std::string>& warnings);

private:
  kube::KubeClient& kube_;
  common::Logger log_;
};

} // namespace readiness
} // namespace kindling

#endif // KINDLING_READINESS_READINESS_CHECKER_HPP
