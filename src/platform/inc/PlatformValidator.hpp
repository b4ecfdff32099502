#ifndef KINDLING_PLATFORM_PLATFORM_VALIDATOR_HPP
#define KINDLING_PLATFORM_PLATFORM_VALIDATOR_HPP
/**
 * @file PlatformValidator.hpp
 * @brief Compares the requested image platform against the live cluster.
 *
 * Strict mode turns an undetectable or incompatible cluster platform into a
 * PLATFORM_MISMATCH failure. Lenient mode records a warning and continues.
 */

#include "src/common/inc/Log.hpp"
#include "src/common/inc/Status.hpp"
#include "src/kube/inc/KubeClient.hpp"
#include "src/platform/inc/HostInfo.hpp"
#include "src/platform/inc/Platform.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kindling {
namespace platform {

/* ----------------------------- PlatformVerdict ----------------------------- */

/**
 * @brief Outcome of platform validation.
 */
struct PlatformVerdict {
  Platform target{Platform::LINUX_AMD64}; ///< Requested image platform
  std::optional<Platform> cluster;        ///< Detected node platform
  bool compatible{false};                 ///< Images for target run on cluster
  bool requiresEmulation{false};          ///< Target differs from the executing CPU
  bool verified{false};                   ///< Cluster platform was detected

  /// One-line description.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- PlatformValidator ----------------------------- */

class PlatformValidator {
public:
  PlatformValidator(kube::KubeClient& kube, HostInfo host, common::Logger log);

  /**
   * @brief Detect the platform of the cluster's first node.
   *
   * OS defaults to linux when the node does not report one.
   *
   * @return Platform, or nullopt when the query fails or the arch is unsupported.
   */
  [[nodiscard]] std::optional<Platform> detectClusterPlatform();

  /**
   * @brief Validate @p target against the cluster.
   * @param target   Requested image platform.
   * @param strict   Fail instead of warn on mismatch or detection failure.
   * @param verdict  Filled with the comparison outcome.
   * @param warnings Advisory messages are appended here.
   * @return Failure only in strict mode.
   */
  [[nodiscard]] common::Status validate(Platform target, bool strict, PlatformVerdict& verdict,
                                        std::vector<std::string>& warnings);

private:
  kube::KubeClient& kube_;
  HostInfo host_;
  common::Logger log_;
};

} // namespace platform
} // namespace kindling

#endif // KINDLING_PLATFORM_PLATFORM_VALIDATOR_HPP
