#ifndef KINDLING_PLATFORM_HOST_INFO_HPP
#define KINDLING_PLATFORM_HOST_INFO_HPP
/**
 * @file HostInfo.hpp
 * @brief Operating system and CPU architecture of the machine running kindling.
 */

#include "src/platform/inc/Platform.hpp"

#include <optional>
#include <string>

namespace kindling {
namespace platform {

/**
 * @brief Host identity derived from uname(2).
 */
struct HostInfo {
  std::string sysname; ///< Kernel name, e.g. "Linux", "Darwin"
  std::string machine; ///< Raw machine string, e.g. "x86_64", "aarch64"

  /// True on macOS.
  [[nodiscard]] bool isMac() const noexcept { return sysname == "Darwin"; }

  /// True when the CPU is 64-bit ARM.
  [[nodiscard]] bool isArm64() const noexcept;

  /// OS component used in release download names ("linux", "darwin").
  [[nodiscard]] const char* downloadOs() const noexcept;

  /// Arch component used in release download names ("amd64", "arm64").
  [[nodiscard]] const char* downloadArch() const noexcept;

  /// Native linux platform of this CPU, if supported.
  [[nodiscard]] std::optional<Platform> nativePlatform() const noexcept;

  /// One-line description.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Query the running host.
 * @return HostInfo; fields are empty if uname fails.
 */
[[nodiscard]] HostInfo getHostInfo();

} // namespace platform
} // namespace kindling

#endif // KINDLING_PLATFORM_HOST_INFO_HPP
