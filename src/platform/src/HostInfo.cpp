/**
 * @file HostInfo.cpp
 * @brief uname(2) based host detection.
 */

#include "src/platform/inc/HostInfo.hpp"

#include <sys/utsname.h> // uname

#include <fmt/core.h>

namespace kindling {

namespace platform {

bool HostInfo::isArm64() const noexcept {
  const auto ARCH = normalizeArch(machine);
  return ARCH && *ARCH == "arm64";
}

const char* HostInfo::downloadOs() const noexcept { return isMac() ? "darwin" : "linux"; }

const char* HostInfo::downloadArch() const noexcept { return isArm64() ? "arm64" : "amd64"; }

std::optional<Platform> HostInfo::nativePlatform() const noexcept {
  return platformFromNode("linux", machine);
}

std::string HostInfo::toString() const {
  const auto NATIVE = nativePlatform();
  return fmt::format("{} {} (native platform {})", sysname, machine,
                     NATIVE ? platform::toString(*NATIVE) : "unsupported");
}

HostInfo getHostInfo() {
  HostInfo info;
  struct utsname uts{};
  if (::uname(&uts) == 0) {
    info.sysname = uts.sysname;
    info.machine = uts.machine;
  }
  return info;
}

} // namespace platform

} // namespace kindling
