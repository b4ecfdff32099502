/**
 * @file Platform.cpp
 * @brief Platform table, arch normalization and compatibility rules.
 */

#include "src/platform/inc/Platform.hpp"
#include "src/helpers/inc/Strings.hpp"


namespace kindling {

namespace platform {

namespace {

using helpers::strings::iequals;

struct ArchAlias {
  const char* alias;
  const char* canonical;
};

constexpr ArchAlias ARCH_TABLE[] = {
    {"amd64", "amd64"},     {"x86_64", "amd64"},   {"arm64", "arm64"},
    {"aarch64", "arm64"},   {"armv7l", "arm/v7"},  {"armv6l", "arm/v6"},
    {"386", "386"},         {"i386", "386"},       {"i686", "386"},
    {"ppc64le", "ppc64le"}, {"s390x", "s390x"},    {"riscv64", "riscv64"},
};

/// Lower-capability guests each host can run natively.
struct GuestRule {
  Platform host;
  Platform guest;
};

constexpr GuestRule GUEST_RULES[] = {
    {Platform::LINUX_ARM64, Platform::LINUX_ARM_V7},
    {Platform::LINUX_ARM64, Platform::LINUX_ARM_V6},
    {Platform::LINUX_AMD64, Platform::LINUX_386},
};

} // namespace

/* ----------------------------- Platform toString ----------------------------- */

const char* toString(Platform platform) noexcept {
  switch (platform) {
  case Platform::LINUX_AMD64:
    return "linux/amd64";
  case Platform::LINUX_ARM64:
    return "linux/arm64";
  case Platform::LINUX_ARM_V7:
    return "linux/arm/v7";
  case Platform::LINUX_ARM_V6:
    return "linux/arm/v6";
  case Platform::LINUX_386:
    return "linux/386";
  case Platform::LINUX_PPC64LE:
    return "linux/ppc64le";
  case Platform::LINUX_S390X:
    return "linux/s390x";
  case Platform::LINUX_RISCV64:
    return "linux/riscv64";
  case Platform::WINDOWS_AMD64:
    return "windows/amd64";
  }
  return "unknown";
}

std::optional<Platform> parsePlatform(std::string_view text) noexcept {
  for (const Platform P : ALL_PLATFORMS) {
    if (text == toString(P)) {
      return P;
    }
  }
  return std::nullopt;
}

/* ----------------------------- Architecture Mapping ----------------------------- */

std::optional<std::string_view> normalizeArch(std::string_view arch) noexcept {
  const std::string_view TRIMMED = helpers::strings::trim(arch);
  for (const ArchAlias& entry : ARCH_TABLE) {
    if (iequals(TRIMMED, entry.alias)) {
      return std::string_view(entry.canonical);
    }
  }
  return std::nullopt;
}

std::optional<Platform> platformFromNode(std::string_view os, std::string_view arch) noexcept {
  const auto NORMALIZED = normalizeArch(arch);
  if (!NORMALIZED) {
    return std::nullopt;
  }

  std::string_view osName = helpers::strings::trim(os);
  if (osName.empty()) {
    osName = "linux";
  }

  for (const Platform P : ALL_PLATFORMS) {
    const std::string_view TEXT = toString(P);
    const std::size_t SLASH = TEXT.find('/');
    if (iequals(TEXT.substr(0, SLASH), osName) && TEXT.substr(SLASH + 1) == *NORMALIZED) {
      return P;
    }
  }
  return std::nullopt;
}

/* ----------------------------- Compatibility ----------------------------- */

Compatibility checkCompatibility(Platform target, Platform host) noexcept {
  Compatibility result;
  result.requiresEmulation = (target != host);

  if (target == host) {
    result.compatible = true;
    return result;
  }

  for (const GuestRule& rule : GUEST_RULES) {
    if (rule.host == host && rule.guest == target) {
      result.compatible = true;
      break;
    }
  }
  return result;
}

} // namespace platform

} // namespace kindling
