#ifndef KINDLING_PLATFORM_PLATFORM_HPP
#define KINDLING_PLATFORM_PLATFORM_HPP
/**
 * @file Platform.hpp
 * @brief Container platform identifiers and the compatibility relation.
 *
 * A platform is an "os/arch[/variant]" triple drawn from a fixed set. The
 * compatibility relation is directed: a host platform can run some
 * lower-capability guests (arm64 runs arm/v7, amd64 runs 386), never the
 * reverse.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace kindling {
namespace platform {

/* ----------------------------- Platform ----------------------------- */

/**
 * @brief Supported container platforms.
 */
enum class Platform : std::uint8_t {
  LINUX_AMD64 = 0, ///< linux/amd64
  LINUX_ARM64,     ///< linux/arm64
  LINUX_ARM_V7,    ///< linux/arm/v7
  LINUX_ARM_V6,    ///< linux/arm/v6
  LINUX_386,       ///< linux/386
  LINUX_PPC64LE,   ///< linux/ppc64le
  LINUX_S390X,     ///< linux/s390x
  LINUX_RISCV64,   ///< linux/riscv64
  WINDOWS_AMD64,   ///< windows/amd64
};

/// Every supported platform, in declaration order.
inline constexpr std::array<Platform, 9> ALL_PLATFORMS = {
    Platform::LINUX_AMD64,   Platform::LINUX_ARM64,   Platform::LINUX_ARM_V7,
    Platform::LINUX_ARM_V6,  Platform::LINUX_386,     Platform::LINUX_PPC64LE,
    Platform::LINUX_S390X,   Platform::LINUX_RISCV64, Platform::WINDOWS_AMD64,
};

/// Canonical "os/arch[/variant]" text.
[[nodiscard]] const char* toString(Platform platform) noexcept;

/**
 * @brief Parse canonical platform text.
 * @return Platform, or nullopt for anything outside the supported set.
 */
[[nodiscard]] std::optional<Platform> parsePlatform(std::string_view text) noexcept;

/* ----------------------------- Architecture Mapping ----------------------------- */

/**
 * @brief Normalize a node or kernel architecture name.
 *
 * amd64/x86_64 -> "amd64", arm64/aarch64 -> "arm64", armv7l -> "arm/v7",
 * armv6l -> "arm/v6", 386/i386/i686 -> "386"; ppc64le, s390x and riscv64
 * map to themselves. Matching is case-insensitive.
 *
 * @return Normalized arch text, or nullopt for an unknown architecture.
 */
[[nodiscard]] std::optional<std::string_view> normalizeArch(std::string_view arch) noexcept;

/**
 * @brief Build a platform from node-reported OS and architecture.
 * @param os   Operating system; empty means "linux".
 * @param arch Architecture in any spelling normalizeArch() accepts.
 * @return Platform, or nullopt when the combination is unsupported.
 */
[[nodiscard]] std::optional<Platform> platformFromNode(std::string_view os,
                                                       std::string_view arch) noexcept;

/* ----------------------------- Compatibility ----------------------------- */

/**
 * @brief Result of checking a target platform against a host platform.
 */
struct Compatibility {
  bool compatible{false};        ///< Host can run target images
  bool requiresEmulation{false}; ///< Target differs from host
};

/**
 * @brief Check whether images built for @p target run on @p host.
 *
 * Rules: exact match; linux/arm64 hosts run linux/arm/v7 and linux/arm/v6;
 * linux/amd64 hosts run linux/386. Not symmetric.
 */
[[nodiscard]] Compatibility checkCompatibility(Platform target, Platform host) noexcept;

} // namespace platform
} // namespace kindling

#endif // KINDLING_PLATFORM_PLATFORM_HPP
