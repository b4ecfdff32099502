#ifndef KINDLING_NAMING_RESOURCE_NAME_HPP
#define KINDLING_NAMING_RESOURCE_NAME_HPP
/**
 * @file ResourceName.hpp
 * @brief Validated identifier type for cluster, namespace and pod names.
 *
 * A ResourceName can only be obtained through validateName(), so holding one
 * proves the text matches the DNS-1123 label grammar:
 *
 *   ^[a-z0-9]([-a-z0-9]*[a-z0-9])?$, 1..63 characters
 *
 * Command builders accept ResourceName rather than std::string for every
 * identifier that reaches a subprocess argument vector.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

namespace kindling {
namespace naming {

/* ----------------------------- Constants ----------------------------- */

/// Maximum identifier length (DNS-1123 label).
inline constexpr std::size_t MAX_NAME_LENGTH = 63;

/* ----------------------------- NameRejection ----------------------------- */

/**
 * @brief Reason a candidate name was rejected.
 */
enum class NameRejection : std::uint8_t {
  NONE = 0, ///< Accepted
  EMPTY,    ///< Zero-length input
  CHARSET,  ///< Character or hyphen placement violates the grammar
  LENGTH,   ///< Longer than MAX_NAME_LENGTH
};

/// Human-readable name for NameRejection.
[[nodiscard]] const char* toString(NameRejection reason) noexcept;

/* ----------------------------- ResourceName ----------------------------- */

struct NameCheck;

/**
 * @brief Validate a candidate identifier.
 * @param candidate Raw text (caller input or generated).
 * @return NameCheck with the validated name or the specific rejection.
 * @note Pure function, no side effects.
 */
[[nodiscard]] NameCheck validateName(std::string_view candidate);

/**
 * @brief Identifier proven to satisfy the DNS-1123 label grammar.
 */
class ResourceName {
public:
  [[nodiscard]] const std::string& str() const noexcept { return value_; }
  [[nodiscard]] const char* c_str() const noexcept { return value_.c_str(); }
  [[nodiscard]] std::size_t size() const noexcept { return value_.size(); }

  bool operator==(const ResourceName& other) const noexcept { return value_ == other.value_; }

private:
  explicit ResourceName(std::string value) : value_(std::move(value)) {}

  friend NameCheck validateName(std::string_view candidate);

  std::string value_;
};

/**
 * @brief Outcome of validating a candidate identifier.
 */
struct NameCheck {
  std::optional<ResourceName> name; ///< Set when accepted
  NameRejection reason{NameRejection::NONE};
  std::string detail; ///< Explanation when rejected

  [[nodiscard]] bool ok() const noexcept { return reason == NameRejection::NONE; }
};

} // namespace naming
} // namespace kindling

/// Formats as the underlying identifier text.
template <>
struct fmt::formatter<kindling::naming::ResourceName> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const kindling::naming::ResourceName& name, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(std::string_view(name.str()), ctx);
  }
};

#endif // KINDLING_NAMING_RESOURCE_NAME_HPP
