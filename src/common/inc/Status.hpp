#ifndef KINDLING_COMMON_STATUS_HPP
#define KINDLING_COMMON_STATUS_HPP
/**
 * @file Status.hpp
 * @brief Failure taxonomy and remediation guidance.
 *
 * Every fatal condition in kindling is reported as a Status carrying an
 * ErrorKind and a Guidance block (what happened, a hint at the likely cause,
 * and a concrete resolution). Advisory conditions never produce a Status;
 * they are appended to a warnings list instead.
 */

#include <cstdint>
#include <string>

namespace kindling {
namespace common {

/* ----------------------------- ErrorKind ----------------------------- */

/**
 * @brief Classification of fatal failures.
 */
enum class ErrorKind : std::uint8_t {
  NONE = 0,          ///< Success
  VALIDATION,        ///< Malformed caller input (names, namespaces, config)
  CONNECTIVITY,      ///< Cluster API unreachable
  PERMISSION,        ///< Insufficient rights in the target namespace
  PLATFORM_MISMATCH, ///< Target and cluster architectures incompatible (strict)
  PROVISIONING,      ///< Registry, cluster or namespace could not be created
};

/// Human-readable name for ErrorKind.
[[nodiscard]] const char* toString(ErrorKind kind) noexcept;

/* ----------------------------- Guidance ----------------------------- */

/**
 * @brief Operator-facing remediation text.
 */
struct Guidance {
  std::string message;    ///< What failed
  std::string hint;       ///< Likely cause
  std::string resolution; ///< Concrete next step
};

/* ----------------------------- Status ----------------------------- */

/**
 * @brief Outcome of a fallible operation.
 *
 * Default constructed Status is success.
 */
struct Status {
  ErrorKind kind{ErrorKind::NONE};
  Guidance guidance{};

  /// True when no failure was recorded.
  [[nodiscard]] bool ok() const noexcept { return kind == ErrorKind::NONE; }

  /// Success value.
  [[nodiscard]] static Status success() { return Status{}; }

  /// Failure with guidance.
  [[nodiscard]] static Status failure(ErrorKind kind, std::string message, std::string hint,
                                      std::string resolution);

  /// Multi-line rendering: kind, message, hint and resolution.
  [[nodiscard]] std::string toString() const;
};

} // namespace common
} // namespace kindling

#endif // KINDLING_COMMON_STATUS_HPP
