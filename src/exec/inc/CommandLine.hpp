#ifndef KINDLING_EXEC_COMMAND_LINE_HPP
#define KINDLING_EXEC_COMMAND_LINE_HPP
/**
 * @file CommandLine.hpp
 * @brief Typed argument-vector builder for docker, kind and kubectl.
 *
 * Commands are executed as argument vectors (execvp), never through a shell.
 * The builder accepts only:
 *  - string literals and constant char arrays (fixed flags and constants),
 *  - naming::ResourceName (validated identifiers),
 *  - integers (ports, counters),
 *  - helpers::files::TempFile (paths the process created itself),
 * and formatted fragments composed exclusively of those types. Raw
 * std::string, decayed char pointers and mutable char buffers are rejected
 * at compile time, so caller text reaches a command line only after passing
 * the validator.
 */

#include "src/helpers/inc/Files.hpp"
#include "src/naming/inc/ResourceName.hpp"

#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace kindling {
namespace exec {

namespace detail {

/// Constant char array, as produced by a string literal or a constexpr table entry.
template <typename T>
inline constexpr bool IS_CONST_CHAR_ARRAY =
    std::is_array_v<T> && std::is_same_v<std::remove_extent_t<T>, const char>;

/**
 * @brief Types permitted as values inside a formatted argument.
 *
 * Evaluated on the un-decayed argument type: integers other than char,
 * ResourceName and constant char arrays. `const char*` does not qualify.
 */
template <typename T>
inline constexpr bool IS_COMMAND_VALUE =
    IS_CONST_CHAR_ARRAY<std::remove_reference_t<T>> ||
    (std::is_integral_v<std::remove_cvref_t<T>> && !std::is_same_v<std::remove_cvref_t<T>, char>) ||
    std::is_same_v<std::remove_cvref_t<T>, naming::ResourceName>;

} // namespace detail

/* ----------------------------- CommandLine ----------------------------- */

/**
 * @brief Program name plus argument vector.
 */
class CommandLine {
public:
  /// Start a command for a program looked up on PATH.
  template <std::size_t N> explicit CommandLine(const char (&program)[N]) : argv_{program} {}

  /// Append a literal argument.
  template <std::size_t N> CommandLine& arg(const char (&literal)[N]) {
    argv_.emplace_back(literal);
    return *this;
  }

  /// Mutable buffers hold runtime text.
  template <std::size_t N> CommandLine& arg(char (&buffer)[N]) = delete;

  /// Append a validated identifier.
  CommandLine& arg(const naming::ResourceName& name) {
    argv_.push_back(name.str());
    return *this;
  }

  /// Append the path of a scoped temporary file.
  CommandLine& arg(const helpers::files::TempFile& file) {
    argv_.push_back(file.path());
    return *this;
  }

  /**
   * @brief Append an argument composed from a compile-time format string.
   *
   * Every value must be an integer, a constant char array or a ResourceName.
   */
  template <typename... Args>
    requires(detail::IS_COMMAND_VALUE<Args> && ...)
  CommandLine& argf(fmt::format_string<Args...> format, Args&&... values) {
    argv_.push_back(fmt::format(format, std::forward<Args>(values)...));
    return *this;
  }

  /// Program followed by its arguments.
  [[nodiscard]] const std::vector<std::string>& argv() const noexcept { return argv_; }

  /// Program name.
  [[nodiscard]] const std::string& program() const noexcept { return argv_.front(); }

  /// Space-joined rendering for logs and test matching (no quoting).
  [[nodiscard]] std::string display() const;

private:
  std::vector<std::string> argv_;
};

} // namespace exec
} // namespace kindling

#endif // KINDLING_EXEC_COMMAND_LINE_HPP
