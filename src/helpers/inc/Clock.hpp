#ifndef KINDLING_HELPERS_CLOCK_HPP
#define KINDLING_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Timestamp helpers for elapsed-time reporting and unique names.
 */

#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC, CLOCK_REALTIME

namespace kindling {
namespace helpers {
namespace clock {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Monotonic timestamp in milliseconds.
 *
 * Unaffected by wall clock adjustments; use for elapsed time only.
 */
[[nodiscard]] inline std::uint64_t getMonotonicMs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec) / 1'000'000ULL;
}

/// Wall clock milliseconds since the Unix epoch.
[[nodiscard]] inline std::uint64_t getEpochMs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec) / 1'000'000ULL;
}

} // namespace clock
} // namespace helpers
} // namespace kindling

#endif // KINDLING_HELPERS_CLOCK_HPP
