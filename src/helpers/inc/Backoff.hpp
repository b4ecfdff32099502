#ifndef KINDLING_HELPERS_BACKOFF_HPP
#define KINDLING_HELPERS_BACKOFF_HPP
/**
 * @file Backoff.hpp
 * @brief Bounded retry schedules with capped exponential growth.
 */

#include <algorithm>
#include <chrono>
#include <cstdint>

namespace kindling {
namespace helpers {
namespace backoff {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Retry ceiling and delay growth.
 *
 * A factor of 1.0 gives a fixed interval. Delays never exceed maxDelay.
 */
struct BackoffPolicy {
  std::uint32_t maxAttempts{10};                 ///< Total attempts, including the first
  std::chrono::milliseconds initialDelay{500};   ///< Delay after the first failed attempt
  double factor{1.5};                            ///< Growth per failed attempt
  std::chrono::milliseconds maxDelay{5000};      ///< Upper bound for any single delay

  /// Fixed-interval policy.
  [[nodiscard]] static BackoffPolicy fixed(std::uint32_t attempts,
                                           std::chrono::milliseconds delay) noexcept {
    return BackoffPolicy{attempts, delay, 1.0, delay};
  }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Delay that follows @p current under @p policy.
 * @note Monotonically non-decreasing for factor >= 1.0.
 */
[[nodiscard]] inline std::chrono::milliseconds
nextDelay(const BackoffPolicy& policy, std::chrono::milliseconds current) noexcept {
  const double GROWN = static_cast<double>(current.count()) * std::max(policy.factor, 1.0);
  const auto NEXT = std::chrono::milliseconds(static_cast<std::int64_t>(GROWN));
  return std::min(std::max(NEXT, current), policy.maxDelay);
}

/// Delay to wait after the first failed attempt.
[[nodiscard]] inline std::chrono::milliseconds firstDelay(const BackoffPolicy& policy) noexcept {
  return std::min(policy.initialDelay, policy.maxDelay);
}

} // namespace backoff
} // namespace helpers
} // namespace kindling

#endif // KINDLING_HELPERS_BACKOFF_HPP
