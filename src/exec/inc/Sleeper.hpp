#ifndef KINDLING_EXEC_SLEEPER_HPP
#define KINDLING_EXEC_SLEEPER_HPP
/**
 * @file Sleeper.hpp
 * @brief Injectable delay for retry loops.
 */

#include <chrono>
#include <thread>

namespace kindling {
namespace exec {

/**
 * @brief Blocks the calling thread between retry attempts.
 */
class Sleeper {
public:
  virtual ~Sleeper() = default;
  virtual void sleepFor(std::chrono::milliseconds delay) = 0;
};

/// Sleeper backed by std::this_thread::sleep_for.
class ThreadSleeper final : public Sleeper {
public:
  void sleepFor(std::chrono::milliseconds delay) override { std::this_thread::sleep_for(delay); }
};

} // namespace exec
} // namespace kindling

#endif // KINDLING_EXEC_SLEEPER_HPP
