#ifndef KINDLING_EXEC_COMMAND_RUNNER_HPP
#define KINDLING_EXEC_COMMAND_RUNNER_HPP
/**
 * @file CommandRunner.hpp
 * @brief Subprocess execution seam.
 *
 * Every docker, kind and kubectl invocation goes through a CommandRunner so
 * the provisioning flow can be driven by a scripted fake in tests.
 */

#include "src/exec/inc/CommandLine.hpp"

#include <chrono>
#include <string>
#include <utility>

namespace kindling {
namespace exec {

/* ----------------------------- Constants ----------------------------- */

/// Exit code reported when the program could not be executed.
inline constexpr int EXIT_NOT_FOUND = 127;

/// Default per-command timeout.
inline constexpr std::chrono::milliseconds DEFAULT_COMMAND_TIMEOUT{30'000};

/* ----------------------------- CmdResult ----------------------------- */

/**
 * @brief Captured outcome of one subprocess.
 */
struct CmdResult {
  int exitCode{-1};      ///< Exit status, 128+signal when killed, -1 when not started
  std::string out;       ///< Captured stdout
  std::string err;       ///< Captured stderr
  bool timedOut{false};  ///< Killed at the deadline

  [[nodiscard]] bool ok() const noexcept { return exitCode == 0 && !timedOut; }

  /// Successful result with the given stdout.
  [[nodiscard]] static CmdResult success(std::string stdoutText = {}) {
    CmdResult r;
    r.exitCode = 0;
    r.out = std::move(stdoutText);
    return r;
  }

  /// Failed result with the given stderr.
  [[nodiscard]] static CmdResult failure(std::string stderrText = {}, int code = 1) {
    CmdResult r;
    r.exitCode = code;
    r.err = std::move(stderrText);
    return r;
  }
};

/* ----------------------------- CommandRunner ----------------------------- */

/**
 * @brief Executes a CommandLine and captures its output.
 *
 * Implementations never throw; launch failures are reported through
 * CmdResult::exitCode and CmdResult::err.
 */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * @brief Run @p cmd to completion or until @p timeout elapses.
   * @return Captured result. A timed-out process is killed and reaped.
   */
  [[nodiscard]] virtual CmdResult run(const CommandLine& cmd,
                                      std::chrono::milliseconds timeout) = 0;

  /// Run with DEFAULT_COMMAND_TIMEOUT.
  [[nodiscard]] CmdResult run(const CommandLine& cmd) { return run(cmd, DEFAULT_COMMAND_TIMEOUT); }
};

} // namespace exec
} // namespace kindling

#endif // KINDLING_EXEC_COMMAND_RUNNER_HPP
