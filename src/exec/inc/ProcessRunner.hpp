#ifndef KINDLING_EXEC_PROCESS_RUNNER_HPP
#define KINDLING_EXEC_PROCESS_RUNNER_HPP
/**
 * @file ProcessRunner.hpp
 * @brief POSIX CommandRunner: fork, execvp, pipe capture, deadline kill.
 */

#include "src/common/inc/Log.hpp"
#include "src/exec/inc/CommandRunner.hpp"

#include <utility>

namespace kindling {
namespace exec {

/**
 * @brief Runs commands as child processes.
 *
 * stdout and stderr are drained concurrently through non-blocking pipes so a
 * chatty child cannot deadlock on a full pipe. stdin is /dev/null. At the
 * deadline the child receives SIGKILL and is reaped before returning.
 */
class ProcessRunner final : public CommandRunner {
public:
  explicit ProcessRunner(common::Logger log) : log_(std::move(log)) {}

  using CommandRunner::run;

  [[nodiscard]] CmdResult run(const CommandLine& cmd, std::chrono::milliseconds timeout) override;

private:
  common::Logger log_;
};

} // namespace exec
} // namespace kindling

#endif // KINDLING_EXEC_PROCESS_RUNNER_HPP
