#ifndef KINDLING_EXEC_FAKE_COMMAND_RUNNER_HPP
#define KINDLING_EXEC_FAKE_COMMAND_RUNNER_HPP
/**
 * @file FakeCommandRunner.hpp
 * @brief Scripted CommandRunner and recording Sleeper for unit tests.
 *
 * Rules match on a substring of CommandLine::display(). The most recently
 * added matching rule wins. A rule may hold a sequence of results; the last
 * result repeats once the sequence is exhausted. Unmatched commands fail
 * with exit code 1.
 */

#include "src/exec/inc/CommandRunner.hpp"
#include "src/exec/inc/Sleeper.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace kindling {
namespace exec {
namespace testing {

class FakeCommandRunner final : public CommandRunner {
public:
  using CommandRunner::run;

  /// Respond to commands containing @p pattern with @p result.
  FakeCommandRunner& on(std::string pattern, CmdResult result) {
    rules_.push_back(Rule{std::move(pattern), {std::move(result)}, 0});
    return *this;
  }

  /// Respond with successive results; the last one repeats.
  FakeCommandRunner& onSequence(std::string pattern, std::vector<CmdResult> results) {
    rules_.push_back(Rule{std::move(pattern), std::move(results), 0});
    return *this;
  }

  CmdResult run(const CommandLine& cmd, std::chrono::milliseconds /*timeout*/) override {
    const std::string LINE = cmd.display();
    calls_.push_back(LINE);
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
      if (LINE.find(it->pattern) == std::string::npos || it->results.empty()) {
        continue;
      }
      const std::size_t IDX = std::min(it->next, it->results.size() - 1);
      ++it->next;
      return it->results[IDX];
    }
    return CmdResult::failure("no rule for: " + LINE);
  }

  /// Every command line executed, in order.
  [[nodiscard]] const std::vector<std::string>& calls() const noexcept { return calls_; }

  /// Number of executed commands containing @p pattern.
  [[nodiscard]] std::size_t count(const std::string& pattern) const {
    return static_cast<std::size_t>(
        std::count_if(calls_.begin(), calls_.end(), [&](const std::string& c) {
          return c.find(pattern) != std::string::npos;
        }));
  }

private:
  struct Rule {
    std::string pattern;
    std::vector<CmdResult> results;
    std::size_t next;
  };

  std::vector<Rule> rules_;
  std::vector<std::string> calls_;
};

/// Sleeper that records requested delays without blocking.
class RecordingSleeper final : public Sleeper {
public:
  void sleepFor(std::chrono::milliseconds delay) override { delays_.push_back(delay); }

  [[nodiscard]] const std::vector<std::chrono::milliseconds>& delays() const noexcept {
    return delays_;
  }

private:
  std::vector<std::chrono::milliseconds> delays_;
};

} // namespace testing
} // namespace exec
} // namespace kindling

#endif // KINDLING_EXEC_FAKE_COMMAND_RUNNER_HPP
