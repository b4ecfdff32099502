/**
 * @file ProcessRunner_uTest.cpp
 * @brief Unit tests for kindling::exec::ProcessRunner.
 *
 * Notes:
 *  - Uses coreutils binaries (true, false, echo, sleep, sh) present on any
 *    Linux build host.
 */

#include "src/common/inc/Log.hpp"
#include "src/exec/inc/ProcessRunner.hpp"

#include <gtest/gtest.h>

#include <chrono>

using kindling::common::makeNullLogger;
using kindling::exec::CmdResult;
using kindling::exec::CommandLine;
using kindling::exec::EXIT_NOT_FOUND;
using kindling::exec::ProcessRunner;

class ProcessRunnerTest : public ::testing::Test {
protected:
  ProcessRunner runner_{makeNullLogger()};
};

/** @test Zero exit status is success. */
TEST_F(ProcessRunnerTest, TrueSucceeds) {
  const CmdResult R = runner_.run(CommandLine("true"));
  EXPECT_TRUE(R.ok());
  EXPECT_EQ(R.exitCode, 0);
}

/** @test Non-zero exit status is reported. */
TEST_F(ProcessRunnerTest, FalseFails) {
  const CmdResult R = runner_.run(CommandLine("false"));
  EXPECT_FALSE(R.ok());
  EXPECT_EQ(R.exitCode, 1);
}

/** @test stdout is captured verbatim. */
TEST_F(ProcessRunnerTest, CapturesStdout) {
  CommandLine cmd("echo");
  cmd.arg("hello").arg("world");
  const CmdResult R = runner_.run(cmd);
  ASSERT_TRUE(R.ok());
  EXPECT_EQ(R.out, "hello world\n");
}

/** @test stderr is captured separately from stdout. */
TEST_F(ProcessRunnerTest, CapturesStderr) {
  CommandLine cmd("sh");
  cmd.arg("-c").arg("echo out; echo err 1>&2; exit 3");
  const CmdResult R = runner_.run(cmd);
  EXPECT_EQ(R.exitCode, 3);
  EXPECT_EQ(R.out, "out\n");
  EXPECT_EQ(R.err, "err\n");
}

/** @test Missing program exits with 127. */
TEST_F(ProcessRunnerTest, MissingProgram) {
  const CmdResult R = runner_.run(CommandLine("kindling-no-such-program"));
  EXPECT_EQ(R.exitCode, EXIT_NOT_FOUND);
}

/** @test A process outliving its timeout is killed. */
TEST_F(ProcessRunnerTest, TimeoutKills) {
  CommandLine cmd("sleep");
  cmd.arg("5");
  const auto START = std::chrono::steady_clock::now();
  const CmdResult R = runner_.run(cmd, std::chrono::milliseconds(200));
  const auto ELAPSED = std::chrono::steady_clock::now() - START;
  EXPECT_TRUE(R.timedOut);
  EXPECT_FALSE(R.ok());
  EXPECT_LT(ELAPSED, std::chrono::seconds(3));
}
