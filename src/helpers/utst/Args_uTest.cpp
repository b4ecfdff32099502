/**
 * @file Args_uTest.cpp
 * @brief Unit tests for kindling::helpers::args.
 */

#include "src/helpers/inc/Args.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string>
#include <string_view>

using kindling::helpers::args::ArgMap;
using kindling::helpers::args::flagValue;
using kindling::helpers::args::hasFlag;
using kindling::helpers::args::ParsedArgs;
using kindling::helpers::args::parseArgs;

namespace {

enum : std::uint8_t { ARG_ENV = 0, ARG_JSON = 1, ARG_NS = 2 };

const ArgMap MAP = {
    {ARG_ENV, {"--env", 1, true, "Environment"}},
    {ARG_JSON, {"--json", 0, false, "JSON output"}},
    {ARG_NS, {"--namespace", 1, false, "Namespace"}},
};

} // namespace

/** @test Both value spellings parse. */
TEST(ArgsTest, ValueSpellings) {
  const std::array<std::string_view, 4> ARGV{"--env", "dev", "--namespace=apps", "--json"};
  ParsedArgs pargs;
  std::string error;
  ASSERT_TRUE(parseArgs(ARGV, MAP, pargs, error)) << error;
  EXPECT_EQ(flagValue(pargs, ARG_ENV), "dev");
  EXPECT_EQ(flagValue(pargs, ARG_NS), "apps");
  EXPECT_TRUE(hasFlag(pargs, ARG_JSON));
}

/** @test Unknown flags are rejected by name. */
TEST(ArgsTest, UnknownFlag) {
  const std::array<std::string_view, 3> ARGV{"--env", "dev", "--namepsace"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGV, MAP, pargs, error));
  EXPECT_NE(error.find("--namepsace"), std::string::npos);
}

/** @test Missing value and missing required flag both fail. */
TEST(ArgsTest, MissingPieces) {
  ParsedArgs pargs;
  std::string error;
  const std::array<std::string_view, 1> DANGLING{"--env"};
  EXPECT_FALSE(parseArgs(DANGLING, MAP, pargs, error));

  const std::array<std::string_view, 1> NO_ENV{"--json"};
  EXPECT_FALSE(parseArgs(NO_ENV, MAP, pargs, error));
  EXPECT_NE(error.find("--env"), std::string::npos);
}

/** @test Zero-arity flags refuse inline values. */
TEST(ArgsTest, InlineValueOnBooleanFlag) {
  const std::array<std::string_view, 3> ARGV{"--env=dev", "--json=yes", "x"};
  ParsedArgs pargs;
  std::string error;
  EXPECT_FALSE(parseArgs(ARGV, MAP, pargs, error));
}
