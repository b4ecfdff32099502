/**
 * @file kindling-prepare.cpp
 * @brief Prepare a Kubernetes cluster for deployment.
 *
 * In development this provisions a local registry and a kind cluster wired
 * to it; other environments verify an existing cluster. Prints a readiness
 * report and exits 0 when ready, 1 on a fatal failure, 2 when not ready.
 */

#include "src/common/inc/Log.hpp"
#include "src/common/inc/Status.hpp"
#include "src/exec/inc/ProcessRunner.hpp"
#include "src/exec/inc/Sleeper.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/kube/inc/KubectlClient.hpp"
#include "src/net/inc/HttpClient.hpp"
#include "src/net/inc/PortScanner.hpp"
#include "src/platform/inc/HostInfo.hpp"
#include "src/platform/inc/Platform.hpp"
#include "src/prepare/inc/Environment.hpp"
#include "src/prepare/inc/Orchestrator.hpp"
#include "src/prepare/inc/PrepareConfig.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = kindling::helpers::args;
namespace prepare = kindling::prepare;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_ENV = 2,
  ARG_NAMESPACE = 3,
  ARG_PLATFORM = 4,
  ARG_LENIENT = 5,
  ARG_CONFIG = 6,
  ARG_VERBOSE = 7,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Prepare a Kubernetes cluster for deployment.\n"
    "development: local registry + kind cluster; staging/testing: verify only;\n"
    "production: verify, create namespace and service account.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_ENV] = {"--env", 1, false,
                  "development | staging | testing | production (default: development)"};
  map[ARG_NAMESPACE] = {"--namespace", 1, false, "Target namespace (default: default)"};
  map[ARG_PLATFORM] = {"--platform", 1, false, "Image build platform (default: linux/amd64)"};
  map[ARG_LENIENT] = {"--lenient", 0, false, "Warn instead of failing on platform mismatch"};
  map[ARG_CONFIG] = {"--config", 1, false, "YAML configuration file"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Debug logging on stderr"};
  return map;
}

/* ----------------------------- Output Functions ----------------------------- */

void printHumanOutput(const prepare::PrepareOutcome& outcome) {
  fmt::print("Cluster Preparation\n");
  fmt::print("===================\n\n");
  fmt::print("{}", outcome.report.toString());

  if (!outcome.status.ok()) {
    fmt::print("\n\033[31m{}\033[0m\n", outcome.status.toString());
  }

  const char* color = outcome.report.ready ? "\033[32m" : "\033[31m";
  fmt::print("\n{}{}\033[0m\n", color, outcome.report.summary());
}

void printJsonOutput(const prepare::PrepareOutcome& outcome) {
  if (!outcome.status.ok()) {
    fmt::print(stderr, "{}\n", outcome.status.toString());
  }
  fmt::print("{}", outcome.report.toJson());
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (args::hasFlag(pargs, ARG_HELP)) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  const bool JSON_OUTPUT = args::hasFlag(pargs, ARG_JSON);

  prepare::PrepareRequest request;
  request.strict = !args::hasFlag(pargs, ARG_LENIENT);

  if (const auto ENV = args::flagValue(pargs, ARG_ENV)) {
    const auto PARSED = prepare::parseEnvironment(*ENV);
    if (!PARSED) {
      fmt::print(stderr, "Error: unknown environment '{}'\n", *ENV);
      return 1;
    }
    request.environment = *PARSED;
  }
  if (const auto NS = args::flagValue(pargs, ARG_NAMESPACE)) {
    request.ns = std::string(*NS);
  }
  if (const auto PLATFORM = args::flagValue(pargs, ARG_PLATFORM)) {
    const auto PARSED = kindling::platform::parsePlatform(*PLATFORM);
    if (!PARSED) {
      fmt::print(stderr, "Error: unsupported platform '{}'\n", *PLATFORM);
      return 1;
    }
    request.target = *PARSED;
  }

  prepare::PrepareConfig config;
  if (const auto PATH = args::flagValue(pargs, ARG_CONFIG)) {
    const kindling::common::Status LOADED = prepare::loadConfig(std::string(*PATH), config);
    if (!LOADED.ok()) {
      fmt::print(stderr, "{}\n", LOADED.toString());
      return 1;
    }
  }

  spdlog::level::level_enum level =
      args::hasFlag(pargs, ARG_VERBOSE) ? spdlog::level::debug : spdlog::level::info;
  if (config.logLevel) {
    level = *config.logLevel;
  }
  const kindling::common::Logger LOG = kindling::common::makeLogger("kindling", level);

  kindling::exec::ProcessRunner runner(LOG);
  kindling::net::CurlHttpClient http;
  kindling::exec::ThreadSleeper sleeper;
  kindling::net::BindPortScanner ports;
  kindling::kube::KubectlClient kube(runner, LOG, config.clusterOptions.commandTimeout);

  prepare::Orchestrator orchestrator(runner, http, sleeper, ports, kube,
                                     kindling::platform::getHostInfo(), LOG, config);
  const prepare::PrepareOutcome OUTCOME = orchestrator.prepare(request);

  if (JSON_OUTPUT) {
    printJsonOutput(OUTCOME);
  } else {
    printHumanOutput(OUTCOME);
  }

  // Exit code: 0=ready, 1=fatal, 2=not ready
  if (!OUTCOME.status.ok()) {
    return 1;
  }
  return OUTCOME.report.ready ? 0 : 2;
}
