/**
 * @file kindling-platform.cpp
 * @brief Platform compatibility report for image builds.
 *
 * Shows which platforms run natively or under emulation on this host and,
 * with --cluster, compares the target against the current cluster's nodes.
 */

#include "src/common/inc/Log.hpp"
#include "src/exec/inc/ProcessRunner.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/kube/inc/KubectlClient.hpp"
#include "src/platform/inc/HostInfo.hpp"
#include "src/platform/inc/Platform.hpp"
#include "src/platform/inc/PlatformValidator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace args = kindling::helpers::args;
namespace platform = kindling::platform;

using platform::Platform;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_TARGET = 2,
  ARG_HOST = 3,
  ARG_CLUSTER = 4,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Platform compatibility for container images.\n"
    "Lists what the host runs and checks a target against the live cluster.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_TARGET] = {"--target", 1, false, "Image build platform (default: linux/amd64)"};
  map[ARG_HOST] = {"--host", 1, false, "Host platform override (default: this machine)"};
  map[ARG_CLUSTER] = {"--cluster", 0, false, "Also validate against the current kubectl context"};
  return map;
}

/* ----------------------------- Report ----------------------------- */

struct PlatformRow {
  Platform candidate{Platform::LINUX_AMD64};
  platform::Compatibility compat{};
};

struct ClusterReport {
  bool attempted{false};
  platform::PlatformVerdict verdict{};
  std::vector<std::string> warnings;
};

std::vector<PlatformRow> hostMatrix(Platform host) {
  std::vector<PlatformRow> rows;
  rows.reserve(platform::ALL_PLATFORMS.size());
  for (const Platform P : platform::ALL_PLATFORMS) {
    rows.push_back(PlatformRow{P, platform::checkCompatibility(P, host)});
  }
  return rows;
}

const char* rowLabel(const platform::Compatibility& c) noexcept {
  if (!c.compatible) {
    return "no";
  }
  return c.requiresEmulation ? "compatible" : "native";
}

/* ----------------------------- Output Functions ----------------------------- */

void printHumanOutput(Platform host, Platform target, const std::vector<PlatformRow>& rows,
                      const ClusterReport& cluster) {
  fmt::print("Platform Compatibility\n");
  fmt::print("======================\n\n");
  fmt::print("Host:   {}\n", platform::toString(host));
  fmt::print("Target: {}\n\n", platform::toString(target));

  for (const PlatformRow& row : rows) {
    const char* COLOR = row.compat.compatible ? "\033[32m" : "\033[90m";
    fmt::print("  {:<16} {}{}\033[0m{}\n", platform::toString(row.candidate), COLOR,
               rowLabel(row.compat), row.candidate == target ? "  <- target" : "");
  }

  if (!cluster.attempted) {
    return;
  }
  fmt::print("\nCluster: {}\n", cluster.verdict.toString());
  for (const std::string& w : cluster.warnings) {
    fmt::print("  \033[33m-> {}\033[0m\n", w);
  }
}

void printJsonOutput(Platform host, Platform target, const std::vector<PlatformRow>& rows,
                     const ClusterReport& cluster) {
  using kindling::helpers::strings::jsonEscape;

  fmt::print("{{\n");
  fmt::print("  \"host\": \"{}\",\n", platform::toString(host));
  fmt::print("  \"target\": \"{}\",\n", platform::toString(target));

  fmt::print("  \"platforms\": [\n");
  for (std::size_t i = 0; i < rows.size(); ++i) {
    const PlatformRow& ROW = rows[i];
    fmt::print("    {{\"platform\": \"{}\", \"compatible\": {}, \"requiresEmulation\": {}}}{}\n",
               platform::toString(ROW.candidate), ROW.compat.compatible,
               ROW.compat.requiresEmulation, (i + 1 < rows.size()) ? "," : "");
  }
  fmt::print("  ]");

  if (cluster.attempted) {
    const platform::PlatformVerdict& V = cluster.verdict;
    fmt::print(",\n  \"cluster\": {{\n");
    if (V.cluster) {
      fmt::print("    \"platform\": \"{}\",\n", platform::toString(*V.cluster));
    } else {
      fmt::print("    \"platform\": null,\n");
    }
    fmt::print("    \"compatible\": {},\n", V.compatible);
    fmt::print("    \"requiresEmulation\": {},\n", V.requiresEmulation);
    fmt::print("    \"verified\": {},\n", V.verified);
    fmt::print("    \"warnings\": [");
    for (std::size_t i = 0; i < cluster.warnings.size(); ++i) {
      fmt::print("{}\"{}\"", i == 0 ? "" : ", ", jsonEscape(cluster.warnings[i]));
    }
    fmt::print("]\n  }}");
  }
  fmt::print("\n}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
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

  Platform target = Platform::LINUX_AMD64;
  if (const auto TEXT = args::flagValue(pargs, ARG_TARGET)) {
    const auto PARSED = platform::parsePlatform(*TEXT);
    if (!PARSED) {
      fmt::print(stderr, "Error: unsupported platform '{}'\n", *TEXT);
      return 1;
    }
    target = *PARSED;
  }

  const platform::HostInfo HOST_INFO = platform::getHostInfo();
  std::optional<Platform> host = HOST_INFO.nativePlatform();
  if (const auto TEXT = args::flagValue(pargs, ARG_HOST)) {
    host = platform::parsePlatform(*TEXT);
    if (!host) {
      fmt::print(stderr, "Error: unsupported platform '{}'\n", *TEXT);
      return 1;
    }
  }
  if (!host) {
    fmt::print(stderr, "Error: unsupported host architecture '{}'\n", HOST_INFO.machine);
    return 1;
  }

  ClusterReport cluster;
  if (args::hasFlag(pargs, ARG_CLUSTER)) {
    const kindling::common::Logger LOG = kindling::common::makeLogger("kindling");
    kindling::exec::ProcessRunner runner(LOG);
    kindling::kube::KubectlClient kube(runner, LOG);
    platform::PlatformValidator validator(kube, HOST_INFO, LOG);
    cluster.attempted = true;
    // Lenient: mismatches are reported through warnings and the exit code
    const kindling::common::Status STATUS =
        validator.validate(target, false, cluster.verdict, cluster.warnings);
    if (!STATUS.ok()) {
      fmt::print(stderr, "{}\n", STATUS.toString());
      return 1;
    }
  }

  const std::vector<PlatformRow> ROWS = hostMatrix(*host);
  if (args::hasFlag(pargs, ARG_JSON)) {
    printJsonOutput(*host, target, ROWS, cluster);
  } else {
    printHumanOutput(*host, target, ROWS, cluster);
  }

  // Exit code: 0=target runs where checked, 2=incompatible
  const bool HOST_OK = platform::checkCompatibility(target, *host).compatible;
  const bool CLUSTER_OK = !cluster.attempted || cluster.verdict.compatible;
  return (HOST_OK && CLUSTER_OK) ? 0 : 2;
}
