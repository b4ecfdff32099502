/**
 * @file ProbePod.cpp
 * @brief kubectl run/delete for registry probe pods.
 */

#include "src/registry/inc/ProbePod.hpp"
#include "src/common/inc/Defaults.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <utility>

namespace kindling {

namespace registry {

namespace {

using common::PROBE_FAILED_MARKER;
using common::PROBE_OK_MARKER;
using common::REGISTRY_CONTAINER_NAME;
using exec::CmdResult;
using exec::CommandLine;
using helpers::strings::contains;
using helpers::strings::findIpv4;
using helpers::strings::splitLines;

/// Common "kubectl run" prefix for a one-shot pod.
CommandLine runCommand(const naming::ResourceName& pod) {
  CommandLine cmd("kubectl");
  cmd.arg("run").arg(pod).arg("--restart=Never").arg("--rm").arg("-i").arg("--quiet").arg(
      "--pod-running-timeout=30s");
  return cmd;
}

} // namespace

/* ----------------------------- Parsing ----------------------------- */

std::string parseResolvedAddress(std::string_view nslookupOutput) {
  const auto LINES = splitLines(nslookupOutput);

  bool afterName = false;
  std::string fallback;
  for (const std::string& line : LINES) {
    if (line.rfind("Name:", 0) == 0) {
      afterName = true;
      continue;
    }
    if (line.rfind("Address", 0) != 0) {
      continue;
    }
    const std::size_t COLON = line.find(':');
    if (COLON == std::string::npos) {
      continue;
    }
    const std::string ADDR = findIpv4(std::string_view(line).substr(COLON + 1));
    if (ADDR.empty()) {
      continue;
    }
    if (afterName) {
      return ADDR;
    }
    fallback = ADDR;
  }
  // Without a Name: line there is no way to tell server from answer
  return afterName ? std::string() : fallback;
}

/* ----------------------------- ProbePod ----------------------------- */

std::optional<ProbePod> ProbePod::create(exec::CommandRunner& runner, common::Logger log,
                                         std::chrono::milliseconds timeout,
                                         std::uint32_t sequence) {
  const naming::NameCheck CHECK = naming::validateName(
      fmt::format("registry-probe-{}-{}", helpers::clock::getEpochMs(), sequence));
  if (!CHECK.ok()) {
    log->error("Generated probe pod name rejected: {}", CHECK.detail);
    return std::nullopt;
  }
  return ProbePod(runner, std::move(log), timeout, *CHECK.name);
}

ProbePod::ProbePod(exec::CommandRunner& runner, common::Logger log,
                   std::chrono::milliseconds timeout, naming::ResourceName name)
    : runner_(&runner), log_(std::move(log)), timeout_(timeout), name_(std::move(name)) {}

ProbePod::ProbePod(ProbePod&& other) noexcept
    : runner_(other.runner_), log_(std::move(other.log_)), timeout_(other.timeout_),
      name_(other.name_), owned_(other.owned_) {
  other.owned_ = false;
}

ProbePod::~ProbePod() {
  if (!owned_) {
    return;
  }
  CommandLine cmd("kubectl");
  cmd.arg("delete").arg("pod").arg(name_).arg("--ignore-not-found=true").arg("--wait=false");
  const CmdResult R = runner_->run(cmd);
  if (!R.ok()) {
    log_->warn("Failed to clean up probe pod {}: {}", name_, helpers::strings::trim(R.err));
  }
}

ProbeOutcome ProbePod::probeHttp() {
  CommandLine cmd = runCommand(name_);
  cmd.arg(common::HTTP_PROBE_IMAGE)
      .arg("--command")
      .arg("--")
      .arg("sh")
      .arg("-c")
      .argf("curl -sf --max-time 10 http://{}:{}/v2/ && echo {} || echo {}",
            REGISTRY_CONTAINER_NAME, common::REGISTRY_INTERNAL_PORT, PROBE_OK_MARKER,
            PROBE_FAILED_MARKER);
  return interpret(runner_->run(cmd, timeout_));
}

ProbeOutcome ProbePod::probeDns() {
  CommandLine cmd = runCommand(name_);
  cmd.arg(common::DNS_PROBE_IMAGE)
      .arg("--command")
      .arg("--")
      .arg("sh")
      .arg("-c")
      .argf("nslookup {} && echo {} || echo {}", REGISTRY_CONTAINER_NAME, PROBE_OK_MARKER,
            PROBE_FAILED_MARKER);
  return interpret(runner_->run(cmd, timeout_));
}

ProbeOutcome ProbePod::interpret(const CmdResult& result) const {
  ProbeOutcome outcome;
  outcome.output = result.out;
  if (result.timedOut) {
    log_->debug("Probe pod {} timed out", name_);
    return outcome;
  }
  outcome.succeeded =
      contains(result.out, PROBE_OK_MARKER) && !contains(result.out, PROBE_FAILED_MARKER);
  if (!outcome.succeeded) {
    log_->debug("Probe pod {} output: {} {}", name_, result.out, result.err);
  }
  return outcome;
}

} // namespace registry

} // namespace kindling
