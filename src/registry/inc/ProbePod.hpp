#ifndef KINDLING_REGISTRY_PROBE_POD_HPP
#define KINDLING_REGISTRY_PROBE_POD_HPP
/**
 * @file ProbePod.hpp
 * @brief Disposable in-cluster pods that test registry reachability and DNS.
 *
 * A ProbePod owns one pod name for its lifetime. The destructor always asks
 * the cluster to delete the pod, whether the probe succeeded, failed or
 * timed out. Cleanup failures are logged and never propagate.
 */

#include "src/common/inc/Log.hpp"
#include "src/exec/inc/CommandRunner.hpp"
#include "src/naming/inc/ResourceName.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kindling {
namespace registry {

/* ----------------------------- ProbeOutcome ----------------------------- */

/**
 * @brief Interpreted result of one probe pod run.
 */
struct ProbeOutcome {
  bool succeeded{false}; ///< Success marker seen and failure marker absent
  std::string output;    ///< Combined pod output
};

/**
 * @brief Extract the address a name resolved to from nslookup output.
 *
 * Accepts both busybox formats ("Address 1: 10.0.0.5 name" and
 * "Address: 10.0.0.5"). Server addresses listed before the "Name:" line are
 * skipped.
 *
 * @return IPv4 text, or empty string when none is found.
 */
[[nodiscard]] std::string parseResolvedAddress(std::string_view nslookupOutput);

/* ----------------------------- ProbePod ----------------------------- */

class ProbePod {
public:
  /**
   * @brief Reserve a uniquely named probe pod.
   * @param sequence Distinguishes pods created within the same millisecond.
   * @return ProbePod, or nullopt if the generated name fails validation.
   */
  [[nodiscard]] static std::optional<ProbePod> create(exec::CommandRunner& runner,
                                                      common::Logger log,
                                                      std::chrono::milliseconds timeout,
                                                      std::uint32_t sequence);

  ProbePod(const ProbePod&) = delete;
  ProbePod& operator=(const ProbePod&) = delete;
  ProbePod(ProbePod&& other) noexcept;
  ProbePod& operator=(ProbePod&&) = delete;
  ~ProbePod();

  /// HTTP GET of the registry's internal /v2/ endpoint from inside the cluster.
  [[nodiscard]] ProbeOutcome probeHttp();

  /// nslookup of the registry container name from inside the cluster.
  [[nodiscard]] ProbeOutcome probeDns();

  [[nodiscard]] const naming::ResourceName& name() const noexcept { return name_; }

private:
  ProbePod(exec::CommandRunner& runner, common::Logger log, std::chrono::milliseconds timeout,
           naming::ResourceName name);

  [[nodiscard]] ProbeOutcome interpret(const exec::CmdResult& result) const;

  exec::CommandRunner* runner_;
  common::Logger log_;
  std::chrono::milliseconds timeout_;
  naming::ResourceName name_;
  bool owned_{true};
};

} // namespace registry
} // namespace kindling

#endif // KINDLING_REGISTRY_PROBE_POD_HPP
