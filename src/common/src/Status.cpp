/**
 * @file Status.cpp
 * @brief Status construction and rendering.
 */

#include "src/common/inc/Status.hpp"

#include <utility>

#include <fmt/core.h>

namespace kindling {

namespace common {

/* ----------------------------- ErrorKind toString ----------------------------- */

const char* toString(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::NONE:
    return "none";
  case ErrorKind::VALIDATION:
    return "validation";
  case ErrorKind::CONNECTIVITY:
    return "connectivity";
  case ErrorKind::PERMISSION:
    return "permission";
  case ErrorKind::PLATFORM_MISMATCH:
    return "platform-mismatch";
  case ErrorKind::PROVISIONING:
    return "provisioning";
  }
  return "unknown";
}

/* ----------------------------- Status ----------------------------- */

Status Status::failure(ErrorKind kind, std::string message, std::string hint,
                       std::string resolution) {
  Status status;
  status.kind = kind;
  status.guidance.message = std::move(message);
  status.guidance.hint = std::move(hint);
  status.guidance.resolution = std::move(resolution);
  return status;
}

std::string Status::toString() const {
  if (ok()) {
    return "OK\n";
  }

  std::string out;
  out += fmt::format("Error ({}): {}\n", common::toString(kind), guidance.message);
  if (!guidance.hint.empty()) {
    out += fmt::format("  Hint:       {}\n", guidance.hint);
  }
  if (!guidance.resolution.empty()) {
    out += fmt::format("  Resolution: {}\n", guidance.resolution);
  }
  return out;
}

} // namespace common

} // namespace kindling
