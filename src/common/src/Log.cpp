/**
 * @file Log.cpp
 * @brief spdlog sink wiring.
 */

#include "src/common/inc/Log.hpp"

#include <string>
#include <utility>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace kindling {

namespace common {

Logger makeLogger(std::string_view name, spdlog::level::level_enum level) {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(std::string(name), std::move(sink));
  logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  logger->set_level(level);
  return logger;
}

Logger makeNullLogger() {
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>("null", std::move(sink));
  logger->set_level(spdlog::level::off);
  return logger;
}

std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) noexcept {
  if (name == "trace") {
    return spdlog::level::trace;
  }
  if (name == "debug") {
    return spdlog::level::debug;
  }
  if (name == "info") {
    return spdlog::level::info;
  }
  if (name == "warn" || name == "warning") {
    return spdlog::level::warn;
  }
  if (name == "error") {
    return spdlog::level::err;
  }
  if (name == "off") {
    return spdlog::level::off;
  }
  return std::nullopt;
}

} // namespace common

} // namespace kindling
