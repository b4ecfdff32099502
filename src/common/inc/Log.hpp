#ifndef KINDLING_COMMON_LOG_HPP
#define KINDLING_COMMON_LOG_HPP
/**
 * @file Log.hpp
 * @brief spdlog logger construction for kindling components.
 *
 * Components receive a std::shared_ptr<spdlog::logger> at construction and
 * never touch the spdlog default registry, so tests can run them silently.
 */

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace kindling {
namespace common {

/// Shared logger handle passed to every component.
using Logger = std::shared_ptr<spdlog::logger>;

/**
 * @brief Colored stderr logger.
 * @param name  Logger name shown in each record.
 * @param level Minimum level emitted.
 */
[[nodiscard]] Logger makeLogger(std::string_view name,
                                spdlog::level::level_enum level = spdlog::level::info);

/// Logger that discards every record.
[[nodiscard]] Logger makeNullLogger();

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off").
 * @return Level, or nullopt for an unrecognized name.
 */
[[nodiscard]] std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) noexcept;

} // namespace common
} // namespace kindling

#endif // KINDLING_COMMON_LOG_HPP
