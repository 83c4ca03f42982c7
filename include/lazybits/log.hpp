/**
 * @file log.hpp
 * @brief lazybits logging.
 *
 * The library logs through one named spdlog logger, "lazybits". It is
 * created on first use with a stderr sink at level warn unless the
 * application registered a logger under that name first.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_LOG_HPP
#define LAZYBITS_LOG_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace lazybits {

/// Name the library logger is registered under
inline constexpr const char* LOGGER_NAME = "lazybits";

/**
 * @brief Get the library logger.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the library logger level.
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace lazybits

#endif // LAZYBITS_LOG_HPP
