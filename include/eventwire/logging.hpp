/**
 * @file logging.hpp
 * @brief Library logger.
 *
 * eventwire writes diagnostics through a single spdlog logger named
 * "eventwire". It discards everything until the host application installs
 * a logger of its own or calls init_logging_from_env().
 */

#ifndef EVENTWIRE_LOGGING_HPP
#define EVENTWIRE_LOGGING_HPP

#include <spdlog/logger.h>

#include <memory>

namespace eventwire {

/// Name of the library logger
inline constexpr const char* LOGGER_NAME = "eventwire";

/**
 * @brief Get the library logger.
 * @return Current logger (never null)
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Replace the library logger.
 *
 * Passing nullptr restores the silent default.
 *
 * @param new_logger Logger to route library messages to
 */
void set_logger(std::shared_ptr<spdlog::logger> new_logger);

/**
 * @brief Install a stderr logger configured from the environment.
 *
 * EVENTWIRE_LOG_LEVEL selects the level (spdlog level name, default "info"),
 * EVENTWIRE_LOG_PATTERN the output pattern.
 */
void init_logging_from_env();

} // namespace eventwire

#endif // EVENTWIRE_LOGGING_HPP
