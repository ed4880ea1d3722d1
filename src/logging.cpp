/**
 * @file logging.cpp
 * @brief Library logger setup.
 */

#include <eventwire/logging.hpp>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <mutex>
#include <string>
#include <utility>

namespace eventwire {

namespace {

constexpr const char* DEFAULT_PATTERN = "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_null_logger() {
    return std::make_shared<spdlog::logger>(LOGGER_NAME,
                                            std::make_shared<spdlog::sinks::null_sink_mt>());
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> slot = make_null_logger();
    return slot;
}

std::string resolve_level() {
    if (const char* level = std::getenv("EVENTWIRE_LOG_LEVEL")) {
        return level;
    }
    return "info";
}

std::string resolve_pattern() {
    if (const char* pattern = std::getenv("EVENTWIRE_LOG_PATTERN")) {
        return pattern;
    }
    return DEFAULT_PATTERN;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return logger_slot();
}

void set_logger(std::shared_ptr<spdlog::logger> new_logger) {
    if (!new_logger) {
        new_logger = make_null_logger();
    }
    std::lock_guard<std::mutex> lock(logger_mutex());
    logger_slot() = std::move(new_logger);
}

void init_logging_from_env() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto stderr_logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    stderr_logger->set_level(spdlog::level::from_str(resolve_level()));
    stderr_logger->set_pattern(resolve_pattern());
    set_logger(std::move(stderr_logger));
}

} // namespace eventwire
