#pragma once

/**
 * @file logger.hpp
 * @brief Logging utilities for confflags
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>

#include "common/config.hpp"

namespace confflags {

/**
 * @brief Logger wrapper for confflags
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param name Logger name
     * @param level Log level (trace, debug, info, warn, error, critical)
     */
    static void init(const std::string& name = config::kLoggerName,
                     spdlog::level::level_enum level = config::kDefaultLogLevel);

    /**
     * @brief Get the logger instance
     */
    static std::shared_ptr<spdlog::logger>& get();

    static void set_level(spdlog::level::level_enum level);

    /**
     * @brief Shutdown the logging system
     */
    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros for logging
#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(confflags::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(confflags::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(confflags::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(confflags::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(confflags::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(confflags::Logger::get(), __VA_ARGS__)

}  // namespace confflags
