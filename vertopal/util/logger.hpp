#ifndef VERTOPAL_LOGGER_HPP
#define VERTOPAL_LOGGER_HPP
#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <memory>

namespace vertopal {
    namespace logging {
        // Get/set the logger instance used by the library
        inline std::shared_ptr<spdlog::logger>& get_logger() {
            static std::shared_ptr<spdlog::logger> logger;
            return logger;
        }

        // Set a custom logger for the library
        inline void set_logger(std::shared_ptr<spdlog::logger> logger) {
            get_logger() = std::move(logger);
        }

        // Enable logging with default console logger (stderr, so piped output stays clean)
        inline void enable() {
            auto& logger = get_logger();
            if (!logger) {
                logger = spdlog::get("vertopal");
                if (!logger) {
                    logger = spdlog::stderr_color_mt("vertopal");
                }
                logger->set_level(spdlog::level::info);
                // Pattern: time [level:8] [thread_id] message
                logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%-8l%$] [%t] %v");
            }
        }

        // Set log level for the library logger
        inline void set_log_level(spdlog::level::level_enum level) {
            if (auto logger = get_logger()) {
                logger->set_level(level);
            }
        }

        // Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
        inline spdlog::level::level_enum parse_level(const std::string& name,
                                                     spdlog::level::level_enum fallback = spdlog::level::info) {
            auto level = spdlog::level::from_str(name);
            // from_str returns off for unknown names
            if (level == spdlog::level::off && name != "off") {
                return fallback;
            }
            return level;
        }

        // Disable logging completely
        inline void disable() {
            set_logger(nullptr);
        }
    }
}

// Internal macro that uses the installed logger if available
#define VERTOPAL_LOG_IMPL(level, ...) \
    do { \
        if (auto _logger = vertopal::logging::get_logger()) { \
            _logger->log(level, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...)     VERTOPAL_LOG_IMPL(spdlog::level::info, __VA_ARGS__)
#define LOG_ERROR(...)    VERTOPAL_LOG_IMPL(spdlog::level::err, __VA_ARGS__)
#define LOG_WARNING(...)  VERTOPAL_LOG_IMPL(spdlog::level::warn, __VA_ARGS__)
#define LOG_DEBUG(...)    VERTOPAL_LOG_IMPL(spdlog::level::debug, __VA_ARGS__)
#define LOG_TRACE(...)    VERTOPAL_LOG_IMPL(spdlog::level::trace, __VA_ARGS__)

// Library specific macros
#define VERTOPAL_LOG(...)                LOG_INFO(__VA_ARGS__)
#define VERTOPAL_LOG_TAG(TAG, FMT, ...)  LOG_INFO("[{}] " FMT, TAG __VA_OPT__(,) __VA_ARGS__)
#define VERTOPAL_LOG_ERROR(...)          LOG_ERROR(__VA_ARGS__)
#define VERTOPAL_LOG_ERROR_TAG(TAG, FMT, ...) LOG_ERROR("[{}] " FMT, TAG __VA_OPT__(,) __VA_ARGS__)

#endif
