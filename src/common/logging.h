#pragma once

/// @file logging.h
/// @brief InsightX logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace insightx {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "insightx";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "insightx.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 3;
};

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off")
/// @return The level, or kInfo for unrecognised names
LogLevel ParseLogLevel(std::string_view name);

/// @brief Install the process logger; a no-op while one is installed
void InitLogging(const LogConfig& config = {});

/// @brief The process logger, installed with defaults on first use
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Flush and drop the logger; the next GetLogger() installs a new one
void ShutdownLogging();

// Convenience macros for logging
#define INSIGHTX_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::insightx::GetLogger(), __VA_ARGS__)
#define INSIGHTX_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::insightx::GetLogger(), __VA_ARGS__)
#define INSIGHTX_LOG_INFO(...) SPDLOG_LOGGER_INFO(::insightx::GetLogger(), __VA_ARGS__)
#define INSIGHTX_LOG_WARN(...) SPDLOG_LOGGER_WARN(::insightx::GetLogger(), __VA_ARGS__)
#define INSIGHTX_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::insightx::GetLogger(), __VA_ARGS__)
#define INSIGHTX_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::insightx::GetLogger(), __VA_ARGS__)

}  // namespace insightx
