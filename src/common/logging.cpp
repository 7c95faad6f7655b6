/// @file logging.cpp
/// @brief Process-wide spdlog logger for InsightX

#include "logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>

namespace insightx {

namespace {

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_logger;

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

std::vector<spdlog::sink_ptr> MakeSinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // Answers go to stdout, so diagnostics stay on stderr
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (config.enable_file) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size, config.max_files));
    }
    for (auto& sink : sinks) {
        sink->set_level(ToSpdlog(config.level));
    }
    return sinks;
}

/// Caller holds g_logger_mutex
void InstallLocked(const LogConfig& config) {
    auto sinks = MakeSinks(config);
    g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
    g_logger->set_level(ToSpdlog(config.level));
    g_logger->set_pattern(config.pattern);
    g_logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(g_logger);
}

}  // namespace

LogLevel ParseLogLevel(std::string_view name) {
    const std::string lower = absl::AsciiStrToLower(name);
    if (lower == "trace") return LogLevel::kTrace;
    if (lower == "debug") return LogLevel::kDebug;
    if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
    if (lower == "error") return LogLevel::kError;
    if (lower == "critical") return LogLevel::kCritical;
    if (lower == "off") return LogLevel::kOff;
    return LogLevel::kInfo;
}

void InitLogging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        InstallLocked(config);
    }
}

std::shared_ptr<spdlog::logger> GetLogger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!g_logger) {
        InstallLocked(LogConfig{});
    }
    return g_logger;
}

void ShutdownLogging() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace insightx
