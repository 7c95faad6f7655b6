/// @file app_config.cpp
/// @brief AppConfig mapping and validation

#include "app/app_config.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace insightx::app {

namespace {

absl::Status ConfigError(std::string_view key, std::string_view problem) {
    return MakeError(ErrorCode::kConfigurationError, absl::StrCat(key, ": ", problem));
}

}  // namespace

absl::StatusOr<AppConfig> AppConfig::FromConfig(const Config& config) {
    AppConfig app;

    app.data_path = config.GetString("data.path", app.data_path.string());

    // Session
    std::string store = absl::AsciiStrToLower(config.GetString("session.store", "memory"));
    if (store == "memory") {
        app.session_store = SessionStoreKind::kMemory;
    } else if (store == "redis") {
        app.session_store = SessionStoreKind::kRedis;
    } else {
        return ConfigError("session.store", absl::StrCat("unknown store '", store, "'"));
    }

    int64_t context_window = config.GetInt("session.context_window", 6);
    int64_t max_sessions = config.GetInt("session.max_sessions", 1000);
    int64_t idle_ttl = config.GetInt("session.idle_ttl_seconds", 86400);
    int64_t per_minute = config.GetInt("rate_limit.requests_per_minute", 10);
    if (context_window < 1) return ConfigError("session.context_window", "must be at least 1");
    if (max_sessions < 1) return ConfigError("session.max_sessions", "must be at least 1");
    if (idle_ttl < 1) return ConfigError("session.idle_ttl_seconds", "must be positive");
    if (per_minute < 1) {
        return ConfigError("rate_limit.requests_per_minute", "must be at least 1");
    }
    app.session.context_window = static_cast<size_t>(context_window);
    app.session.requests_per_minute = static_cast<size_t>(per_minute);
    app.memory_store.max_sessions = static_cast<size_t>(max_sessions);
    app.memory_store.idle_ttl = absl::Seconds(idle_ttl);
    app.extraction.context_turns = app.session.context_window;

    // Redis
    app.redis.host = config.GetString("redis.host", app.redis.host);
    int64_t port = config.GetInt("redis.port", app.redis.port);
    if (port < 1 || port > 65535) return ConfigError("redis.port", "must be in 1..65535");
    app.redis.port = static_cast<uint16_t>(port);
    app.redis.password = config.GetString("redis.password", "");
    app.redis.database = static_cast<int>(config.GetInt("redis.database", 0));
    app.redis.default_ttl = std::chrono::seconds(idle_ttl);

    // Analysis
    int64_t top_k = config.GetInt("analysis.top_k", 5);
    int64_t query_timeout = config.GetInt("analysis.query_timeout_ms", 2000);
    if (top_k < 1) return ConfigError("analysis.top_k", "must be at least 1");
    if (query_timeout < 1) return ConfigError("analysis.query_timeout_ms", "must be positive");
    app.analysis.default_top_k = static_cast<size_t>(top_k);
    app.analysis.max_top_k = std::max(app.analysis.max_top_k, app.analysis.default_top_k);
    app.analysis.query_timeout = std::chrono::milliseconds(query_timeout);

    // Extraction and chat
    app.chat.confidence_threshold = config.GetDouble("extraction.confidence_threshold", 0.6);
    if (app.chat.confidence_threshold < 0.0 || app.chat.confidence_threshold > 1.0) {
        return ConfigError("extraction.confidence_threshold", "must be in [0, 1]");
    }
    app.chat.max_message_length =
        static_cast<size_t>(config.GetInt("chat.max_message_length", 2000));

    // Model
    app.llm.endpoint = config.GetString("llm.endpoint", app.llm.endpoint);
    app.llm.model = config.GetString("llm.model", app.llm.model);
    app.llm.api_key = config.GetString("llm.api_key", "");
    int64_t llm_timeout = config.GetInt("llm.timeout_ms", 30000);
    int64_t retries = config.GetInt("llm.max_retries", 0);
    if (llm_timeout < 1) return ConfigError("llm.timeout_ms", "must be positive");
    if (retries < 0) return ConfigError("llm.max_retries", "must not be negative");
    app.llm.timeout = std::chrono::milliseconds(llm_timeout);
    app.llm.max_retries = static_cast<size_t>(retries);
    // Retries share the client's deadline, so one call never outlives it
    app.extraction.timeout = app.llm.timeout;
    app.explanation.timeout = app.llm.timeout;

    int64_t workers = config.GetInt("runtime.worker_threads", 4);
    if (workers < 1) return ConfigError("runtime.worker_threads", "must be at least 1");
    app.worker_threads = static_cast<size_t>(workers);

    // Logging
    app.logging.name = "insightx";
    app.logging.level = ParseLogLevel(config.GetString("logging.level", "info"));
    std::string log_file = config.GetString("logging.file", "");
    if (!log_file.empty()) {
        app.logging.enable_file = true;
        app.logging.file_path = log_file;
    }

    INSIGHTX_RETURN_IF_ERROR(app.Validate());
    return app;
}

absl::StatusOr<AppConfig> AppConfig::Load(const std::optional<std::filesystem::path>& path) {
    INSIGHTX_ASSIGN_OR_RETURN(Config config, LoadLayeredConfig(path));
    return FromConfig(config);
}

absl::Status AppConfig::Validate() const {
    if (data_path.empty()) {
        return ConfigError("data.path", "must be set");
    }
    if (llm.api_key.empty()) {
        return ConfigError("llm.api_key", "must be set (or export OPENAI_API_KEY)");
    }
    if (chat.max_message_length == 0) {
        return ConfigError("chat.max_message_length", "must be positive");
    }
    return absl::OkStatus();
}

}  // namespace insightx::app
