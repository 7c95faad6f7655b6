#pragma once

/// @file app_config.h
/// @brief Typed application configuration for insightx_chat

#include <filesystem>
#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "analysis/analysis_engine.h"
#include "common/config.h"
#include "common/logging.h"
#include "explain/explanation_synthesizer.h"
#include "extraction/intent_extractor.h"
#include "llm/openai_client.h"
#include "pipeline/chat_orchestrator.h"
#include "session/memory_session_store.h"
#include "session/session_manager.h"
#include "storage/redis/client.h"

namespace insightx::app {

enum class SessionStoreKind {
    kMemory,
    kRedis
};

/// @brief Every tunable of the chat service, grouped by component
struct AppConfig {
    std::filesystem::path data_path = "./data/transactions.csv";

    SessionStoreKind session_store = SessionStoreKind::kMemory;
    session::SessionManagerConfig session;
    session::MemorySessionStoreConfig memory_store;
    storage::RedisConfig redis;

    analysis::AnalysisEngineConfig analysis;
    extraction::IntentExtractorConfig extraction;
    explain::ExplanationSynthesizerConfig explanation;
    pipeline::ChatOrchestratorConfig chat;
    llm::OpenAIClientConfig llm;

    /// Workers running model calls
    size_t worker_threads = 4;

    LogConfig logging;

    /// @brief Map a layered Config onto the typed configuration
    /// @return kConfigurationError for values out of range
    static absl::StatusOr<AppConfig> FromConfig(const Config& config);

    /// @brief Load the optional YAML file, overlay INSIGHTX_* variables, map
    static absl::StatusOr<AppConfig> Load(const std::optional<std::filesystem::path>& path);

    absl::Status Validate() const;
};

}  // namespace insightx::app
