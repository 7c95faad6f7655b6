/// @file main.cpp
/// @brief insightx_chat entry point: an interactive analytics chat over stdin

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <absl/strings/ascii.h>

#include "analysis/analysis_engine.h"
#include "app/app_config.h"
#include "common/logging.h"
#include "common/thread_pool.h"
#include "data/transaction_table.h"
#include "explain/explanation_synthesizer.h"
#include "extraction/intent_extractor.h"
#include "llm/openai_client.h"
#include "pipeline/chat_orchestrator.h"
#include "session/memory_session_store.h"
#include "session/redis_session_store.h"
#include "session/session_manager.h"
#include "storage/redis/client.h"

namespace {

constexpr const char* kVersion = "1.0.0";

void PrintHelp() {
    std::cerr << "Ask a question about the transactions, or:\n"
                 "  /new     start a new conversation\n"
                 "  /health  print component status\n"
                 "  /quit    exit\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"InsightX - conversational analytics over payment transactions"};

    std::string config_path;
    std::string data_path;
    std::string session_id = "cli";
    std::string log_level;
    bool pretty = false;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("-d,--data", data_path, "Transactions CSV (overrides data.path)");
    app.add_option("-s,--session", session_id, "Session id for this conversation");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_flag("-p,--pretty", pretty, "Indent JSON answers");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "insightx_chat v" << kVersion << std::endl;
        return 0;
    }

    std::optional<std::filesystem::path> path;
    if (!config_path.empty()) {
        path = config_path;
    }
    auto layered = insightx::LoadLayeredConfig(path);
    if (!layered.ok()) {
        std::cerr << "Failed to load config: " << layered.status().message() << std::endl;
        return 1;
    }
    if (!data_path.empty()) {
        layered->Set("data.path", data_path);
    }
    if (!log_level.empty()) {
        layered->Set("logging.level", log_level);
    }
    auto config = insightx::app::AppConfig::FromConfig(*layered);
    if (!config.ok()) {
        std::cerr << "Invalid configuration: " << config.status().message() << std::endl;
        return 1;
    }

    // Answers go to stdout; logs go to stderr so the two can be piped apart
    insightx::InitLogging(config->logging);
    INSIGHTX_LOG_INFO("insightx_chat v{} starting", kVersion);

    insightx::data::LoadSummary summary;
    auto table = insightx::data::TransactionTable::LoadCsv(
        config->data_path, insightx::data::DatasetSchema::Default(), &summary);
    if (!table.ok()) {
        INSIGHTX_LOG_CRITICAL("Failed to load dataset: {}", table.status().message());
        return 1;
    }

    auto pool = std::make_shared<insightx::ThreadPool>(config->worker_threads);
    auto model = std::make_shared<insightx::llm::OpenAIClient>(config->llm);
    auto engine = std::make_shared<insightx::analysis::AnalysisEngine>(*table, config->analysis);
    auto extractor =
        std::make_shared<insightx::extraction::IntentExtractor>(model, pool, config->extraction);
    auto explainer = std::make_shared<insightx::explain::ExplanationSynthesizer>(
        model, pool, config->explanation);

    std::shared_ptr<insightx::session::SessionStore> store;
    if (config->session_store == insightx::app::SessionStoreKind::kRedis) {
        auto redis = std::make_shared<insightx::storage::RedisClient>(config->redis);
        absl::Status status = redis->Connect();
        if (status.ok()) {
            status = redis->Ping();
        }
        if (!status.ok()) {
            INSIGHTX_LOG_CRITICAL("Session store unavailable: {}", status.message());
            return 1;
        }
        store = std::make_shared<insightx::session::RedisSessionStore>(
            redis, config->redis.default_ttl);
    } else {
        store = std::make_shared<insightx::session::MemorySessionStore>(config->memory_store);
    }
    auto sessions = std::make_shared<insightx::session::SessionManager>(store, config->session);

    insightx::pipeline::ChatOrchestrator chat(sessions, extractor, engine, explainer,
                                              config->chat);

    INSIGHTX_LOG_INFO("Ready: {} transactions, model {}, {} session store",
                      summary.rows_loaded, model->Name(), store->Name());
    PrintHelp();

    int indent = pretty ? 2 : -1;
    std::string line;
    while (std::getline(std::cin, line)) {
        std::string input(absl::StripAsciiWhitespace(line));
        if (input.empty()) {
            continue;
        }
        if (input == "/quit" || input == "/exit") {
            break;
        }
        if (input == "/help") {
            PrintHelp();
            continue;
        }
        if (input == "/health") {
            std::cout << chat.HealthSummary().dump(indent) << std::endl;
            continue;
        }
        if (input == "/new") {
            if (auto status = chat.NewChat(session_id); !status.ok()) {
                INSIGHTX_LOG_ERROR("Could not reset session: {}", status.message());
            } else {
                std::cerr << "Started a new conversation." << std::endl;
            }
            continue;
        }

        insightx::pipeline::Answer answer = chat.Handle(session_id, input);
        std::cout << insightx::pipeline::ToJson(answer).dump(indent) << std::endl;
    }

    INSIGHTX_LOG_INFO("insightx_chat shutting down");
    insightx::ShutdownLogging();
    return 0;
}
