#pragma once

/// @file chat_orchestrator.h
/// @brief Per-request state machine from message to Answer

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "analysis/analysis_engine.h"
#include "explain/explanation_synthesizer.h"
#include "extraction/intent_extractor.h"
#include "pipeline/answer.h"
#include "session/session_manager.h"

namespace insightx::pipeline {

struct ChatOrchestratorConfig {
    /// Messages longer than this are rejected before any other work
    size_t max_message_length = 2000;

    /// Extracted intents below this confidence get a clarification
    double confidence_threshold = 0.6;
};

struct ChatOrchestratorStats {
    uint64_t requests = 0;
    uint64_t analyses = 0;
    uint64_t clarifications = 0;
    uint64_t rejections = 0;
    uint64_t rate_limited = 0;
    uint64_t failures = 0;
    uint64_t malformed = 0;
};

/// @brief Guardrail controller for chat requests
///
/// RECEIVED -> RATE_CHECK -> EXTRACT -> one of
///   VALID -> RESOLVE -> EXPLAIN -> RESPOND
///   AMBIGUOUS -> CLARIFY -> RESPOND
///   UNSUPPORTED -> REJECT -> RESPOND
///
/// Every request yields exactly one Answer and, once admitted by the rate
/// limiter, exactly one session turn. Malformed messages and rate-limited
/// requests leave the session untouched. No error escapes Handle().
///
/// Example usage:
/// @code
///   ChatOrchestrator chat(sessions, extractor, engine, explainer);
///   Answer answer = chat.Handle("session-1", "What is the overall failure rate?");
///   std::cout << ToJson(answer).dump(2) << std::endl;
/// @endcode
class ChatOrchestrator {
public:
    ChatOrchestrator(std::shared_ptr<session::SessionManager> sessions,
                     std::shared_ptr<extraction::IntentExtractor> extractor,
                     std::shared_ptr<analysis::AnalysisEngine> engine,
                     std::shared_ptr<explain::ExplanationSynthesizer> explainer,
                     ChatOrchestratorConfig config = {});
    ~ChatOrchestrator();

    ChatOrchestrator(const ChatOrchestrator&) = delete;
    ChatOrchestrator& operator=(const ChatOrchestrator&) = delete;

    /// @brief Answer one message of a session
    Answer Handle(const std::string& session_id, std::string_view message);

    /// @brief Start over: forget the session's turns and rate history
    absl::Status NewChat(const std::string& session_id);

    ChatOrchestratorStats GetStats() const;

    /// @brief Component status and counters
    nlohmann::json HealthSummary() const;

private:
    struct Request;

    Answer Clarify(const Request& request, const analysis::Intent& intent, std::string question);
    Answer Reject(const Request& request, const analysis::Intent& intent);
    Answer Fail(const Request& request, const analysis::Intent& intent, const absl::Status& status);
    Answer Analyse(const Request& request, const analysis::Intent& intent,
                   const analysis::ComputedResult& result);

    /// @brief Ambiguity rules; nullopt when the intent can be resolved
    std::optional<std::string> FindAmbiguity(const analysis::Intent& intent) const;

    /// @brief Record the request's single turn
    void Remember(const Request& request, const analysis::Intent& intent,
                  const Answer& answer, std::string result_summary = {});

    std::shared_ptr<session::SessionManager> sessions_;
    std::shared_ptr<extraction::IntentExtractor> extractor_;
    std::shared_ptr<analysis::AnalysisEngine> engine_;
    std::shared_ptr<explain::ExplanationSynthesizer> explainer_;
    ChatOrchestratorConfig config_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> analyses_{0};
    std::atomic<uint64_t> clarifications_{0};
    std::atomic<uint64_t> rejections_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> malformed_{0};
};

}  // namespace insightx::pipeline
