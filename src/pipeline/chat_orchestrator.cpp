/// @file chat_orchestrator.cpp
/// @brief Chat orchestrator implementation

#include "pipeline/chat_orchestrator.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/time/time.h>

#include "common/error.h"
#include "common/logging.h"

namespace insightx::pipeline {

using json = nlohmann::json;
using analysis::Intent;
using analysis::Operation;

namespace {

std::vector<std::string> OperationNames() {
    std::vector<std::string> names;
    for (Operation op : analysis::SupportedOperations()) {
        names.emplace_back(analysis::OperationName(op));
    }
    return names;
}

std::vector<std::string> MetricLabels(const data::DatasetSchema& schema) {
    std::vector<std::string> labels;
    for (const auto& metric : schema.metrics()) {
        labels.push_back(metric.label);
    }
    return labels;
}

/// The extracted operation first, then the rest of the catalog
std::vector<std::string> CandidatesFor(const Intent& intent) {
    std::vector<std::string> candidates;
    if (!intent.IsUnsupported()) {
        candidates.emplace_back(analysis::OperationName(intent.operation));
    }
    for (auto& name : OperationNames()) {
        if (candidates.empty() || name != candidates.front()) {
            candidates.push_back(std::move(name));
        }
    }
    return candidates;
}

bool HasNonEmptyDisjointSegments(const Intent& intent) {
    return intent.segments && !intent.segments->a.empty() && !intent.segments->b.empty() &&
           analysis::SegmentsDisjoint(intent.segments->a, intent.segments->b);
}

}  // namespace

/// @brief Per-request context
struct ChatOrchestrator::Request {
    std::string id;
    std::string session_id;
    std::string message;
    absl::Time received;
};

ChatOrchestrator::ChatOrchestrator(std::shared_ptr<session::SessionManager> sessions,
                                   std::shared_ptr<extraction::IntentExtractor> extractor,
                                   std::shared_ptr<analysis::AnalysisEngine> engine,
                                   std::shared_ptr<explain::ExplanationSynthesizer> explainer,
                                   ChatOrchestratorConfig config)
    : sessions_(std::move(sessions)),
      extractor_(std::move(extractor)),
      engine_(std::move(engine)),
      explainer_(std::move(explainer)),
      config_(config) {}

ChatOrchestrator::~ChatOrchestrator() = default;

// =============================================================================
// Request handling
// =============================================================================

Answer ChatOrchestrator::Handle(const std::string& session_id, std::string_view message) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    Request request;
    request.id = NewRequestId();
    request.session_id = session_id;
    request.message = std::string(absl::StripAsciiWhitespace(message));
    request.received = absl::Now();

    // RECEIVED: malformed input never reaches the limiter or the session
    if (session_id.empty() || request.message.empty() ||
        request.message.size() > config_.max_message_length) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        INSIGHTX_LOG_INFO("[{}] Malformed request (session '{}', {} chars)", request.id,
                          session_id, request.message.size());
        Answer answer;
        answer.kind = AnswerKind::kFailure;
        answer.session_id = session_id;
        answer.request_id = request.id;
        answer.error_code = ErrorCode::kInvalidArgument;
        answer.message = session_id.empty()
                             ? "A session id is required."
                             : absl::StrCat("Please send a question between 1 and ",
                                            config_.max_message_length, " characters long.");
        return answer;
    }

    INSIGHTX_LOG_INFO("[{}] session={} question=\"{}\"", request.id, session_id,
                      request.message);

    // RATE_CHECK
    absl::Status admitted = sessions_->CheckAndRecord(session_id);
    if (!admitted.ok()) {
        Answer answer;
        answer.session_id = session_id;
        answer.request_id = request.id;
        if (HasErrorCode(admitted, ErrorCode::kRateLimited)) {
            rate_limited_.fetch_add(1, std::memory_order_relaxed);
            answer.kind = AnswerKind::kRateLimited;
            answer.message = absl::StrCat(
                "You're sending questions a little fast. Please wait a moment and try again (",
                admitted.message(), ").");
        } else {
            failures_.fetch_add(1, std::memory_order_relaxed);
            INSIGHTX_LOG_ERROR("[{}] Session store unavailable: {}", request.id,
                               admitted.message());
            answer.kind = AnswerKind::kFailure;
            answer.error_code = GetErrorCode(admitted);
            answer.message = "Something went wrong on our side. Please try again.";
        }
        return answer;
    }

    auto state = sessions_->Get(session_id);
    if (!state.ok()) {
        return Fail(request, Intent{}, state.status());
    }

    // EXTRACT
    auto extracted = extractor_->Extract(request.message, state->turns);
    if (!extracted.ok()) {
        return Fail(request, Intent{}, extracted.status());
    }
    const Intent& intent = *extracted;
    INSIGHTX_LOG_DEBUG("[{}] intent {}", request.id, analysis::ToJson(intent).dump());

    if (intent.IsUnsupported()) {
        return Reject(request, intent);
    }
    if (auto ambiguity = FindAmbiguity(intent)) {
        return Clarify(request, intent, *std::move(ambiguity));
    }

    // RESOLVE
    auto result = engine_->Resolve(intent);
    if (!result.ok()) {
        switch (GetErrorCode(result.status())) {
            case ErrorCode::kUnsupportedOperation:
                return Reject(request, intent);
            case ErrorCode::kInvalidFilter:
                return Clarify(request, intent,
                               absl::StrCat(result.status().message(),
                                            ". Could you widen or change that filter?"));
            case ErrorCode::kInvalidArgument:
                return Clarify(request, intent,
                               absl::StrCat(result.status().message(),
                                            ". Could you rephrase the question?"));
            default:
                return Fail(request, intent, result.status());
        }
    }

    // EXPLAIN
    return Analyse(request, intent, *result);
}

std::optional<std::string> ChatOrchestrator::FindAmbiguity(const Intent& intent) const {
    if (intent.confidence < config_.confidence_threshold) {
        return std::string(
            "I'm not sure I understood the question. Could you say which metric and which "
            "transactions you are interested in?");
    }
    if (intent.operation == Operation::kCompareSegments && !HasNonEmptyDisjointSegments(intent)) {
        return std::string(
            "Which two groups should I compare? Name two different values, for example "
            "Android vs iOS.");
    }
    if ((intent.operation == Operation::kAggregate || intent.operation == Operation::kTimeSeries) &&
        !intent.metric) {
        return absl::StrCat("Which metric should I use? Available metrics: ",
                            absl::StrJoin(MetricLabels(engine_->table().schema()), ", "),
                            ".");
    }
    return std::nullopt;
}

Answer ChatOrchestrator::Clarify(const Request& request, const Intent& intent, std::string question) {
    clarifications_.fetch_add(1, std::memory_order_relaxed);

    Answer answer;
    answer.kind = AnswerKind::kClarification;
    answer.session_id = request.session_id;
    answer.request_id = request.id;

    ClarificationPayload payload;
    payload.clarification_question = std::move(question);
    payload.candidate_operations = CandidatesFor(intent);
    answer.clarification = std::move(payload);

    INSIGHTX_LOG_INFO("[{}] clarification: {}", request.id,
                      answer.clarification->clarification_question);
    Remember(request, intent, answer);
    return answer;
}

Answer ChatOrchestrator::Reject(const Request& request, const Intent& intent) {
    rejections_.fetch_add(1, std::memory_order_relaxed);

    Answer answer;
    answer.kind = AnswerKind::kRejection;
    answer.session_id = request.session_id;
    answer.request_id = request.id;

    const data::DatasetSchema& schema = engine_->table().schema();
    ClarificationPayload payload;
    std::string reason = intent.rejection_reason.empty()
                             ? std::string("That isn't something the transaction data can answer")
                             : intent.rejection_reason;
    payload.clarification_question = absl::StrCat(
        reason, ". I can report ", absl::StrJoin(MetricLabels(schema), ", "),
        " across payment method, device, state, age group, network, category and time. "
        "What would you like to know?");
    payload.candidate_operations = OperationNames();
    payload.available_metrics = MetricLabels(schema);
    payload.unknown_terms = intent.unknown_terms;
    answer.clarification = std::move(payload);

    INSIGHTX_LOG_INFO("[{}] rejected: {} (unknown: {})", request.id, reason,
                      absl::StrJoin(intent.unknown_terms, ", "));
    Remember(request, intent, answer);
    return answer;
}

Answer ChatOrchestrator::Fail(const Request& request, const Intent& intent,
                              const absl::Status& status) {
    failures_.fetch_add(1, std::memory_order_relaxed);

    Answer answer;
    answer.kind = AnswerKind::kFailure;
    answer.session_id = request.session_id;
    answer.request_id = request.id;
    answer.error_code = GetErrorCode(status);

    switch (*answer.error_code) {
        case ErrorCode::kExtractionFailed:
            answer.message = "I couldn't interpret that question right now. Please try again.";
            break;
        case ErrorCode::kResourceExhausted:
            answer.message = "That took longer than allowed. Please try again, perhaps with a "
                             "narrower question.";
            break;
        default:
            answer.message = "Something went wrong on our side. Please try again.";
            break;
    }

    INSIGHTX_LOG_WARN("[{}] failed with {}: {}", request.id,
                      ErrorCodeName(*answer.error_code), status.message());
    Remember(request, intent, answer);
    return answer;
}

Answer ChatOrchestrator::Analyse(const Request& request, const Intent& intent,
                                 const analysis::ComputedResult& result) {
    explain::Explanation explanation = explainer_->Explain(request.message, intent, result);
    analyses_.fetch_add(1, std::memory_order_relaxed);

    Answer answer;
    answer.kind = AnswerKind::kAnalysis;
    answer.session_id = request.session_id;
    answer.request_id = request.id;

    AnalysisPayload payload;
    payload.summary_line = std::move(explanation.summary_line);
    payload.numbers = result.numbers;
    payload.chart = result.series;
    payload.query_trace = result.query_trace;
    payload.method_explanation = std::move(explanation.method_explanation);
    payload.suggested_followups = std::move(explanation.suggested_followups);
    answer.analysis = std::move(payload);

    INSIGHTX_LOG_INFO("[{}] analysis {} over {} rows in {:.1f} ms{}", request.id,
                      result.query_trace.operation, result.query_trace.rows_matched,
                      absl::ToDoubleMilliseconds(absl::Now() - request.received),
                      explanation.templated ? " (templated explanation)" : "");
    Remember(request, intent, answer, result.Summary());
    return answer;
}

void ChatOrchestrator::Remember(const Request& request, const Intent& intent,
                                const Answer& answer, std::string result_summary) {
    session::Turn turn;
    turn.question = request.message;
    turn.intent = intent;
    turn.answer_kind = std::string(AnswerKindName(answer.kind));
    turn.result_summary = std::move(result_summary);
    turn.timestamp = request.received;

    absl::Status status = sessions_->Append(request.session_id, std::move(turn));
    if (!status.ok()) {
        INSIGHTX_LOG_WARN("[{}] Could not record turn: {}", request.id, status.message());
    }
}

// =============================================================================
// Session control and health
// =============================================================================

absl::Status ChatOrchestrator::NewChat(const std::string& session_id) {
    return sessions_->Reset(session_id);
}

ChatOrchestratorStats ChatOrchestrator::GetStats() const {
    ChatOrchestratorStats stats;
    stats.requests = requests_.load(std::memory_order_relaxed);
    stats.analyses = analyses_.load(std::memory_order_relaxed);
    stats.clarifications = clarifications_.load(std::memory_order_relaxed);
    stats.rejections = rejections_.load(std::memory_order_relaxed);
    stats.rate_limited = rate_limited_.load(std::memory_order_relaxed);
    stats.failures = failures_.load(std::memory_order_relaxed);
    stats.malformed = malformed_.load(std::memory_order_relaxed);
    return stats;
}

json ChatOrchestrator::HealthSummary() const {
    const data::TransactionTable& table = engine_->table();
    ChatOrchestratorStats stats = GetStats();
    session::SessionManagerStats session_stats = sessions_->GetStats();
    explain::ExplanationStats explain_stats = explainer_->GetStats();

    json dataset = {
        {"table", table.schema().table_name()},
        {"schema_version", table.schema().version()},
        {"rows", table.size()},
    };
    if (!table.empty()) {
        dataset["from"] = absl::FormatTime("%Y-%m-%d", table.domain().min, absl::UTCTimeZone());
        dataset["to"] = absl::FormatTime("%Y-%m-%d", table.domain().max, absl::UTCTimeZone());
    }

    return {
        {"status", "ok"},
        {"dataset", std::move(dataset)},
        {"model", extractor_->ModelName()},
        {"session_store", sessions_->store().Name()},
        {"requests",
         {
             {"total", stats.requests},
             {"analysis", stats.analyses},
             {"clarification", stats.clarifications},
             {"rejection", stats.rejections},
             {"rate_limited", stats.rate_limited},
             {"failure", stats.failures},
             {"malformed", stats.malformed},
         }},
        {"sessions",
         {
             {"created", session_stats.sessions_created},
             {"admitted", session_stats.requests_admitted},
             {"rate_limited", session_stats.requests_rate_limited},
             {"resets", session_stats.resets},
         }},
        {"explanations",
         {
             {"total", explain_stats.explanations},
             {"model_calls", explain_stats.model_calls},
             {"repairs", explain_stats.repairs},
             {"template_fallbacks", explain_stats.template_fallbacks},
         }},
    };
}

}  // namespace insightx::pipeline
