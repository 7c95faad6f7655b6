/// @file answer.cpp
/// @brief Answer serialisation

#include "pipeline/answer.h"

#include <random>

#include <absl/strings/str_format.h>

namespace insightx::pipeline {

using json = nlohmann::json;

std::string_view AnswerKindName(AnswerKind kind) {
    switch (kind) {
        case AnswerKind::kAnalysis: return "analysis";
        case AnswerKind::kClarification: return "clarification";
        case AnswerKind::kRejection: return "rejection";
        case AnswerKind::kRateLimited: return "rate_limited";
        case AnswerKind::kFailure: return "failure";
    }
    return "failure";
}

json ToJson(const Answer& answer) {
    json j = {
        {"kind", std::string(AnswerKindName(answer.kind))},
        {"session_id", answer.session_id},
        {"request_id", answer.request_id},
    };

    if (answer.analysis) {
        const AnalysisPayload& payload = *answer.analysis;
        json numbers = json::array();
        for (const auto& number : payload.numbers) {
            numbers.push_back(analysis::ToJson(number));
        }
        j["summary_line"] = payload.summary_line;
        j["numbers"] = std::move(numbers);
        j["chart"] = payload.chart ? analysis::ToJson(*payload.chart) : json(nullptr);
        j["query_trace"] = analysis::ToJson(payload.query_trace);
        j["method_explanation"] = payload.method_explanation;
        j["suggested_followups"] = payload.suggested_followups;
    }

    if (answer.clarification) {
        const ClarificationPayload& payload = *answer.clarification;
        j["clarification_question"] = payload.clarification_question;
        j["candidate_operations"] = payload.candidate_operations;
        if (answer.kind == AnswerKind::kRejection) {
            j["available_metrics"] = payload.available_metrics;
            j["unknown_terms"] = payload.unknown_terms;
        }
    }

    if (!answer.message.empty()) {
        j["message"] = answer.message;
    }
    if (answer.error_code) {
        j["error_code"] = std::string(ErrorCodeName(*answer.error_code));
    }
    return j;
}

std::string NewRequestId() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist;
    return absl::StrFormat("%08x", dist(gen));
}

}  // namespace insightx::pipeline
