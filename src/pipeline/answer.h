#pragma once

/// @file answer.h
/// @brief The single response shape returned for every chat request

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "analysis/computed_result.h"
#include "common/error.h"

namespace insightx::pipeline {

enum class AnswerKind {
    kAnalysis,
    kClarification,
    kRejection,
    kRateLimited,
    kFailure
};

/// @brief "analysis", "clarification", "rejection", "rate_limited", "failure"
std::string_view AnswerKindName(AnswerKind kind);

/// @brief A computed answer with its narrative
struct AnalysisPayload {
    std::string summary_line;
    std::vector<analysis::NumberDetail> numbers;
    std::optional<analysis::ChartSeries> chart;
    analysis::QueryTrace query_trace;
    std::string method_explanation;
    std::vector<std::string> suggested_followups;
};

/// @brief A question back to the user (also used for rejections)
struct ClarificationPayload {
    std::string clarification_question;
    std::vector<std::string> candidate_operations;

    /// Filled for rejections
    std::vector<std::string> available_metrics;
    std::vector<std::string> unknown_terms;
};

/// @brief Response to one request
///
/// Exactly one of `analysis` (kAnalysis) or `clarification` (kClarification,
/// kRejection) is set; rate-limited and failed answers carry `message`, and
/// failures also carry the error code.
struct Answer {
    AnswerKind kind = AnswerKind::kFailure;
    std::string session_id;
    std::string request_id;

    std::optional<AnalysisPayload> analysis;
    std::optional<ClarificationPayload> clarification;

    std::string message;
    std::optional<ErrorCode> error_code;

    bool is_analysis() const { return kind == AnswerKind::kAnalysis; }
};

nlohmann::json ToJson(const Answer& answer);

/// @brief Short random id for correlating an answer with its log lines
std::string NewRequestId();

}  // namespace insightx::pipeline
