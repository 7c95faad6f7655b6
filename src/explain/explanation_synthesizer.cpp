/// @file explanation_synthesizer.cpp
/// @brief Explanation synthesizer implementation

#include "explain/explanation_synthesizer.h"

#include <algorithm>
#include <iterator>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_replace.h>

#include "analysis/formatting.h"
#include "common/error.h"
#include "common/logging.h"
#include "explain/grounding_checker.h"
#include "extraction/intent_extractor.h"

namespace insightx::explain {

using json = nlohmann::json;
using analysis::ComputedResult;
using analysis::Intent;
using analysis::NumberDetail;
using analysis::Operation;

namespace {

constexpr const char* kSystemPrompt =
    R"(You write the narrative for InsightX, an analytics assistant over payment transactions.
You receive a question and the figures that answer it, already computed. Write:
- summary_line: one or two sentences answering the question for a business reader.
- method_explanation: one or two sentences on how the figures were computed (population, filters, formula).
Cite only figures that appear in the input, exactly as displayed. Never compute, estimate, round differently or invent a number.
A figure whose display says "insufficient data" is unavailable: say so and do not give it a value.)";

/// Dimensions suggested for a breakdown, in order of preference
constexpr const char* kBreakdownColumns[] = {
    "device", "network", "payment_method", "state", "age_group", "category",
};

std::string Humanize(std::string_view column) {
    return absl::StrReplaceAll(column, {{"_", " "}});
}

std::string LowerLabel(std::string_view label) {
    return absl::AsciiStrToLower(label);
}

bool Mentions(const Intent& intent, std::string_view column) {
    if (std::find(intent.group_by.begin(), intent.group_by.end(), column) !=
        intent.group_by.end()) {
        return true;
    }
    return std::any_of(intent.filters.begin(), intent.filters.end(),
                       [column](const analysis::FilterConstraint& f) { return f.column == column; });
}

/// Metric the follow-ups talk about
analysis::Metric FocusMetric(const Intent& intent) {
    if (intent.metric) {
        return *intent.metric;
    }
    return analysis::Metric::kFailureRate;
}

/// "Failure Rate is 3.45% (345 of 10,000 transactions)"
std::string DescribeNumber(const NumberDetail& number) {
    std::string text = absl::StrCat(number.label, " is ", number.display);
    const auto& calc = number.calculation;
    if (number.available() && number.unit == analysis::Unit::kPercent && calc.numerator &&
        calc.denominator) {
        absl::StrAppend(&text, " (", analysis::FormatCount(*calc.numerator), " of ",
                        analysis::FormatCount(*calc.denominator), " transactions)");
    }
    return text;
}

}  // namespace

json ToJson(const Explanation& explanation) {
    return {
        {"summary_line", explanation.summary_line},
        {"method_explanation", explanation.method_explanation},
        {"suggested_followups", explanation.suggested_followups},
    };
}

ExplanationSynthesizer::ExplanationSynthesizer(std::shared_ptr<llm::LanguageModel> model,
                                               std::shared_ptr<ThreadPool> pool,
                                               ExplanationSynthesizerConfig config,
                                               const data::DatasetSchema& schema)
    : model_(std::move(model)),
      pool_(std::move(pool)),
      config_(std::move(config)),
      schema_(schema) {}

ExplanationSynthesizer::~ExplanationSynthesizer() = default;

json ExplanationSynthesizer::ResponseSchema() {
    return {
        {"type", "object"},
        {"additionalProperties", false},
        {"required", json::array({"summary_line", "method_explanation"})},
        {"properties",
         {
             {"summary_line", {{"type", "string"}}},
             {"method_explanation", {{"type", "string"}}},
         }},
    };
}

json ExplanationSynthesizer::BuildPayload(std::string_view question,
                                          const Intent& intent,
                                          const ComputedResult& result) {
    json numbers = json::array();
    for (const auto& number : result.numbers) {
        numbers.push_back(analysis::ToJson(number));
    }
    return {
        {"question", std::string(question)},
        {"operation", std::string(analysis::OperationName(intent.operation))},
        {"metric", result.metric},
        {"numbers", std::move(numbers)},
        {"query_trace", analysis::ToJson(result.query_trace)},
    };
}

Explanation ExplanationSynthesizer::TemplateExplanation(const ComputedResult& result) {
    Explanation explanation;
    explanation.templated = true;

    std::vector<std::string> parts;
    size_t shown = std::min<size_t>(result.numbers.size(), 3);
    for (size_t i = 0; i < shown; ++i) {
        parts.push_back(DescribeNumber(result.numbers[i]));
    }
    if (parts.empty()) {
        explanation.summary_line = "No figures were produced for this question.";
    } else {
        explanation.summary_line = absl::StrCat(absl::StrJoin(parts, "; "), ".");
    }

    const analysis::QueryTrace& trace = result.query_trace;
    // Row counts stay in the query trace; only result numbers are cited
    std::string method = absl::StrCat("Computed ", trace.formula, " for ", trace.predicate);
    if (!trace.time_window.empty()) {
        absl::StrAppend(&method, ", window ", trace.time_window);
    }
    if (!trace.group_by.empty()) {
        absl::StrAppend(&method, ", grouped by ", absl::StrJoin(trace.group_by, ", "));
    }
    if (!trace.granularity.empty()) {
        absl::StrAppend(&method, ", bucketed by ", trace.granularity);
    }
    absl::StrAppend(&method, ".");
    explanation.method_explanation = std::move(method);
    return explanation;
}

std::vector<std::string> ExplanationSynthesizer::SuggestFollowups(const Intent& intent) const {
    std::vector<std::string> followups;
    std::string metric = LowerLabel(data::MetricLabel(FocusMetric(intent)));

    if (intent.operation != Operation::kExecutiveSummary) {
        for (const char* column : kBreakdownColumns) {
            if (!Mentions(intent, column) && schema_.FindColumn(column) != nullptr) {
                followups.push_back(
                    absl::StrCat("Break down the ", metric, " by ", Humanize(column)));
                break;
            }
        }
    }

    if (intent.operation != Operation::kTimeSeries) {
        followups.push_back(absl::StrCat("How has the ", metric, " trended over time?"));
    }

    // Compare a filtered value with its nearest sibling in the schema
    if (intent.operation != Operation::kCompareSegments) {
        for (const auto& filter : intent.filters) {
            const data::ColumnSpec* column = schema_.FindColumn(filter.column);
            if (column == nullptr || filter.kind != analysis::FilterConstraint::Kind::kEquals ||
                filter.values.empty() || column->permitted_values.size() < 2) {
                continue;
            }
            const auto& permitted = column->permitted_values;
            auto it = std::find(permitted.begin(), permitted.end(), filter.values.front());
            if (it == permitted.end()) {
                continue;
            }
            auto other = std::next(it) == permitted.end() ? permitted.begin() : std::next(it);
            followups.push_back(absl::StrCat("Compare the ", metric, " for ", *it, " vs ",
                                             *other));
            break;
        }
    }

    if (intent.operation != Operation::kTopFailureCodes) {
        followups.push_back("What are the most common failure codes?");
    }
    if (intent.operation != Operation::kExecutiveSummary) {
        followups.push_back("Give me an executive summary");
    }

    if (followups.size() > config_.max_followups) {
        followups.resize(config_.max_followups);
    }
    return followups;
}

absl::StatusOr<Explanation> ExplanationSynthesizer::Generate(
    const llm::CompletionRequest& request,
    const Intent& intent,
    const ComputedResult& result,
    std::vector<std::string>* ungrounded) const {
    model_calls_.fetch_add(1, std::memory_order_relaxed);

    auto model = model_;
    INSIGHTX_ASSIGN_OR_RETURN(
        std::string response,
        RunWithTimeout<std::string>(*pool_, config_.timeout, "Explanation",
                                    [model, request]() { return model->Complete(request); }));

    json document = json::parse(extraction::StripCodeFence(response), nullptr,
                                /*allow_exceptions=*/false);
    if (document.is_discarded() || !document.is_object() ||
        !document.contains("summary_line") || !document["summary_line"].is_string() ||
        !document.contains("method_explanation") ||
        !document["method_explanation"].is_string()) {
        return MakeError(ErrorCode::kDeserializationError,
                         "Explanation output does not match its schema");
    }

    Explanation explanation;
    explanation.summary_line = document["summary_line"].get<std::string>();
    explanation.method_explanation = document["method_explanation"].get<std::string>();

    GroundingChecker checker(result, intent, schema_);
    GroundingReport report = checker.Check(
        absl::StrCat(explanation.summary_line, "\n", explanation.method_explanation));
    if (!report.grounded) {
        *ungrounded = report.ungrounded;
        return GroundingViolationError(
            absl::StrCat("Ungrounded figures: ", absl::StrJoin(report.ungrounded, ", ")));
    }
    return explanation;
}

Explanation ExplanationSynthesizer::Explain(std::string_view question,
                                            const Intent& intent,
                                            const ComputedResult& result) const {
    explanations_.fetch_add(1, std::memory_order_relaxed);

    llm::CompletionRequest request;
    request.system = kSystemPrompt;
    request.prompt = absl::StrCat("Input:\n", BuildPayload(question, intent, result).dump(2),
                                  "\n\nReturn the JSON object only.");
    request.response_schema = ResponseSchema();
    request.schema_name = "explanation";
    request.temperature = config_.temperature;
    request.max_tokens = config_.max_tokens;

    int attempts = 0;
    std::vector<std::string> ungrounded;
    absl::StatusOr<Explanation> explanation = Generate(request, intent, result, &ungrounded);
    ++attempts;

    if (!explanation.ok() && HasErrorCode(explanation.status(), ErrorCode::kGroundingViolation)) {
        repairs_.fetch_add(1, std::memory_order_relaxed);
        INSIGHTX_LOG_WARN("Explanation not grounded ({}), asking once more",
                          explanation.status().message());
        absl::StrAppend(&request.prompt, "\n\nYour previous answer cited figures that are not "
                                         "in the input: ",
                        absl::StrJoin(ungrounded, ", "),
                        ". Rewrite it using only the displayed figures.");
        ungrounded.clear();
        explanation = Generate(request, intent, result, &ungrounded);
        ++attempts;
    }

    Explanation final_explanation;
    if (explanation.ok()) {
        final_explanation = *std::move(explanation);
    } else {
        template_fallbacks_.fetch_add(1, std::memory_order_relaxed);
        INSIGHTX_LOG_WARN("Using templated explanation: {}", explanation.status().message());
        final_explanation = TemplateExplanation(result);
    }
    final_explanation.attempts = attempts;
    final_explanation.suggested_followups = SuggestFollowups(intent);
    return final_explanation;
}

ExplanationStats ExplanationSynthesizer::GetStats() const {
    ExplanationStats stats;
    stats.explanations = explanations_.load(std::memory_order_relaxed);
    stats.model_calls = model_calls_.load(std::memory_order_relaxed);
    stats.repairs = repairs_.load(std::memory_order_relaxed);
    stats.template_fallbacks = template_fallbacks_.load(std::memory_order_relaxed);
    return stats;
}

}  // namespace insightx::explain
