/// @file intent_extractor.cpp
/// @brief Intent extractor implementation

#include "extraction/intent_extractor.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"

namespace insightx::extraction {

using json = nlohmann::json;
using analysis::Intent;
using analysis::Operation;

namespace {

constexpr const char* kSystemPromptHeader =
    R"(You are the intent extractor of InsightX, an analytics assistant over a dataset of payment transactions.
Translate the user's question into a JSON intent. Do not compute or estimate any number and do not answer the question.

)";

constexpr const char* kOperationCatalog = R"(Operations:
- failure_rate: failed transactions as a share of all transactions, optionally grouped
- aggregate: one metric (amount with a reduction, count, failure_rate, fraud_rate or review_rate), optionally grouped by dimension columns
- compare_segments: one metric over two disjoint segments given as filter lists in segments.a and segments.b
- time_series: one metric bucketed over time
- top_failure_codes: most frequent failure codes among failed transactions, limited to top_k
- executive_summary: volume, amount, failure, fraud and review rates together
- unsupported: anything the operations above cannot answer

)";

constexpr const char* kRules = R"(Rules:
1. Use only the columns, values and metrics listed above, spelled as listed.
2. If the question needs a column, value or metric that is not listed, set operation to "unsupported", put the terms in unknown_terms and say why in rejection_reason. Never substitute a similar listed term.
3. Filters on dimension columns use op "eq" or "in" with values; filters on amount use op "range" with min and/or max.
4. Explicit dates are YYYY-MM-DD in time_range.start/end. "last week" is period last_7_days, "last month" is last_30_days, "last quarter" is last_90_days.
5. Set inherits_context to true when the question continues the previous turn ("what about iOS?", "now by state"). Fill only what the new question says; the rest is taken from the previous turn.
6. confidence is your certainty in [0, 1] that the intent captures the question. Use a value below 0.5 when the question is vague.
7. Leave metric null for failure_rate, top_failure_codes and executive_summary unless the question names one.)";

json NullableString() {
    return {{"type", json::array({"string", "null"})}};
}

json FilterArraySchema() {
    return {{"type", "array"}, {"items", {{"$ref", "#/$defs/filter"}}}};
}

}  // namespace

std::string StripCodeFence(std::string_view text) {
    std::string_view trimmed = absl::StripAsciiWhitespace(text);
    if (!absl::StartsWith(trimmed, "```")) {
        return std::string(trimmed);
    }
    size_t first_newline = trimmed.find('\n');
    if (first_newline == std::string_view::npos) {
        return std::string();
    }
    trimmed.remove_prefix(first_newline + 1);
    trimmed = absl::StripTrailingAsciiWhitespace(trimmed);
    if (absl::EndsWith(trimmed, "```")) {
        trimmed.remove_suffix(3);
    }
    return std::string(absl::StripAsciiWhitespace(trimmed));
}

IntentExtractor::IntentExtractor(std::shared_ptr<llm::LanguageModel> model,
                                 std::shared_ptr<ThreadPool> pool,
                                 IntentExtractorConfig config,
                                 const data::DatasetSchema& schema)
    : model_(std::move(model)),
      pool_(std::move(pool)),
      config_(std::move(config)),
      schema_(schema) {
    system_prompt_ = BuildSystemPrompt();
}

IntentExtractor::~IntentExtractor() = default;

json IntentExtractor::ResponseSchema() {
    std::vector<std::string> operations;
    for (Operation op : analysis::SupportedOperations()) {
        operations.emplace_back(analysis::OperationName(op));
    }
    operations.emplace_back(analysis::OperationName(Operation::kUnsupported));

    json filter = {
        {"type", "object"},
        {"additionalProperties", false},
        {"required", json::array({"column", "op", "values", "min", "max"})},
        {"properties",
         {
             {"column", {{"type", "string"}}},
             {"op", {{"type", "string"}, {"enum", json::array({"eq", "in", "range"})}}},
             {"values", {{"type", "array"}, {"items", {{"type", "string"}}}}},
             {"min", {{"type", json::array({"number", "null"})}}},
             {"max", {{"type", json::array({"number", "null"})}}},
         }},
    };

    json time_range = {
        {"anyOf",
         json::array({
             {{"type", "null"}},
             {
                 {"type", "object"},
                 {"additionalProperties", false},
                 {"required", json::array({"start", "end", "period"})},
                 {"properties",
                  {
                      {"start", NullableString()},
                      {"end", NullableString()},
                      {"period", NullableString()},
                  }},
             },
         })},
    };

    json segments = {
        {"anyOf",
         json::array({
             {{"type", "null"}},
             {
                 {"type", "object"},
                 {"additionalProperties", false},
                 {"required", json::array({"a", "b"})},
                 {"properties", {{"a", FilterArraySchema()}, {"b", FilterArraySchema()}}},
             },
         })},
    };

    return {
        {"type", "object"},
        {"additionalProperties", false},
        {"required", json::array({"operation", "metric", "reduction", "filters", "group_by",
                                  "time_range", "segments", "top_k", "confidence",
                                  "inherits_context", "unknown_terms", "rejection_reason"})},
        {"properties",
         {
             {"operation", {{"type", "string"}, {"enum", operations}}},
             {"metric", NullableString()},
             {"reduction", NullableString()},
             {"filters", FilterArraySchema()},
             {"group_by", {{"type", "array"}, {"items", {{"type", "string"}}}}},
             {"time_range", time_range},
             {"segments", segments},
             {"top_k", {{"type", json::array({"integer", "null"})}}},
             {"confidence", {{"type", "number"}}},
             {"inherits_context", {{"type", "boolean"}}},
             {"unknown_terms", {{"type", "array"}, {"items", {{"type", "string"}}}}},
             {"rejection_reason", {{"type", "string"}}},
         }},
        {"$defs", {{"filter", filter}}},
    };
}

std::string IntentExtractor::BuildSystemPrompt() const {
    return absl::StrCat(kSystemPromptHeader, schema_.Describe(), "\n", kOperationCatalog,
                        kRules);
}

std::string IntentExtractor::BuildUserPrompt(std::string_view text,
                                             const std::vector<session::Turn>& context) const {
    std::string prompt = "Recent conversation (oldest first):\n";

    size_t first = context.size() > config_.context_turns
                       ? context.size() - config_.context_turns
                       : 0;
    if (first == context.size()) {
        absl::StrAppend(&prompt, "(none)\n");
    }
    for (size_t i = first; i < context.size(); ++i) {
        const session::Turn& turn = context[i];
        absl::StrAppend(&prompt, i - first + 1, ". Q: \"", turn.question, "\"\n",
                        "   intent: ", analysis::ToJson(turn.intent).dump(), "\n");
        if (!turn.result_summary.empty()) {
            absl::StrAppend(&prompt, "   result: ", turn.result_summary, "\n");
        } else {
            absl::StrAppend(&prompt, "   answered with: ", turn.answer_kind, "\n");
        }
    }

    absl::StrAppend(&prompt, "\nQuestion: ", text, "\n\nReturn the intent JSON only.");
    return prompt;
}

absl::StatusOr<Intent> IntentExtractor::ParseResponse(std::string_view response) const {
    std::string body = StripCodeFence(response);
    json document = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded()) {
        return ExtractionFailedError("Model output is not valid JSON");
    }

    auto intent = analysis::IntentFromJson(document, schema_);
    if (!intent.ok()) {
        return ExtractionFailedError(intent.status().message());
    }
    return intent;
}

Intent IntentExtractor::ApplyContext(Intent intent,
                                     const std::vector<session::Turn>& context) {
    if (!intent.inherits_context || intent.IsUnsupported()) {
        return intent;
    }

    const session::Turn* previous = nullptr;
    for (auto it = context.rbegin(); it != context.rend(); ++it) {
        if (it->IsAnalysis() && !it->intent.IsUnsupported()) {
            previous = &*it;
            break;
        }
    }
    if (previous == nullptr) {
        return intent;
    }
    const Intent& prior = previous->intent;

    for (const auto& filter : prior.filters) {
        bool constrained = std::any_of(
            intent.filters.begin(), intent.filters.end(),
            [&filter](const analysis::FilterConstraint& f) { return f.column == filter.column; });
        // Grouping by a column replaces a prior filter on it
        bool grouped = std::find(intent.group_by.begin(), intent.group_by.end(),
                                 filter.column) != intent.group_by.end();
        if (!constrained && !grouped) {
            intent.filters.push_back(filter);
        }
    }

    if (!intent.time_range) {
        intent.time_range = prior.time_range;
    }
    if (!intent.segments && intent.operation == Operation::kCompareSegments) {
        intent.segments = prior.segments;
    }

    std::optional<analysis::Metric> prior_metric = prior.metric;
    if (!prior_metric && prior.operation == Operation::kFailureRate) {
        prior_metric = analysis::Metric::kFailureRate;
    }
    if (!intent.metric && prior_metric) {
        intent.metric = prior_metric;
        if (!intent.reduction) {
            intent.reduction = prior.reduction;
        }
    }
    return intent;
}

absl::StatusOr<Intent> IntentExtractor::Extract(
    std::string_view text,
    const std::vector<session::Turn>& context) const {
    llm::CompletionRequest request;
    request.system = system_prompt_;
    request.prompt = BuildUserPrompt(text, context);
    request.response_schema = ResponseSchema();
    request.schema_name = "intent";
    request.temperature = 0.0;
    request.max_tokens = config_.max_tokens;

    auto model = model_;
    auto response = RunWithTimeout<std::string>(
        *pool_, config_.timeout, "Intent extraction",
        [model, request]() { return model->Complete(request); });

    if (!response.ok()) {
        if (GetErrorCode(response.status()) == ErrorCode::kResourceExhausted) {
            return response.status();
        }
        INSIGHTX_LOG_WARN("Intent extraction model call failed: {}",
                          response.status().message());
        return ExtractionFailedError(
            absl::StrCat("Language model unavailable: ", response.status().message()));
    }

    INSIGHTX_ASSIGN_OR_RETURN(Intent intent, ParseResponse(*response));
    return ApplyContext(std::move(intent), context);
}

}  // namespace insightx::extraction
