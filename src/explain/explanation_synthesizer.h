#pragma once

/// @file explanation_synthesizer.h
/// @brief Narrative for a computed result, grounded in its numbers

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "analysis/computed_result.h"
#include "analysis/intent.h"
#include "common/thread_pool.h"
#include "data/dataset_schema.h"
#include "llm/language_model.h"

namespace insightx::explain {

/// @brief Configuration for the explanation synthesizer
struct ExplanationSynthesizerConfig {
    std::chrono::milliseconds timeout{30000};
    size_t max_tokens = 600;
    double temperature = 0.2;
    size_t max_followups = 3;
};

/// @brief Narrative parts of an analysis answer
struct Explanation {
    std::string summary_line;
    std::string method_explanation;
    std::vector<std::string> suggested_followups;

    /// True when the text was built from the numbers without the model
    bool templated = false;

    /// Model calls made for this explanation (0 to 2)
    int attempts = 0;
};

nlohmann::json ToJson(const Explanation& explanation);

/// @brief Counters exposed in the health summary
struct ExplanationStats {
    uint64_t explanations = 0;
    uint64_t model_calls = 0;
    uint64_t repairs = 0;
    uint64_t template_fallbacks = 0;
};

/// @brief Turns a ComputedResult into a summary and method explanation
///
/// The model only sees the result's numbers and query trace. Its text is run
/// through a GroundingChecker; an answer citing a figure that is not in the
/// result is re-requested once with the offending figures named, and a
/// second failure falls back to TemplateExplanation(). Explain() never fails.
class ExplanationSynthesizer {
public:
    ExplanationSynthesizer(std::shared_ptr<llm::LanguageModel> model,
                           std::shared_ptr<ThreadPool> pool,
                           ExplanationSynthesizerConfig config = {},
                           const data::DatasetSchema& schema = data::DatasetSchema::Default());
    ~ExplanationSynthesizer();

    ExplanationSynthesizer(const ExplanationSynthesizer&) = delete;
    ExplanationSynthesizer& operator=(const ExplanationSynthesizer&) = delete;

    Explanation Explain(std::string_view question,
                        const analysis::Intent& intent,
                        const analysis::ComputedResult& result) const;

    /// @brief Explanation assembled from the numbers alone; always grounded
    static Explanation TemplateExplanation(const analysis::ComputedResult& result);

    /// @brief Deterministic follow-up questions (at most `max_followups`)
    std::vector<std::string> SuggestFollowups(const analysis::Intent& intent) const;

    /// @brief Numbers-only payload sent to the model
    static nlohmann::json BuildPayload(std::string_view question,
                                       const analysis::Intent& intent,
                                       const analysis::ComputedResult& result);

    static nlohmann::json ResponseSchema();

    ExplanationStats GetStats() const;

private:
    /// @brief One model call; the status is not OK on transport failure,
    ///        timeout, unparseable output or an ungrounded answer
    absl::StatusOr<Explanation> Generate(const llm::CompletionRequest& request,
                                         const analysis::Intent& intent,
                                         const analysis::ComputedResult& result,
                                         std::vector<std::string>* ungrounded) const;

    std::shared_ptr<llm::LanguageModel> model_;
    std::shared_ptr<ThreadPool> pool_;
    ExplanationSynthesizerConfig config_;
    const data::DatasetSchema& schema_;

    mutable std::atomic<uint64_t> explanations_{0};
    mutable std::atomic<uint64_t> model_calls_{0};
    mutable std::atomic<uint64_t> repairs_{0};
    mutable std::atomic<uint64_t> template_fallbacks_{0};
};

}  // namespace insightx::explain
