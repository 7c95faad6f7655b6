#pragma once

/// @file intent_extractor.h
/// @brief Natural-language question to structured intent

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "analysis/intent.h"
#include "common/thread_pool.h"
#include "data/dataset_schema.h"
#include "llm/language_model.h"
#include "session/session_state.h"

namespace insightx::extraction {

/// @brief Configuration for the intent extractor
struct IntentExtractorConfig {
    /// Most recent turns included in the prompt
    size_t context_turns = 6;

    /// Deadline for the model call
    std::chrono::milliseconds timeout{30000};

    size_t max_tokens = 800;
};

/// @brief Schema-constrained intent extraction
///
/// The only component that reads unconstrained user text. The model is
/// asked at temperature 0 for a JSON document conforming to ResponseSchema();
/// the document is then validated against the dataset schema. Anything the
/// schema does not know becomes an unsupported intent listing the unknown
/// terms. A model that cannot be reached, or returns something that is not
/// an intent, fails closed with kExtractionFailed.
///
/// Example usage:
/// @code
///   IntentExtractor extractor(model, pool);
///   auto intent = extractor.Extract("failure rate on Android last week", turns);
///   if (intent.ok() && !intent->IsUnsupported()) {
///       auto result = engine.Resolve(*intent);
///   }
/// @endcode
class IntentExtractor {
public:
    IntentExtractor(std::shared_ptr<llm::LanguageModel> model,
                    std::shared_ptr<ThreadPool> pool,
                    IntentExtractorConfig config = {},
                    const data::DatasetSchema& schema = data::DatasetSchema::Default());
    ~IntentExtractor();

    IntentExtractor(const IntentExtractor&) = delete;
    IntentExtractor& operator=(const IntentExtractor&) = delete;

    /// @brief Extract the intent of `text` given the session's turns
    ///
    /// Pure with respect to InsightX state: nothing is recorded.
    absl::StatusOr<analysis::Intent> Extract(std::string_view text,
                                             const std::vector<session::Turn>& context) const;

    /// @brief System prompt (schema and operation catalog)
    std::string BuildSystemPrompt() const;

    /// @brief User prompt (recent turns and the question)
    std::string BuildUserPrompt(std::string_view text,
                                const std::vector<session::Turn>& context) const;

    /// @brief Parse and validate a model response
    absl::StatusOr<analysis::Intent> ParseResponse(std::string_view response) const;

    std::string ModelName() const { return model_->Name(); }

    /// @brief JSON schema the model output must conform to
    static nlohmann::json ResponseSchema();

    /// @brief Fill what a follow-up leaves out from the latest analysed turn
    ///
    /// Filters on columns the follow-up does not constrain, the time range,
    /// the segments and the metric are inherited. A follow-up that names its
    /// own value for any of these keeps it.
    static analysis::Intent ApplyContext(analysis::Intent intent,
                                         const std::vector<session::Turn>& context);

private:
    std::shared_ptr<llm::LanguageModel> model_;
    std::shared_ptr<ThreadPool> pool_;
    IntentExtractorConfig config_;
    const data::DatasetSchema& schema_;
    std::string system_prompt_;
};

/// @brief Remove a surrounding markdown code fence, if any
std::string StripCodeFence(std::string_view text);

}  // namespace insightx::extraction
