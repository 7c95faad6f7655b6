#pragma once

/// @file language_model.h
/// @brief Language-model capability used by extraction and explanation

#include <optional>
#include <string>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

namespace insightx::llm {

/// @brief One completion call
struct CompletionRequest {
    std::string system;
    std::string prompt;

    /// JSON schema the response must conform to (strict structured output)
    std::optional<nlohmann::json> response_schema;

    /// Name reported with the schema
    std::string schema_name = "response";

    double temperature = 0.0;
    size_t max_tokens = 1024;
};

/// @brief Text completion capability
///
/// Implementations must be safe to call from several threads at once.
class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    /// @brief Complete a prompt
    /// @return The completion text, or kUnavailable / kConnectionFailed when
    ///         the model cannot be reached
    virtual absl::StatusOr<std::string> Complete(const CompletionRequest& request) = 0;

    /// @brief Model identifier for logs and health output
    virtual std::string Name() const = 0;
};

}  // namespace insightx::llm
