#pragma once

/// @file openai_client.h
/// @brief OpenAI-compatible chat-completions client

#include <chrono>
#include <memory>
#include <string>

#include "llm/language_model.h"

namespace insightx::llm {

/// @brief Client configuration
struct OpenAIClientConfig {
    /// Base URL of an OpenAI-compatible API
    std::string endpoint = "https://api.openai.com";

    /// Path of the chat-completions route
    std::string path = "/v1/chat/completions";

    std::string api_key;
    std::string model = "gpt-4o-mini";

    /// Deadline for a whole Complete() call, shared by all attempts
    std::chrono::milliseconds timeout{30000};

    /// Extra attempts on transport errors and 429/5xx responses, made only
    /// while the deadline leaves time for them
    size_t max_retries = 0;
};

/// @brief LanguageModel backed by the chat-completions HTTP API
///
/// Requests with a response schema use the `json_schema` response format
/// in strict mode, so the completion text is always a JSON document
/// conforming to the schema.
class OpenAIClient : public LanguageModel {
public:
    explicit OpenAIClient(OpenAIClientConfig config);
    ~OpenAIClient() override;

    OpenAIClient(const OpenAIClient&) = delete;
    OpenAIClient& operator=(const OpenAIClient&) = delete;

    absl::StatusOr<std::string> Complete(const CompletionRequest& request) override;

    std::string Name() const override { return config_.model; }

    /// @brief Request body sent for a completion (exposed for tests)
    nlohmann::json BuildRequestBody(const CompletionRequest& request) const;

    /// @brief Extract the message content from a chat-completions response
    static absl::StatusOr<std::string> ParseResponseBody(const std::string& body);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
    OpenAIClientConfig config_;
};

}  // namespace insightx::llm
