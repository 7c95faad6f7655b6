/// @file openai_client.cpp
/// @brief OpenAI-compatible chat-completions client implementation

#include "llm/openai_client.h"

#include <regex>
#include <thread>

#include <absl/strings/str_cat.h>
#include <httplib.h>

#include "common/error.h"
#include "common/logging.h"

namespace insightx::llm {

using json = nlohmann::json;

class OpenAIClient::Impl {
public:
    explicit Impl(const OpenAIClientConfig& config) : config_(config) {
        std::regex url_regex(R"((https?)://([^/]+)(/.*)?)", std::regex::icase);
        std::smatch match;
        if (std::regex_match(config_.endpoint, match, url_regex)) {
            base_url_ = absl::StrCat(match[1].str(), "://", match[2].str());
        }
    }

    static void SetTimeout(httplib::Client& client, std::chrono::milliseconds timeout) {
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);
    }

    /// @brief Fresh client per call; httplib clients are not shared across threads
    absl::StatusOr<std::unique_ptr<httplib::Client>> MakeClient() const {
        if (base_url_.empty()) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("Invalid LLM endpoint: ", config_.endpoint));
        }
        auto client = std::make_unique<httplib::Client>(base_url_);
        if (!client->is_valid()) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("Cannot create HTTP client for ", base_url_));
        }
        SetTimeout(*client, config_.timeout);
        return client;
    }

private:
    const OpenAIClientConfig& config_;
    std::string base_url_;
};

OpenAIClient::OpenAIClient(OpenAIClientConfig config)
    : config_(std::move(config)) {
    impl_ = std::make_unique<Impl>(config_);
}

OpenAIClient::~OpenAIClient() = default;

json OpenAIClient::BuildRequestBody(const CompletionRequest& request) const {
    json body;
    body["model"] = config_.model;
    body["max_tokens"] = request.max_tokens;
    body["temperature"] = request.temperature;
    body["messages"] = json::array({
        {{"role", "system"}, {"content", request.system}},
        {{"role", "user"}, {"content", request.prompt}},
    });

    if (request.response_schema) {
        body["response_format"] = {
            {"type", "json_schema"},
            {"json_schema",
             {
                 {"name", request.schema_name},
                 {"strict", true},
                 {"schema", *request.response_schema},
             }},
        };
    }
    return body;
}

absl::StatusOr<std::string> OpenAIClient::ParseResponseBody(const std::string& body) {
    try {
        json response = json::parse(body);
        if (response.contains("choices") && response["choices"].is_array() &&
            !response["choices"].empty() &&
            response["choices"][0].contains("message")) {
            const json& message = response["choices"][0]["message"];
            if (message.contains("refusal") && message["refusal"].is_string()) {
                return MakeError(ErrorCode::kUnavailable,
                                 absl::StrCat("Model refused: ",
                                              message["refusal"].get<std::string>()));
            }
            if (message.contains("content") && message["content"].is_string()) {
                return message["content"].get<std::string>();
            }
        }
        return MakeError(ErrorCode::kDeserializationError,
                         "LLM response has no message content");
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kDeserializationError,
                         absl::StrCat("Failed to parse LLM response: ", e.what()));
    }
}

absl::StatusOr<std::string> OpenAIClient::Complete(const CompletionRequest& request) {
    INSIGHTX_ASSIGN_OR_RETURN(std::unique_ptr<httplib::Client> client, impl_->MakeClient());

    std::string payload = BuildRequestBody(request).dump();
    httplib::Headers headers = {
        {"Authorization", "Bearer " + config_.api_key},
    };

    using Clock = std::chrono::steady_clock;
    const Clock::time_point deadline = Clock::now() + config_.timeout;
    auto remaining = [deadline] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    };

    std::string last_error = "no attempt made";
    size_t attempts = 0;
    for (size_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 0) {
            std::chrono::milliseconds backoff(500 * attempt);
            if (remaining() <= backoff) {
                break;
            }
            std::this_thread::sleep_for(backoff);
        }
        Impl::SetTimeout(*client, remaining());
        ++attempts;

        auto result = client->Post(config_.path, headers, payload, "application/json");
        if (!result) {
            last_error = absl::StrCat("transport error: ", httplib::to_string(result.error()));
            INSIGHTX_LOG_WARN("LLM request attempt {} failed: {}", attempt + 1, last_error);
            continue;
        }
        if (result->status == 200) {
            return ParseResponseBody(result->body);
        }

        last_error = absl::StrCat("HTTP ", result->status);
        // Only throttling and server errors are worth another attempt
        if (result->status != 429 && result->status < 500) {
            return MakeError(ErrorCode::kUnavailable,
                             absl::StrCat("LLM request rejected: ", last_error, " ",
                                          result->body.substr(0, 200)));
        }
        INSIGHTX_LOG_WARN("LLM request attempt {} failed: {}", attempt + 1, last_error);
    }

    return MakeError(ErrorCode::kConnectionFailed,
                     absl::StrCat("LLM request failed after ", attempts,
                                  " attempts: ", last_error));
}

}  // namespace insightx::llm
