/// @file app_config_test.cpp
/// @brief Tests for mapping layered configuration onto AppConfig

#include <gtest/gtest.h>

#include "app/app_config.h"
#include "common/error.h"

namespace insightx::app {
namespace {

absl::StatusOr<AppConfig> FromYaml(const std::string& yaml) {
    auto config = Config::LoadFromString(yaml);
    EXPECT_TRUE(config.ok()) << config.status().message();
    return AppConfig::FromConfig(*config);
}

TEST(AppConfigTest, MapsEverySection) {
    auto app = FromYaml(R"(
data:
  path: /srv/transactions.csv
session:
  store: redis
  context_window: 4
rate_limit:
  requests_per_minute: 20
analysis:
  top_k: 3
  query_timeout_ms: 500
extraction:
  confidence_threshold: 0.7
llm:
  api_key: sk-test
  model: gpt-4o
  timeout_ms: 1000
  max_retries: 1
logging:
  level: debug
)");
    ASSERT_TRUE(app.ok()) << app.status().message();

    EXPECT_EQ(app->data_path.string(), "/srv/transactions.csv");
    EXPECT_EQ(app->session_store, SessionStoreKind::kRedis);
    EXPECT_EQ(app->session.context_window, 4u);
    EXPECT_EQ(app->session.requests_per_minute, 20u);
    EXPECT_EQ(app->analysis.default_top_k, 3u);
    EXPECT_EQ(app->analysis.query_timeout, std::chrono::milliseconds(500));
    EXPECT_DOUBLE_EQ(app->chat.confidence_threshold, 0.7);
    EXPECT_EQ(app->llm.model, "gpt-4o");
    EXPECT_EQ(app->llm.max_retries, 1u);
    EXPECT_EQ(app->extraction.timeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(app->explanation.timeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(app->logging.level, LogLevel::kDebug);
}

TEST(AppConfigTest, DefaultsNeedOnlyAnApiKey) {
    auto app = FromYaml("llm:\n  api_key: sk-test\n");
    ASSERT_TRUE(app.ok()) << app.status().message();

    EXPECT_EQ(app->session_store, SessionStoreKind::kMemory);
    EXPECT_EQ(app->session.requests_per_minute, 10u);
    EXPECT_EQ(app->chat.max_message_length, 2000u);
    EXPECT_DOUBLE_EQ(app->chat.confidence_threshold, 0.6);
    EXPECT_EQ(app->llm.max_retries, 0u);
    EXPECT_EQ(app->extraction.timeout, app->llm.timeout);
}

TEST(AppConfigTest, RejectsOutOfRangeValues) {
    for (const char* yaml : {
             "llm: {api_key: k}\nsession: {store: sqlite}\n",
             "llm: {api_key: k}\nsession: {context_window: 0}\n",
             "llm: {api_key: k}\nrate_limit: {requests_per_minute: 0}\n",
             "llm: {api_key: k}\nextraction: {confidence_threshold: 1.5}\n",
             "llm: {api_key: k}\nredis: {port: 70000}\n",
         }) {
        auto app = FromYaml(yaml);
        ASSERT_FALSE(app.ok()) << yaml;
        EXPECT_EQ(GetErrorCode(app.status()), ErrorCode::kConfigurationError) << yaml;
    }
}

}  // namespace
}  // namespace insightx::app
