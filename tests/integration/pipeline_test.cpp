/// @file pipeline_test.cpp
/// @brief End-to-end conversations from a CSV file to JSON answers

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>

#include "common/thread_pool.h"
#include "data/transaction_table.h"
#include "pipeline/chat_orchestrator.h"
#include "session/memory_session_store.h"
#include "support/fakes.h"

namespace insightx::pipeline {
namespace {

using json = nlohmann::json;

/// Android: 6 transactions, 2 failed. iOS: 4 transactions, 1 failed. Web: 2, none failed.
constexpr const char* kTransactionsCsv =
    "transaction_id,timestamp,amount,payment_method,device,state,age_group,network,"
    "category,status,failure_code,fraud_flag,review_flag\n"
    "T01,2024-01-02 09:00:00,100,UPI,Android,Maharashtra,25-34,4G,Food,Success,,0,0\n"
    "T02,2024-01-03 10:00:00,200,UPI,Android,Maharashtra,25-34,4G,Food,Failed,TIMEOUT,0,0\n"
    "T03,2024-01-04 11:00:00,300,Card,Android,Karnataka,<25,5G,Travel,Success,,0,1\n"
    "T04,2024-01-05 12:00:00,400,Card,Android,Karnataka,35-44,WiFi,Others,Failed,"
    "BANK_DECLINED,1,1\n"
    "T05,2024-01-06 13:00:00,150,UPI,Android,Delhi,25-34,4G,Food,Success,,0,0\n"
    "T06,2024-01-07 14:00:00,250,NetBanking,Android,Delhi,45+,3G,Utilities,Success,,0,0\n"
    "T07,2024-01-08 15:00:00,120,UPI,iOS,Maharashtra,25-34,WiFi,Food,Success,,0,0\n"
    "T08,2024-01-09 16:00:00,80,UPI,iOS,Kerala,<25,5G,Entertainment,Failed,TIMEOUT,0,0\n"
    "T09,2024-01-10 17:00:00,500,Card,iOS,Kerala,35-44,WiFi,Travel,Success,,0,0\n"
    "T10,2024-01-11 18:00:00,60,UPI,iOS,Delhi,25-34,4G,Food,Success,,0,0\n"
    "T11,2024-01-12 19:00:00,700,NetBanking,Web,Delhi,45+,WiFi,Others,Success,,0,0\n"
    "T12,2024-01-13 20:00:00,90,NetBanking,Web,Bihar,35-44,WiFi,Utilities,Success,,0,0\n";

const analysis::NumberDetail* FindNumber(const Answer& answer, const std::string& label) {
    for (const auto& number : answer.analysis->numbers) {
        if (number.label == label) {
            return &number;
        }
    }
    return nullptr;
}

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        csv_path_ = std::filesystem::temp_directory_path() /
                    ("insightx_pipeline_test_" + NewRequestId() + ".csv");
        {
            std::ofstream out(csv_path_);
            out << kTransactionsCsv;
        }

        data::LoadSummary summary;
        auto table = data::TransactionTable::LoadCsv(csv_path_, data::DatasetSchema::Default(),
                                                     &summary);
        ASSERT_TRUE(table.ok()) << table.status().message();
        ASSERT_EQ(summary.rows_loaded, 12u);
        ASSERT_EQ(summary.rows_rejected, 0u);

        extractor_model_ = std::make_shared<test::ScriptedModel>();
        explainer_model_ = std::make_shared<test::ScriptedModel>();
        auto pool = std::make_shared<ThreadPool>(2);

        extraction::IntentExtractorConfig extractor_config;
        extractor_config.timeout = std::chrono::milliseconds(2000);
        explain::ExplanationSynthesizerConfig explainer_config;
        explainer_config.timeout = std::chrono::milliseconds(2000);

        sessions_ = std::make_shared<session::SessionManager>(
            std::make_shared<session::MemorySessionStore>());
        chat_ = std::make_unique<ChatOrchestrator>(
            sessions_,
            std::make_shared<extraction::IntentExtractor>(extractor_model_, pool,
                                                          extractor_config),
            std::make_shared<analysis::AnalysisEngine>(*table),
            std::make_shared<explain::ExplanationSynthesizer>(explainer_model_, pool,
                                                              explainer_config));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(csv_path_, ec);
    }

    std::filesystem::path csv_path_;
    std::shared_ptr<test::ScriptedModel> extractor_model_;
    std::shared_ptr<test::ScriptedModel> explainer_model_;
    std::shared_ptr<session::SessionManager> sessions_;
    std::unique_ptr<ChatOrchestrator> chat_;
};

TEST_F(PipelineTest, FollowUpQuestionReusesContext) {
    extractor_model_->Enqueue(R"({
        "operation": "failure_rate", "confidence": 0.95,
        "filters": [{"column": "device", "op": "eq", "values": ["Android"]}]
    })");
    explainer_model_->Enqueue(R"({
        "summary_line": "33.33% of Android transactions failed (2 of 6).",
        "method_explanation": "Failed Android transactions divided by all 6 Android transactions."
    })");

    Answer android = chat_->Handle("analyst", "What's the failure rate on Android?");
    ASSERT_EQ(android.kind, AnswerKind::kAnalysis) << ToJson(android).dump();
    ASSERT_EQ(android.analysis->numbers.size(), 1u);
    EXPECT_EQ(android.analysis->numbers[0].display, "33.33%");
    EXPECT_EQ(android.analysis->summary_line,
              "33.33% of Android transactions failed (2 of 6).");
    EXPECT_EQ(android.analysis->query_trace.rows_matched, 6);

    // The model only names the new device; the rest comes from the session
    extractor_model_->Enqueue(R"({
        "operation": "failure_rate", "confidence": 0.9, "inherits_context": true,
        "filters": [{"column": "device", "op": "eq", "values": ["iOS"]}]
    })");

    Answer ios = chat_->Handle("analyst", "What about iOS?");
    ASSERT_EQ(ios.kind, AnswerKind::kAnalysis) << ToJson(ios).dump();
    EXPECT_EQ(ios.analysis->numbers[0].display, "25.00%");
    EXPECT_EQ(ios.analysis->query_trace.rows_matched, 4);

    auto requests = extractor_model_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_NE(requests[1].prompt.find("What's the failure rate on Android?"),
              std::string::npos);

    auto state = sessions_->Get("analyst");
    ASSERT_TRUE(state.ok());
    EXPECT_EQ(state->turns.size(), 2u);
}

TEST_F(PipelineTest, CompareSegments) {
    extractor_model_->Enqueue(R"({
        "operation": "compare_segments", "metric": "failure_rate", "confidence": 0.9,
        "segments": {"a": [{"column": "device", "op": "eq", "values": ["Android"]}],
                     "b": [{"column": "device", "op": "eq", "values": ["iOS"]}]}
    })");

    Answer answer = chat_->Handle("analyst", "Compare failure rates for Android and iOS");
    ASSERT_EQ(answer.kind, AnswerKind::kAnalysis) << ToJson(answer).dump();

    const analysis::NumberDetail* difference = FindNumber(answer, "Difference (Android vs iOS)");
    ASSERT_NE(difference, nullptr);
    EXPECT_EQ(difference->display, "+8.33 pp");

    json j = ToJson(answer);
    EXPECT_EQ(j["kind"], "analysis");
    EXPECT_FALSE(j["chart"].is_null());
    EXPECT_FALSE(j["method_explanation"].get<std::string>().empty());
}

TEST_F(PipelineTest, UnsupportedMetricIsRejectedWithoutExplanation) {
    extractor_model_->Enqueue(R"({"operation": "aggregate",
                                  "metric": "customer_satisfaction_score",
                                  "confidence": 0.9})");

    Answer answer = chat_->Handle("analyst", "What is the customer satisfaction score?");

    ASSERT_EQ(answer.kind, AnswerKind::kRejection);
    json j = ToJson(answer);
    EXPECT_EQ(j["available_metrics"].size(), 5u);
    EXPECT_FALSE(j.contains("numbers"));
    EXPECT_EQ(explainer_model_->calls(), 0u);
}

TEST_F(PipelineTest, ExecutiveSummaryOverWholeFile) {
    extractor_model_->Enqueue(R"({"operation": "executive_summary", "confidence": 0.9})");

    Answer answer = chat_->Handle("analyst", "Give me an overview");
    ASSERT_EQ(answer.kind, AnswerKind::kAnalysis) << ToJson(answer).dump();

    const analysis::NumberDetail* total = FindNumber(answer, "Total Transactions");
    const analysis::NumberDetail* failure = FindNumber(answer, "Failure Rate");
    ASSERT_NE(total, nullptr);
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(total->display, "12");
    EXPECT_EQ(failure->display, "25.00%");
}

}  // namespace
}  // namespace insightx::pipeline
