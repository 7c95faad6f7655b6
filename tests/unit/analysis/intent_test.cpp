/// @file intent_test.cpp
/// @brief Tests for intent vocabulary and schema validation

#include <gtest/gtest.h>

#include "analysis/intent.h"
#include "common/error.h"

namespace insightx::analysis {
namespace {

using json = nlohmann::json;

absl::StatusOr<Intent> Parse(const std::string& text) {
    return IntentFromJson(json::parse(text), data::DatasetSchema::Default());
}

TEST(IntentTest, ValuesAreCanonicalised) {
    auto intent = Parse(R"({
        "operation": "failure_rate",
        "filters": [{"column": "Device", "op": "eq", "values": ["android"]}],
        "confidence": 0.9
    })");
    ASSERT_TRUE(intent.ok()) << intent.status().message();

    EXPECT_EQ(intent->operation, Operation::kFailureRate);
    ASSERT_EQ(intent->filters.size(), 1u);
    EXPECT_EQ(intent->filters[0].column, "device");
    EXPECT_EQ(intent->filters[0].kind, FilterConstraint::Kind::kEquals);
    EXPECT_EQ(intent->filters[0].values, std::vector<std::string>{"Android"});
    EXPECT_DOUBLE_EQ(intent->confidence, 0.9);
    EXPECT_TRUE(intent->unknown_terms.empty());
}

TEST(IntentTest, UnknownMetricMakesIntentUnsupported) {
    auto intent = Parse(R"({
        "operation": "aggregate",
        "metric": "customer_satisfaction_score",
        "confidence": 0.95
    })");
    ASSERT_TRUE(intent.ok());

    EXPECT_TRUE(intent->IsUnsupported());
    ASSERT_EQ(intent->unknown_terms.size(), 1u);
    EXPECT_EQ(intent->unknown_terms[0], "metric 'customer_satisfaction_score'");
    EXPECT_NE(intent->rejection_reason.find("customer_satisfaction_score"), std::string::npos);
}

TEST(IntentTest, UnknownValueIsNeverSubstituted) {
    auto intent = Parse(R"({
        "operation": "failure_rate",
        "filters": [{"column": "device", "op": "eq", "values": ["Blackberry"]}],
        "confidence": 0.9
    })");
    ASSERT_TRUE(intent.ok());

    EXPECT_TRUE(intent->IsUnsupported());
    EXPECT_TRUE(intent->filters.empty());
    EXPECT_EQ(intent->unknown_terms, std::vector<std::string>{"device='Blackberry'"});
}

TEST(IntentTest, UnknownColumnsAndGroupings) {
    auto intent = Parse(R"({
        "operation": "aggregate",
        "metric": "count",
        "filters": [{"column": "merchant", "op": "eq", "values": ["Acme"]}],
        "group_by": ["amount", "device", "device"],
        "confidence": 0.9
    })");
    ASSERT_TRUE(intent.ok());

    EXPECT_TRUE(intent->IsUnsupported());
    EXPECT_EQ(intent->group_by, std::vector<std::string>{"device"});
    EXPECT_EQ(intent->unknown_terms,
              (std::vector<std::string>{"column 'merchant'", "column 'amount'"}));
}

TEST(IntentTest, AmountTakesRangesOnly) {
    auto ranged = Parse(R"({
        "operation": "aggregate",
        "metric": "count",
        "filters": [{"column": "amount", "op": "range", "min": 500, "max": 100}],
        "confidence": 0.9
    })");
    ASSERT_TRUE(ranged.ok());
    ASSERT_EQ(ranged->filters.size(), 1u);
    EXPECT_EQ(ranged->filters[0].kind, FilterConstraint::Kind::kRange);
    EXPECT_EQ(ranged->filters[0].min, 100.0);
    EXPECT_EQ(ranged->filters[0].max, 500.0);

    auto equality = Parse(R"({
        "operation": "aggregate",
        "metric": "count",
        "filters": [{"column": "amount", "op": "eq", "values": ["100"]}]
    })");
    ASSERT_TRUE(equality.ok());
    EXPECT_TRUE(equality->IsUnsupported());
}

TEST(IntentTest, MultipleValuesBecomeInFilter) {
    auto intent = Parse(R"({
        "operation": "failure_rate",
        "filters": [{"column": "network", "op": "in", "values": ["4g", "5G", "4G"]}],
        "confidence": 0.8
    })");
    ASSERT_TRUE(intent.ok());

    ASSERT_EQ(intent->filters.size(), 1u);
    EXPECT_EQ(intent->filters[0].kind, FilterConstraint::Kind::kIn);
    EXPECT_EQ(intent->filters[0].values, (std::vector<std::string>{"4G", "5G"}));
    EXPECT_EQ(intent->filters[0].ToString(), "network IN ('4G', '5G')");
}

TEST(IntentTest, TimeRanges) {
    auto relative = Parse(R"({
        "operation": "failure_rate",
        "time_range": {"start": null, "end": null, "period": "last_7_days"}
    })");
    ASSERT_TRUE(relative.ok());
    ASSERT_TRUE(relative->time_range.has_value());
    EXPECT_EQ(relative->time_range->period, RelativePeriod::kLast7Days);
    EXPECT_EQ(relative->time_range->ToString(), "last 7 days");

    auto explicit_range = Parse(R"({
        "operation": "failure_rate",
        "time_range": {"start": "2024-01-01", "end": "2024-01-31", "period": null}
    })");
    ASSERT_TRUE(explicit_range.ok());
    EXPECT_EQ(explicit_range->time_range->ToString(), "2024-01-01 to 2024-01-31");

    auto bad_date = Parse(R"({
        "operation": "failure_rate",
        "time_range": {"start": "2024-13-45", "end": null, "period": null}
    })");
    ASSERT_TRUE(bad_date.ok());
    EXPECT_TRUE(bad_date->IsUnsupported());
    EXPECT_EQ(bad_date->unknown_terms, std::vector<std::string>{"date '2024-13-45'"});
}

TEST(IntentTest, ConfidenceIsClamped) {
    auto intent = Parse(R"({"operation": "executive_summary", "confidence": 1.7})");
    ASSERT_TRUE(intent.ok());
    EXPECT_DOUBLE_EQ(intent->confidence, 1.0);
}

TEST(IntentTest, StructurallyBrokenInputFails) {
    auto not_object = Parse(R"(["failure_rate"])");
    ASSERT_FALSE(not_object.ok());
    EXPECT_EQ(GetErrorCode(not_object.status()), ErrorCode::kDeserializationError);

    auto wrong_type = Parse(R"({"operation": 5})");
    ASSERT_FALSE(wrong_type.ok());
    EXPECT_EQ(GetErrorCode(wrong_type.status()), ErrorCode::kDeserializationError);
}

TEST(IntentTest, JsonFormReadsBack) {
    Intent intent;
    intent.operation = Operation::kCompareSegments;
    intent.metric = Metric::kFailureRate;
    intent.filters = {{"payment_method", FilterConstraint::Kind::kEquals, {"UPI"}, {}, {}}};
    intent.segments = SegmentPair{
        {{"device", FilterConstraint::Kind::kEquals, {"Android"}, {}, {}}},
        {{"device", FilterConstraint::Kind::kEquals, {"iOS"}, {}, {}}},
    };
    TimeRange range;
    range.start = absl::CivilDay(2024, 1, 1);
    range.end = absl::CivilDay(2024, 3, 31);
    intent.time_range = range;
    intent.confidence = 0.9;

    auto restored = IntentFromJson(ToJson(intent), data::DatasetSchema::Default());
    ASSERT_TRUE(restored.ok()) << restored.status().message();
    EXPECT_EQ(*restored, intent);
}

TEST(IntentTest, Descriptions) {
    FilterSet filters = {
        {"device", FilterConstraint::Kind::kEquals, {"Android"}, {}, {}},
        {"amount", FilterConstraint::Kind::kRange, {}, 100.0, 500.0},
    };

    EXPECT_EQ(DescribeFilters({}), "all transactions");
    EXPECT_EQ(DescribeFilters(filters), "device = 'Android' AND amount BETWEEN 100 AND 500");
    EXPECT_EQ(SegmentLabel({filters[0]}), "Android");
    EXPECT_EQ(SegmentLabel({}), "All");

    FilterConstraint floor{"amount", FilterConstraint::Kind::kRange, {}, 1000.0, {}};
    EXPECT_EQ(floor.ToString(), "amount >= 1000");
}

TEST(IntentTest, OperationVocabulary) {
    EXPECT_EQ(ParseOperation("TOP_FAILURE_CODES"), Operation::kTopFailureCodes);
    EXPECT_FALSE(ParseOperation("forecast").has_value());
    EXPECT_EQ(OperationName(Operation::kCompareSegments), "compare_segments");
    EXPECT_EQ(SupportedOperations().size(), 6u);
    EXPECT_EQ(ParseReduction("average"), Reduction::kAvg);
}

}  // namespace
}  // namespace insightx::analysis
