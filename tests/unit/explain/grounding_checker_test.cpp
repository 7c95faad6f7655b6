/// @file grounding_checker_test.cpp
/// @brief Tests for the numeric grounding check

#include <gtest/gtest.h>

#include "explain/grounding_checker.h"

namespace insightx::explain {
namespace {

using analysis::ComputedResult;
using analysis::FilterConstraint;
using analysis::Intent;
using analysis::NumberDetail;

/// 345 of 10,000 transactions failed
ComputedResult FailureRateResult() {
    NumberDetail rate;
    rate.label = "Failure Rate";
    rate.value = 3.45;
    rate.unit = analysis::Unit::kPercent;
    rate.display = "3.45%";
    rate.calculation.formula = "100 * COUNT(status = 'Failed') / COUNT(*)";
    rate.calculation.numerator = 345.0;
    rate.calculation.denominator = 10000.0;
    rate.calculation.sample_size = 10000;

    ComputedResult result;
    result.metric = "failure_rate";
    result.numbers = {rate};
    result.query_trace.operation = "failure_rate";
    result.query_trace.predicate = "all transactions";
    result.query_trace.formula = rate.calculation.formula;
    result.query_trace.rows_scanned = 10000;
    result.query_trace.rows_matched = 10000;
    return result;
}

TEST(GroundingCheckerTest, CitedFiguresAreGrounded) {
    GroundingChecker checker(FailureRateResult(), Intent{});

    GroundingReport report =
        checker.Check("The failure rate is 3.45% (345 of 10,000 transactions).");

    EXPECT_TRUE(report.grounded);
    EXPECT_TRUE(report.ungrounded.empty());
    EXPECT_EQ(report.tokens_checked, 3u);
}

TEST(GroundingCheckerTest, InventedFigureIsReported) {
    GroundingChecker checker(FailureRateResult(), Intent{});

    GroundingReport report = checker.Check("The failure rate is 4.1%, up from 3.45%.");

    EXPECT_FALSE(report.grounded);
    EXPECT_EQ(report.ungrounded, std::vector<std::string>{"4.1"});
}

TEST(GroundingCheckerTest, ToleranceFollowsPrintedPrecision) {
    GroundingChecker checker(FailureRateResult(), Intent{});

    EXPECT_TRUE(checker.Check("roughly 3.5%").grounded);
    EXPECT_TRUE(checker.Check("about 3%").grounded);
    EXPECT_FALSE(checker.Check("about 3.3%").grounded);
    EXPECT_FALSE(checker.Check("about 3.46%").grounded);
}

TEST(GroundingCheckerTest, DerivedPercentageIsGrounded) {
    ComputedResult result = FailureRateResult();
    result.numbers[0].value = 3.5;
    result.numbers[0].display = "3.50%";
    GroundingChecker checker(result, Intent{});

    // 100 * 345 / 10000
    EXPECT_TRUE(checker.Check("3.45 percent of transactions failed").grounded);
}

TEST(GroundingCheckerTest, LabelsDimensionValuesAndDatesAreExempt) {
    Intent intent;
    intent.filters = {
        {"age_group", FilterConstraint::Kind::kEquals, {"25-34"}, {}, {}},
        {"network", FilterConstraint::Kind::kEquals, {"4G"}, {}, {}},
    };
    GroundingChecker checker(FailureRateResult(), intent);

    GroundingReport report = checker.Check(
        "For 25-34 year olds on 4G between 2024-01-01 and 2024-03-31, the failure rate "
        "was 3.45%, computed as 100 * COUNT(status = 'Failed') / COUNT(*).");

    EXPECT_TRUE(report.grounded) << report.ungrounded.size();
    EXPECT_EQ(report.tokens_checked, 1u);
}

TEST(GroundingCheckerTest, IdentifiersAreNotFigures) {
    GroundingChecker checker(FailureRateResult(), Intent{});

    EXPECT_TRUE(checker.Check("Unlike Q4, 345 payments failed").grounded);
}

TEST(GroundingCheckerTest, FlagValuesDoNotMaskFigures) {
    GroundingChecker checker(FailureRateResult(), Intent{});

    // "0" and "1" are permitted flag values but must not hide digits
    GroundingReport report = checker.Check("10,000 transactions, 1,000 of them failed");

    EXPECT_FALSE(report.grounded);
    EXPECT_EQ(report.ungrounded, std::vector<std::string>{"1,000"});
}

TEST(GroundingCheckerTest, OnlyResultNumbersGround) {
    ComputedResult result = FailureRateResult();
    result.query_trace.rows_scanned = 20000;
    GroundingChecker checker(result, Intent{});

    GroundingReport report = checker.Check("1 figure: 3.45% of the 20,000 rows scanned failed");

    EXPECT_FALSE(report.grounded);
    EXPECT_EQ(report.ungrounded, (std::vector<std::string>{"1", "20,000"}));
}

TEST(GroundingCheckerTest, UserSuppliedConstantsAreGrounded) {
    Intent intent;
    FilterConstraint range;
    range.column = "amount";
    range.kind = FilterConstraint::Kind::kRange;
    range.min = 500.0;
    intent.filters = {range};
    intent.top_k = 5;
    GroundingChecker checker(FailureRateResult(), intent);

    EXPECT_TRUE(checker.Check("For payments above ₹500, the top 5 codes").grounded);
}

}  // namespace
}  // namespace insightx::explain
