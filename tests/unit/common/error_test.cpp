/// @file error_test.cpp
/// @brief Tests for InsightX error codes and status macros

#include <gtest/gtest.h>

#include "common/error.h"

namespace insightx {
namespace {

absl::StatusOr<int> ParsePositive(int value) {
    if (value <= 0) {
        return InvalidFilterError("value must be positive");
    }
    return value;
}

absl::StatusOr<int> Doubled(int value) {
    INSIGHTX_ASSIGN_OR_RETURN(int parsed, ParsePositive(value));
    return parsed * 2;
}

absl::Status CheckBoth(int a, int b) {
    INSIGHTX_RETURN_IF_ERROR(ParsePositive(a).status());
    INSIGHTX_RETURN_IF_ERROR(ParsePositive(b).status());
    return absl::OkStatus();
}

TEST(ErrorTest, DomainCodeSurvivesAsPayload) {
    absl::Status status = RateLimitedError("slow down");

    EXPECT_EQ(status.code(), absl::StatusCode::kResourceExhausted);
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kRateLimited);
    EXPECT_TRUE(HasErrorCode(status, ErrorCode::kRateLimited));
    EXPECT_FALSE(HasErrorCode(status, ErrorCode::kResourceExhausted));
    EXPECT_EQ(status.message(), "slow down");
}

TEST(ErrorTest, TaxonomyMapsToAbslCodes) {
    EXPECT_EQ(ExtractionFailedError("x").code(), absl::StatusCode::kUnavailable);
    EXPECT_EQ(UnsupportedOperationError("x").code(), absl::StatusCode::kUnimplemented);
    EXPECT_EQ(InvalidFilterError("x").code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(InsufficientDataError("x").code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(GroundingViolationError("x").code(), absl::StatusCode::kInternal);
}

TEST(ErrorTest, PlainStatusesMapFromAbslCode) {
    EXPECT_EQ(GetErrorCode(absl::OkStatus()), ErrorCode::kOk);
    EXPECT_EQ(GetErrorCode(absl::InvalidArgumentError("x")), ErrorCode::kInvalidArgument);
    EXPECT_EQ(GetErrorCode(absl::UnimplementedError("x")), ErrorCode::kUnsupportedOperation);
    EXPECT_EQ(GetErrorCode(absl::DeadlineExceededError("x")), ErrorCode::kTimeout);
    EXPECT_EQ(GetErrorCode(absl::DataLossError("x")), ErrorCode::kUnknown);
}

TEST(ErrorTest, CodeNames) {
    EXPECT_EQ(ErrorCodeName(ErrorCode::kRateLimited), "rate_limited");
    EXPECT_EQ(ErrorCodeName(ErrorCode::kInvalidFilter), "invalid_filter");
    EXPECT_EQ(ErrorCodeName(ErrorCode::kExtractionFailed), "extraction_failed");
}

TEST(ErrorTest, AssignOrReturn) {
    auto ok = Doubled(4);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(*ok, 8);

    auto failed = Doubled(-1);
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(GetErrorCode(failed.status()), ErrorCode::kInvalidFilter);
}

TEST(ErrorTest, ReturnIfError) {
    EXPECT_TRUE(CheckBoth(1, 2).ok());
    EXPECT_TRUE(HasErrorCode(CheckBoth(1, 0), ErrorCode::kInvalidFilter));
}

}  // namespace
}  // namespace insightx
