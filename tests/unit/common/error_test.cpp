/// @file error_test.cpp
/// @brief Tests for evalkit error helpers and propagation macros

#include <gtest/gtest.h>

#include "common/error.h"

namespace evalkit {
namespace {

absl::StatusOr<int> ParsePositive(int value) {
    EVALKIT_CHECK_OR_RETURN(value > 0, InvalidArgumentError("value must be positive"));
    return value;
}

absl::StatusOr<int> Doubled(int value) {
    EVALKIT_ASSIGN_OR_RETURN(int parsed, ParsePositive(value));
    return parsed * 2;
}

absl::Status Validate(int value) {
    EVALKIT_RETURN_IF_ERROR(ParsePositive(value).status());
    return OkStatus();
}

TEST(ErrorTest, ToAbslCode) {
    EXPECT_EQ(ToAbslCode(ErrorCode::kOk), absl::StatusCode::kOk);
    EXPECT_EQ(ToAbslCode(ErrorCode::kParseError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kConfigurationError),
              absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(ToAbslCode(ErrorCode::kMetricFailed), absl::StatusCode::kInternal);
    EXPECT_EQ(ToAbslCode(ErrorCode::kDatasetError), absl::StatusCode::kDataLoss);
    EXPECT_EQ(ToAbslCode(ErrorCode::kCancelled), absl::StatusCode::kCancelled);
    EXPECT_EQ(ToAbslCode(ErrorCode::kDeadlineExceeded), absl::StatusCode::kDeadlineExceeded);
    EXPECT_EQ(ToAbslCode(ErrorCode::kUnknown), absl::StatusCode::kUnknown);
}

TEST(ErrorTest, MakeError) {
    auto status = MakeError(ErrorCode::kParseError, "bad line");
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "bad line");
}

TEST(ErrorTest, IsContextError) {
    EXPECT_TRUE(IsContextError(CancelledError("context canceled")));
    EXPECT_TRUE(IsContextError(absl::DeadlineExceededError("late")));
    EXPECT_FALSE(IsContextError(InternalError("boom")));
    EXPECT_FALSE(IsContextError(OkStatus()));
}

TEST(ErrorTest, PropagationMacros) {
    auto doubled = Doubled(21);
    ASSERT_TRUE(doubled.ok());
    EXPECT_EQ(*doubled, 42);

    auto failed = Doubled(-1);
    EXPECT_EQ(failed.status().code(), absl::StatusCode::kInvalidArgument);

    EXPECT_TRUE(Validate(1).ok());
    EXPECT_EQ(Validate(0).message(), "value must be positive");
}

}  // namespace
}  // namespace evalkit
