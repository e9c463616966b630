/// @file error_test.cpp
/// @brief Tests for clintab error codes and propagation macros

#include <gtest/gtest.h>

#include "common/error.h"

namespace clintab {
namespace {

absl::StatusOr<int> ParsePositive(int value) {
    if (value <= 0) {
        return InvalidArgumentError("not positive");
    }
    return value;
}

absl::StatusOr<int> Doubled(int value) {
    CLINTAB_ASSIGN_OR_RETURN(int parsed, ParsePositive(value));
    return parsed * 2;
}

absl::Status CheckBoth(int a, int b) {
    CLINTAB_RETURN_IF_ERROR(ParsePositive(a).status());
    CLINTAB_RETURN_IF_ERROR(ParsePositive(b).status());
    return absl::OkStatus();
}

TEST(ErrorTest, DomainKindsMapToAbslCodes) {
    EXPECT_EQ(UnknownVariableTypeError("AGE").code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(UnknownReferenceError("column", "x").code(), absl::StatusCode::kNotFound);
    EXPECT_EQ(InvalidMergePatternError("bad").code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(MakeError(ErrorCode::kColumnAlreadyMerged, "m").code(),
              absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(MakeError(ErrorCode::kSpannerConflict, "s").code(),
              absl::StatusCode::kAlreadyExists);
    EXPECT_EQ(MakeError(ErrorCode::kConfigurationError, "c").code(),
              absl::StatusCode::kFailedPrecondition);
}

TEST(ErrorTest, PayloadDistinguishesKindsSharingAnAbslCode) {
    EXPECT_EQ(GetErrorCode(UnknownVariableTypeError("AGE")), ErrorCode::kUnknownVariableType);
    EXPECT_EQ(GetErrorCode(InvalidMergePatternError("bad")), ErrorCode::kInvalidMergePattern);
    EXPECT_EQ(GetErrorCode(UnknownReferenceError("row", "7")), ErrorCode::kUnknownReference);
}

TEST(ErrorTest, PlainStatusFallsBackToGenericCode) {
    EXPECT_EQ(GetErrorCode(absl::OkStatus()), ErrorCode::kOk);
    EXPECT_EQ(GetErrorCode(absl::NotFoundError("x")), ErrorCode::kNotFound);
    EXPECT_EQ(GetErrorCode(absl::InvalidArgumentError("x")), ErrorCode::kInvalidArgument);
    EXPECT_EQ(GetErrorCode(absl::DataLossError("x")), ErrorCode::kUnknown);
}

TEST(ErrorTest, UnknownReferenceMessageNamesTheId) {
    EXPECT_EQ(UnknownReferenceError("column", "mean_Placebo").message(),
              "Unknown column: mean_Placebo");
}

TEST(ErrorTest, AssignOrReturnPropagates) {
    auto ok = Doubled(4);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(*ok, 8);

    auto failed = Doubled(-1);
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ErrorTest, ReturnIfErrorStopsAtFirstFailure) {
    EXPECT_TRUE(CheckBoth(1, 2).ok());
    EXPECT_FALSE(CheckBoth(1, 0).ok());
}

TEST(ErrorTest, CodeNames) {
    EXPECT_EQ(ErrorCodeToString(ErrorCode::kSpannerConflict), "SPANNER_CONFLICT");
}

}  // namespace
}  // namespace clintab
