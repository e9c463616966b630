/// @file error.cpp
/// @brief Error codes carried in status payloads

#include "error.h"

#include <optional>

#include <absl/strings/cord.h>
#include <absl/types/optional.h>

namespace clintab {

namespace {

constexpr absl::string_view kErrorCodePayloadUrl = "type.clintab/error_code";

constexpr ErrorCode kAllCodes[] = {
    ErrorCode::kOk,
    ErrorCode::kUnknown,
    ErrorCode::kInvalidArgument,
    ErrorCode::kNotFound,
    ErrorCode::kFailedPrecondition,
    ErrorCode::kInternal,
    ErrorCode::kUnknownVariableType,
    ErrorCode::kUnknownReference,
    ErrorCode::kInvalidMergePattern,
    ErrorCode::kColumnAlreadyMerged,
    ErrorCode::kSpannerConflict,
    ErrorCode::kConfigurationError,
};

}  // namespace

std::string_view ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "OK";
        case ErrorCode::kInvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::kNotFound: return "NOT_FOUND";
        case ErrorCode::kFailedPrecondition: return "FAILED_PRECONDITION";
        case ErrorCode::kInternal: return "INTERNAL";
        case ErrorCode::kUnknownVariableType: return "UNKNOWN_VARIABLE_TYPE";
        case ErrorCode::kUnknownReference: return "UNKNOWN_REFERENCE";
        case ErrorCode::kInvalidMergePattern: return "INVALID_MERGE_PATTERN";
        case ErrorCode::kColumnAlreadyMerged: return "COLUMN_ALREADY_MERGED";
        case ErrorCode::kSpannerConflict: return "SPANNER_CONFLICT";
        case ErrorCode::kConfigurationError: return "CONFIGURATION_ERROR";
        case ErrorCode::kUnknown:
        default:
            return "UNKNOWN";
    }
}

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kUnknownVariableType:
        case ErrorCode::kInvalidMergePattern:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
        case ErrorCode::kUnknownReference:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kColumnAlreadyMerged:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kSpannerConflict:
            return absl::StatusCode::kAlreadyExists;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
    if (!status.ok()) {
        status.SetPayload(kErrorCodePayloadUrl, absl::Cord(std::string(ErrorCodeToString(code))));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }

    absl::optional<absl::Cord> payload = status.GetPayload(kErrorCodePayloadUrl);
    if (payload.has_value()) {
        const std::string name(*payload);
        for (ErrorCode code : kAllCodes) {
            if (ErrorCodeToString(code) == name) {
                return code;
            }
        }
    }

    switch (status.code()) {
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInvalidArgument;
        case absl::StatusCode::kNotFound:
            return ErrorCode::kNotFound;
        case absl::StatusCode::kFailedPrecondition:
            return ErrorCode::kFailedPrecondition;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        default:
            return ErrorCode::kUnknown;
    }
}

}  // namespace clintab
