#pragma once

/// @file error.h
/// @brief clintab error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace clintab {

/// @brief Error codes specific to clintab
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kInternal,

    // Table pipeline error codes
    kUnknownVariableType,
    kUnknownReference,
    kInvalidMergePattern,
    kColumnAlreadyMerged,
    kSpannerConflict,
    kConfigurationError,
};

/// @brief Name of an error code, as stored in the status payload
std::string_view ErrorCodeToString(ErrorCode code);

/// @brief Convert clintab error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
///
/// The clintab code is attached as a payload so that callers can tell
/// apart kinds that share an absl code (e.g. kUnknownVariableType and
/// kInvalidMergePattern are both kInvalidArgument).
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the clintab error code of a status
///
/// Statuses created without MakeError fall back to the closest generic code.
ErrorCode GetErrorCode(const absl::Status& status);

/// @brief Variable declared without categorical/continuous metadata
inline absl::Status UnknownVariableTypeError(std::string_view variable) {
    return MakeError(ErrorCode::kUnknownVariableType,
                     absl::StrCat("Variable has no type metadata: ", absl::string_view(variable.data(), variable.size())));
}

/// @brief Transformation referenced a row or column that does not exist
inline absl::Status UnknownReferenceError(std::string_view what, std::string_view id) {
    return MakeError(ErrorCode::kUnknownReference,
                     absl::StrCat("Unknown ", absl::string_view(what.data(), what.size()), ": ",
                                  absl::string_view(id.data(), id.size())));
}

/// @brief Merge pattern placeholders do not match the sources
inline absl::Status InvalidMergePatternError(std::string_view message) {
    return MakeError(ErrorCode::kInvalidMergePattern, message);
}

/// @brief Create an invalid argument error
inline absl::Status InvalidArgumentError(std::string_view message) {
    return absl::InvalidArgumentError(absl::string_view(message.data(), message.size()));
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define CLINTAB_RETURN_IF_ERROR(expr)                                          \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define CLINTAB_ASSIGN_OR_RETURN(lhs, rhs)                                     \
    CLINTAB_ASSIGN_OR_RETURN_IMPL(                                             \
        CLINTAB_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define CLINTAB_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                      \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define CLINTAB_CONCAT(a, b) CLINTAB_CONCAT_IMPL(a, b)
#define CLINTAB_CONCAT_IMPL(a, b) a##b

}  // namespace clintab
