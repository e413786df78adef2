#pragma once

/// @file error.h
/// @brief evalkit error handling utilities using absl::Status

#include <string>
#include <utility>
#include <absl/strings/string_view.h>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace evalkit {

/// @brief Error codes specific to evalkit
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kOutOfRange,
    kUnimplemented,
    kInternal,

    // evalkit-specific error codes
    kCancelled,
    kDeadlineExceeded,
    kMetricFailed,
    kParseError,
    kConfigurationError,
    kDatasetError,
};

/// @brief Convert evalkit error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an OK status
inline absl::Status OkStatus() {
    return absl::OkStatus();
}

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, absl::string_view message);

/// @brief Create an internal error
inline absl::Status InternalError(absl::string_view message) {
    return absl::InternalError(message);
}

/// @brief Create an invalid argument error
inline absl::Status InvalidArgumentError(absl::string_view message) {
    return absl::InvalidArgumentError(message);
}

/// @brief Create a not found error
inline absl::Status NotFoundError(absl::string_view message) {
    return absl::NotFoundError(message);
}

/// @brief Create a cancelled error
inline absl::Status CancelledError(absl::string_view message) {
    return absl::CancelledError(message);
}

/// @brief True for the two codes a cancellation context can report
inline bool IsContextError(const absl::Status& status) {
    return absl::IsCancelled(status) || absl::IsDeadlineExceeded(status);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define EVALKIT_RETURN_IF_ERROR(expr)                                          \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define EVALKIT_ASSIGN_OR_RETURN(lhs, rhs)                                     \
    EVALKIT_ASSIGN_OR_RETURN_IMPL(                                             \
        EVALKIT_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define EVALKIT_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                      \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define EVALKIT_CONCAT(a, b) EVALKIT_CONCAT_IMPL(a, b)
#define EVALKIT_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define EVALKIT_CHECK_OR_RETURN(condition, error_status)                       \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace evalkit
