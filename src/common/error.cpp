#include "common/error.h"

namespace evalkit {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kParseError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kOutOfRange:
            return absl::StatusCode::kOutOfRange;
        case ErrorCode::kUnimplemented:
            return absl::StatusCode::kUnimplemented;
        case ErrorCode::kInternal:
        case ErrorCode::kMetricFailed:
            return absl::StatusCode::kInternal;
        case ErrorCode::kDatasetError:
            return absl::StatusCode::kDataLoss;
        case ErrorCode::kCancelled:
            return absl::StatusCode::kCancelled;
        case ErrorCode::kDeadlineExceeded:
            return absl::StatusCode::kDeadlineExceeded;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, absl::string_view message) {
    return absl::Status(ToAbslCode(code), message);
}

}  // namespace evalkit
