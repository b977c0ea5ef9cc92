#include "error.h"

namespace flowguard {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
        case ErrorCode::kIoError:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kInternal:
        case ErrorCode::kPatternCompileError:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
}

absl::Status Annotate(const absl::Status& status, std::string_view context) {
    if (status.ok()) {
        return status;
    }
    return absl::Status(status.code(), absl::StrCat(absl::string_view(context.data(), context.size()), ": ", status.message()));
}

}  // namespace flowguard
