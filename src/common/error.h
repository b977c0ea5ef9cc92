#pragma once

/// @file error.h
/// @brief FlowGuard error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace flowguard {

/// @brief Error codes specific to FlowGuard
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kInternal,

    // FlowGuard-specific error codes
    kConfigurationError,   ///< Bad YAML / environment value
    kPatternCompileError,  ///< A catalog pattern did not compile
    kIoError,              ///< Input text could not be read
};

/// @brief Convert FlowGuard error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Create a configuration error
inline absl::Status ConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

/// @brief Create a pattern compilation error
inline absl::Status PatternCompileError(std::string_view message) {
    return MakeError(ErrorCode::kPatternCompileError, message);
}

/// @brief Prefix a non-OK status message with context, keeping its code
/// @return `status` unchanged when it is OK
absl::Status Annotate(const absl::Status& status, std::string_view context);

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define FLOWGUARD_RETURN_IF_ERROR(expr)                                        \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define FLOWGUARD_ASSIGN_OR_RETURN(lhs, rhs)                                   \
    FLOWGUARD_ASSIGN_OR_RETURN_IMPL(                                           \
        FLOWGUARD_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define FLOWGUARD_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                    \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define FLOWGUARD_CONCAT(a, b) FLOWGUARD_CONCAT_IMPL(a, b)
#define FLOWGUARD_CONCAT_IMPL(a, b) a##b

}  // namespace flowguard
