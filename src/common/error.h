#pragma once

/// @file error.h
/// @brief InsightX error handling utilities using absl::Status

#include <optional>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace insightx {

/// @brief Error codes carried on every status produced by InsightX
///
/// The generic codes mirror absl::StatusCode. The domain codes name the
/// failure taxonomy the orchestrator recovers from; they are attached to the
/// status as a payload so recovery never depends on message text.
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kInternal,
    kUnavailable,

    // Pipeline taxonomy
    kRateLimited,
    kExtractionFailed,
    kUnsupportedOperation,
    kInvalidFilter,
    kInsufficientData,
    kResourceExhausted,
    kGroundingViolation,

    // Infrastructure
    kConnectionFailed,
    kSerializationError,
    kDeserializationError,
    kTimeout,
    kConfigurationError,
};

/// @brief Stable name of an error code ("rate_limited", "invalid_filter", ...)
std::string_view ErrorCodeName(ErrorCode code);

/// @brief Convert InsightX error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
///
/// The InsightX code is stored as a payload and can be read back with
/// GetErrorCode().
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the InsightX error code from a status
///
/// Statuses that were not created with MakeError() are mapped from their
/// absl::StatusCode.
ErrorCode GetErrorCode(const absl::Status& status);

/// @brief True if the status carries the given InsightX code
inline bool HasErrorCode(const absl::Status& status, ErrorCode code) {
    return GetErrorCode(status) == code;
}

inline absl::Status RateLimitedError(std::string_view message) {
    return MakeError(ErrorCode::kRateLimited, message);
}

inline absl::Status ExtractionFailedError(std::string_view message) {
    return MakeError(ErrorCode::kExtractionFailed, message);
}

inline absl::Status UnsupportedOperationError(std::string_view message) {
    return MakeError(ErrorCode::kUnsupportedOperation, message);
}

inline absl::Status InvalidFilterError(std::string_view message) {
    return MakeError(ErrorCode::kInvalidFilter, message);
}

inline absl::Status InsufficientDataError(std::string_view message) {
    return MakeError(ErrorCode::kInsufficientData, message);
}

inline absl::Status ResourceExhaustedError(std::string_view message) {
    return MakeError(ErrorCode::kResourceExhausted, message);
}

inline absl::Status GroundingViolationError(std::string_view message) {
    return MakeError(ErrorCode::kGroundingViolation, message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define INSIGHTX_RETURN_IF_ERROR(expr)                                         \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define INSIGHTX_ASSIGN_OR_RETURN(lhs, rhs)                                    \
    INSIGHTX_ASSIGN_OR_RETURN_IMPL(                                            \
        INSIGHTX_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define INSIGHTX_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                     \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define INSIGHTX_CONCAT(a, b) INSIGHTX_CONCAT_IMPL(a, b)
#define INSIGHTX_CONCAT_IMPL(a, b) a##b

}  // namespace insightx
