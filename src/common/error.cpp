#include "error.h"

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>

namespace insightx {

namespace {

constexpr char kErrorCodePayloadUrl[] = "type.insightx.dev/insightx.ErrorCode";

}  // namespace

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "ok";
        case ErrorCode::kUnknown: return "unknown";
        case ErrorCode::kInvalidArgument: return "invalid_argument";
        case ErrorCode::kNotFound: return "not_found";
        case ErrorCode::kFailedPrecondition: return "failed_precondition";
        case ErrorCode::kInternal: return "internal";
        case ErrorCode::kUnavailable: return "unavailable";
        case ErrorCode::kRateLimited: return "rate_limited";
        case ErrorCode::kExtractionFailed: return "extraction_failed";
        case ErrorCode::kUnsupportedOperation: return "unsupported_operation";
        case ErrorCode::kInvalidFilter: return "invalid_filter";
        case ErrorCode::kInsufficientData: return "insufficient_data";
        case ErrorCode::kResourceExhausted: return "resource_exhausted";
        case ErrorCode::kGroundingViolation: return "grounding_violation";
        case ErrorCode::kConnectionFailed: return "connection_failed";
        case ErrorCode::kSerializationError: return "serialization_error";
        case ErrorCode::kDeserializationError: return "deserialization_error";
        case ErrorCode::kTimeout: return "timeout";
        case ErrorCode::kConfigurationError: return "configuration_error";
    }
    return "unknown";
}

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kInvalidFilter:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kResourceExhausted:
        case ErrorCode::kRateLimited:
            return absl::StatusCode::kResourceExhausted;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
        case ErrorCode::kInsufficientData:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kUnsupportedOperation:
            return absl::StatusCode::kUnimplemented;
        case ErrorCode::kInternal:
        case ErrorCode::kSerializationError:
        case ErrorCode::kDeserializationError:
        case ErrorCode::kGroundingViolation:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
        case ErrorCode::kConnectionFailed:
        case ErrorCode::kExtractionFailed:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kTimeout:
            return absl::StatusCode::kDeadlineExceeded;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), message);
    if (!status.ok()) {
        status.SetPayload(kErrorCodePayloadUrl,
                          absl::Cord(std::to_string(static_cast<int>(code))));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }

    std::optional<absl::Cord> payload = status.GetPayload(kErrorCodePayloadUrl);
    if (payload.has_value()) {
        int value = 0;
        if (absl::SimpleAtoi(std::string(*payload), &value) &&
            value >= 0 && value <= static_cast<int>(ErrorCode::kConfigurationError)) {
            return static_cast<ErrorCode>(value);
        }
    }

    switch (status.code()) {
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInvalidArgument;
        case absl::StatusCode::kNotFound:
            return ErrorCode::kNotFound;
        case absl::StatusCode::kResourceExhausted:
            return ErrorCode::kResourceExhausted;
        case absl::StatusCode::kFailedPrecondition:
            return ErrorCode::kFailedPrecondition;
        case absl::StatusCode::kUnimplemented:
            return ErrorCode::kUnsupportedOperation;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        case absl::StatusCode::kUnavailable:
            return ErrorCode::kUnavailable;
        case absl::StatusCode::kDeadlineExceeded:
            return ErrorCode::kTimeout;
        default:
            return ErrorCode::kUnknown;
    }
}

}  // namespace insightx
