#include "errors.h"

namespace Tollgate {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kValidationFailed:
            return "VALIDATION_FAILED";
        case ErrorCode::kUnauthenticated:
            return "UNAUTHENTICATED";
        case ErrorCode::kConfigurationError:
            return "CONFIGURATION_ERROR";
        case ErrorCode::kLockTimeout:
            return "LOCK_TIMEOUT";
        case ErrorCode::kCircuitOpen:
            return "CIRCUIT_OPEN";
        case ErrorCode::kStoreUnavailable:
            return "STORE_UNAVAILABLE";
        case ErrorCode::kOperationFailed:
            return "OPERATION_FAILED";
    }
    return "UNKNOWN";
}

} // namespace Tollgate
