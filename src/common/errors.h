#ifndef TOLLGATE_SRC_COMMON_ERRORS_H_
#define TOLLGATE_SRC_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace Tollgate {

enum class ErrorCode {
    kOk,
    kValidationFailed,     // malformed/missing signature fields, stale timestamp
    kUnauthenticated,      // signature mismatch
    kConfigurationError,   // e.g. signing secret not configured
    kLockTimeout,          // lock not acquired within the retry budget
    kCircuitOpen,          // breaker refused the call
    kStoreUnavailable,     // shared store unreachable
    kOperationFailed       // wrapped operation raised
};

const char* ErrorCodeName(ErrorCode code);

// Base of every exception raised by Tollgate components.
class TollgateError : public std::runtime_error {
public:
    TollgateError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class StoreUnavailableError : public TollgateError {
public:
    explicit StoreUnavailableError(const std::string& message)
        : TollgateError(ErrorCode::kStoreUnavailable, message) {}
};

class LockAcquisitionTimeout : public TollgateError {
public:
    LockAcquisitionTimeout(const std::string& key, int max_retries)
        : TollgateError(ErrorCode::kLockTimeout,
                        "Failed to acquire lock " + key + " after " +
                            std::to_string(max_retries) + " retries"),
          key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class CircuitOpenError : public TollgateError {
public:
    explicit CircuitOpenError(const std::string& key)
        : TollgateError(ErrorCode::kCircuitOpen, "Circuit breaker " + key + " is OPEN"),
          key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace Tollgate

#endif // TOLLGATE_SRC_COMMON_ERRORS_H_
