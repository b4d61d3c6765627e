#ifndef TOLLGATE_SRC_COMMON_RESULT_H_
#define TOLLGATE_SRC_COMMON_RESULT_H_

#include <exception>
#include <string>
#include <utility>
#include <variant>

#include "errors.h"

namespace Tollgate {

struct Error {
    ErrorCode code = ErrorCode::kOperationFailed;
    std::string message;
    // Original exception when the error came from a wrapped operation.
    std::exception_ptr cause;
};

/**
 * Tagged outcome: either a value or an Error whose code names what went
 * wrong (kCircuitOpen, kLockTimeout, kOperationFailed, ...). Returned by the
 * Try* entry points so callers switch on the outcome instead of catching.
 */
template<typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(Error error) : state_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    ErrorCode code() const {
        return ok() ? ErrorCode::kOk : std::get<Error>(state_).code;
    }

    T& value() { return std::get<T>(state_); }
    const T& value() const { return std::get<T>(state_); }

    const Error& error() const { return std::get<Error>(state_); }

    T value_or(T fallback) const {
        return ok() ? std::get<T>(state_) : std::move(fallback);
    }

private:
    std::variant<T, Error> state_;
};

// Placeholder value for Result of operations that produce nothing.
struct Unit {};

} // namespace Tollgate

#endif // TOLLGATE_SRC_COMMON_RESULT_H_
