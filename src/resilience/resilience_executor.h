#ifndef TOLLGATE_SRC_RESILIENCE_RESILIENCE_EXECUTOR_H_
#define TOLLGATE_SRC_RESILIENCE_RESILIENCE_EXECUTOR_H_

#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <glog/logging.h>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "../common/clock.h"
#include "../common/configuration.h"
#include "../common/errors.h"
#include "../common/result.h"
#include "../common/worker_pool.h"

namespace Tollgate {

using RetryPredicate = std::function<bool(const std::exception&)>;

// Timeouts, connection reset/refused, DNS failures, unavailable/network
// errors and 5xx status codes. CircuitOpenError and LockAcquisitionTimeout
// are never retried.
bool DefaultRetryPredicate(const std::exception& error);

struct RetryOptions {
    int max_attempts = 3;
    int64_t delay_ms = 1000;
    bool exponential_backoff = true;
    // Empty means DefaultRetryPredicate.
    RetryPredicate retry_on;
};

struct CircuitBreakerOptions {
    int failure_threshold = 5;
    int64_t open_timeout_ms = 60000;
};

struct BatchOptions {
    bool continue_on_error = true;
    int max_parallel = 5;
};

enum class CircuitPhase { kClosed, kOpen, kHalfOpen };

const char* CircuitPhaseName(CircuitPhase phase);

struct CircuitState {
    std::string key;
    int consecutive_failures = 0;
    int64_t last_failure_ms = 0;
    CircuitPhase phase = CircuitPhase::kClosed;
    // Set while the single half-open trial call is running.
    bool trial_in_flight = false;
};

// Outcome of one operation in a settled batch.
template<typename T>
struct Settled {
    bool fulfilled = false;
    std::optional<T> value;
    std::string reason;
    std::exception_ptr error;
};

template<typename T>
struct BatchResult {
    std::vector<Settled<T>> outcomes;
    size_t failed = 0;

    size_t total() const { return outcomes.size(); }
    bool all_fulfilled() const { return failed == 0; }
};

struct InvalidationReport {
    size_t total = 0;
    size_t failed = 0;
    size_t batches = 0;
};

template<typename R>
using SettledValue = std::conditional_t<std::is_void_v<R>, Unit, R>;

/**
 * @brief Wraps calls to unreliable downstream services.
 *
 * Retry with backoff, a per-key circuit breaker and bounded-concurrency batch
 * execution. Circuit state lives in this object only; each process keeps its
 * own view of every downstream.
 *
 * Operations run outside the circuit table lock.
 */
class ResilienceExecutor {
public:
    struct Options {
        RetryOptions retry;
        CircuitBreakerOptions breaker;
        BatchOptions batch;
        size_t worker_threads = 8;

        static Options FromConfig(const TollgateConfig& config);
    };

    ResilienceExecutor() : ResilienceExecutor(Options()) {}
    explicit ResilienceExecutor(Options options, Clock& clock = SystemClock::Instance());
    ~ResilienceExecutor();

    ResilienceExecutor(const ResilienceExecutor&) = delete;
    ResilienceExecutor& operator=(const ResilienceExecutor&) = delete;

    /**
     * Runs operation up to max_attempts times. A failure the predicate rejects
     * is rethrown at once; otherwise the executor sleeps delay_ms * 2^(n-1)
     * (or delay_ms flat) before attempt n+1. The last error is rethrown when
     * all attempts fail.
     */
    template<typename Fn>
    auto WithRetry(Fn&& operation, const RetryOptions& options) -> std::invoke_result_t<Fn&>;

    template<typename Fn>
    auto WithRetry(Fn&& operation) -> std::invoke_result_t<Fn&> {
        return WithRetry(std::forward<Fn>(operation), options_.retry);
    }

    /**
     * Runs operation through the breaker for key. Throws CircuitOpenError
     * without invoking operation while the circuit is open, or while another
     * caller holds the half-open trial.
     */
    template<typename Fn>
    auto WithCircuitBreaker(const std::string& key, Fn&& operation,
                            const CircuitBreakerOptions& options) -> std::invoke_result_t<Fn&>;

    template<typename Fn>
    auto WithCircuitBreaker(const std::string& key, Fn&& operation) -> std::invoke_result_t<Fn&> {
        return WithCircuitBreaker(key, std::forward<Fn>(operation), options_.breaker);
    }

    // WithCircuitBreaker with kCircuitOpen / kOperationFailed reported in the Result.
    template<typename Fn>
    auto TryWithCircuitBreaker(const std::string& key, Fn&& operation,
                               const CircuitBreakerOptions& options)
        -> Result<SettledValue<std::invoke_result_t<Fn&>>>;

    template<typename Fn>
    auto TryWithCircuitBreaker(const std::string& key, Fn&& operation)
        -> Result<SettledValue<std::invoke_result_t<Fn&>>> {
        return TryWithCircuitBreaker(key, std::forward<Fn>(operation), options_.breaker);
    }

    // Runs every operation on the worker pool and waits for all of them.
    template<typename Fn>
    auto ExecuteAllSettled(const std::vector<Fn>& operations)
        -> BatchResult<SettledValue<std::invoke_result_t<const Fn&>>>;

    /**
     * Runs operations in batches of max_parallel. With continue_on_error each
     * batch is settled and failures are counted; otherwise the first failure
     * of a batch is rethrown after the whole batch finished, and no later
     * batch starts.
     */
    InvalidationReport SafeCacheInvalidation(const std::vector<std::function<void()>>& operations,
                                             const BatchOptions& options);

    InvalidationReport SafeCacheInvalidation(const std::vector<std::function<void()>>& operations) {
        return SafeCacheInvalidation(operations, options_.batch);
    }

    std::optional<CircuitState> GetCircuitBreakerStatus(const std::string& key) const;
    std::map<std::string, CircuitState> GetAllCircuitBreakers() const;
    // False when no circuit exists for key.
    bool ResetCircuitBreaker(const std::string& key);

    const Options& options() const { return options_; }

private:
    bool ShouldRetry(const RetryOptions& options, const std::exception& error) const;
    int64_t RetryDelayMs(const RetryOptions& options, int attempt) const;

    // Throws CircuitOpenError when the call must not run.
    void AdmitCall(const std::string& key, const CircuitBreakerOptions& options);
    void RecordSuccess(const std::string& key);
    void RecordFailure(const std::string& key, const CircuitBreakerOptions& options);

    Options options_;
    Clock& clock_;
    std::unique_ptr<WorkerPool> pool_;

    mutable absl::Mutex circuits_mutex_;
    absl::flat_hash_map<std::string, CircuitState> circuits_ ABSL_GUARDED_BY(circuits_mutex_);
};

template<typename Fn>
auto ResilienceExecutor::WithRetry(Fn&& operation, const RetryOptions& options)
    -> std::invoke_result_t<Fn&> {
    const int max_attempts = options.max_attempts > 0 ? options.max_attempts : 1;
    for (int attempt = 1;; ++attempt) {
        try {
            return operation();
        } catch (const std::exception& e) {
            if (!ShouldRetry(options, e)) {
                LOG(WARNING) << "Error not retryable (attempt " << attempt << "): " << e.what();
                throw;
            }
            if (attempt >= max_attempts) {
                LOG(ERROR) << "Operation failed after all " << max_attempts
                           << " retry attempts: " << e.what();
                throw;
            }
            const int64_t delay = RetryDelayMs(options, attempt);
            LOG(WARNING) << "Operation failed, retrying (attempt " << attempt << "/" << max_attempts
                         << ", next retry in " << delay << "ms): " << e.what();
            clock_.SleepForMs(delay);
        }
    }
}

template<typename Fn>
auto ResilienceExecutor::WithCircuitBreaker(const std::string& key, Fn&& operation,
                                            const CircuitBreakerOptions& options)
    -> std::invoke_result_t<Fn&> {
    AdmitCall(key, options);
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
            operation();
            RecordSuccess(key);
        } else {
            auto result = operation();
            RecordSuccess(key);
            return result;
        }
    } catch (...) {
        RecordFailure(key, options);
        throw;
    }
}

template<typename Fn>
auto ResilienceExecutor::TryWithCircuitBreaker(const std::string& key, Fn&& operation,
                                               const CircuitBreakerOptions& options)
    -> Result<SettledValue<std::invoke_result_t<Fn&>>> {
    using Value = SettledValue<std::invoke_result_t<Fn&>>;
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
            WithCircuitBreaker(key, operation, options);
            return Value{};
        } else {
            return Value(WithCircuitBreaker(key, operation, options));
        }
    } catch (const TollgateError& e) {
        return Error{e.code(), e.what(), std::current_exception()};
    } catch (const std::exception& e) {
        return Error{ErrorCode::kOperationFailed, e.what(), std::current_exception()};
    }
}

template<typename Fn>
auto ResilienceExecutor::ExecuteAllSettled(const std::vector<Fn>& operations)
    -> BatchResult<SettledValue<std::invoke_result_t<const Fn&>>> {
    using Return = std::invoke_result_t<const Fn&>;
    using Value = SettledValue<Return>;

    std::vector<std::future<Return>> pending;
    pending.reserve(operations.size());
    for (const auto& operation : operations) {
        pending.push_back(pool_->Submit([&operation]() { return operation(); }));
    }

    BatchResult<Value> batch;
    batch.outcomes.resize(pending.size());
    for (size_t i = 0; i < pending.size(); ++i) {
        Settled<Value>& outcome = batch.outcomes[i];
        try {
            if constexpr (std::is_void_v<Return>) {
                pending[i].get();
                outcome.value = Value{};
            } else {
                outcome.value = pending[i].get();
            }
            outcome.fulfilled = true;
        } catch (const std::exception& e) {
            outcome.reason = e.what();
            outcome.error = std::current_exception();
        } catch (...) {
            outcome.reason = "non-standard exception";
            outcome.error = std::current_exception();
        }
        if (!outcome.fulfilled) {
            ++batch.failed;
            LOG(ERROR) << "Operation " << i << " failed in batch execution: " << outcome.reason;
        }
    }

    if (batch.failed > 0) {
        const size_t total = batch.total();
        LOG(WARNING) << "Batch operation completed with failures: total=" << total
                     << " failures=" << batch.failed << " success_rate="
                     << 100.0 * static_cast<double>(total - batch.failed) / static_cast<double>(total) << "%";
    }
    return batch;
}

} // namespace Tollgate

#endif // TOLLGATE_SRC_RESILIENCE_RESILIENCE_EXECUTOR_H_
