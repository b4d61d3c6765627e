#include "resilience_executor.h"

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"

#include <algorithm>
#include <stdexcept>

namespace Tollgate {

namespace {

constexpr const char* kRetryableSignatures[] = {
    "timeout",
    "timed out",
    "econnreset",
    "econnrefused",
    "connection reset",
    "connection refused",
    "enotfound",
    "name resolution",
    "unavailable",
    "network",
};

// A standalone three digit number 500-599.
bool ContainsServerErrorStatus(const std::string& text) {
    for (size_t i = 0; i + 3 <= text.size(); ++i) {
        if (text[i] != '5' || !absl::ascii_isdigit(text[i + 1]) || !absl::ascii_isdigit(text[i + 2])) {
            continue;
        }
        const bool bounded_left = i == 0 || !absl::ascii_isdigit(text[i - 1]);
        const bool bounded_right = i + 3 == text.size() || !absl::ascii_isdigit(text[i + 3]);
        if (bounded_left && bounded_right) {
            return true;
        }
    }
    return false;
}

} // namespace

bool DefaultRetryPredicate(const std::exception& error) {
    // An open circuit or a busy lock is a verdict, not a transient fault. The
    // message embeds caller keys, so it must not be matched against signatures.
    if (const auto* tollgate_error = dynamic_cast<const TollgateError*>(&error)) {
        if (tollgate_error->code() == ErrorCode::kCircuitOpen ||
            tollgate_error->code() == ErrorCode::kLockTimeout) {
            return false;
        }
    }
    const std::string message = absl::AsciiStrToLower(error.what());
    for (const char* signature : kRetryableSignatures) {
        if (absl::StrContains(message, signature)) {
            return true;
        }
    }
    return ContainsServerErrorStatus(message);
}

const char* CircuitPhaseName(CircuitPhase phase) {
    switch (phase) {
        case CircuitPhase::kClosed: return "CLOSED";
        case CircuitPhase::kOpen: return "OPEN";
        case CircuitPhase::kHalfOpen: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

ResilienceExecutor::Options ResilienceExecutor::Options::FromConfig(const TollgateConfig& config) {
    Options options;
    options.retry.max_attempts = config.resilience.max_attempts.get();
    options.retry.delay_ms = config.resilience.retry_delay_ms.get();
    options.retry.exponential_backoff = config.resilience.exponential_backoff.get();
    options.breaker.failure_threshold = config.resilience.failure_threshold.get();
    options.breaker.open_timeout_ms = config.resilience.open_timeout_ms.get();
    options.batch.max_parallel = config.resilience.max_parallel.get();
    options.batch.continue_on_error = config.resilience.continue_on_error.get();
    options.worker_threads = static_cast<size_t>(std::max(1, config.resilience.worker_threads.get()));
    return options;
}

ResilienceExecutor::ResilienceExecutor(Options options, Clock& clock)
    : options_(std::move(options)),
      clock_(clock),
      pool_(std::make_unique<WorkerPool>(std::max<size_t>(1, options_.worker_threads))) {
    LOG(INFO) << "ResilienceExecutor: retry max_attempts=" << options_.retry.max_attempts
              << " breaker threshold=" << options_.breaker.failure_threshold
              << " open_timeout=" << options_.breaker.open_timeout_ms << "ms workers="
              << pool_->size();
}

ResilienceExecutor::~ResilienceExecutor() {
    pool_->Stop();
}

bool ResilienceExecutor::ShouldRetry(const RetryOptions& options, const std::exception& error) const {
    return options.retry_on ? options.retry_on(error) : DefaultRetryPredicate(error);
}

int64_t ResilienceExecutor::RetryDelayMs(const RetryOptions& options, int attempt) const {
    if (!options.exponential_backoff) {
        return options.delay_ms;
    }
    // Shift capped well below overflow for any sane base delay.
    const int shift = std::min(attempt - 1, 30);
    return options.delay_ms * (int64_t{1} << shift);
}

void ResilienceExecutor::AdmitCall(const std::string& key, const CircuitBreakerOptions& options) {
    absl::MutexLock lock(&circuits_mutex_);
    auto [it, inserted] = circuits_.try_emplace(key);
    CircuitState& circuit = it->second;
    if (inserted) {
        circuit.key = key;
    }

    switch (circuit.phase) {
        case CircuitPhase::kClosed:
            return;
        case CircuitPhase::kOpen: {
            const int64_t now = clock_.NowMs();
            if (now - circuit.last_failure_ms < options.open_timeout_ms) {
                VLOG(1) << "Circuit breaker " << key << " is OPEN, failing fast";
                throw CircuitOpenError(key);
            }
            circuit.phase = CircuitPhase::kHalfOpen;
            circuit.trial_in_flight = true;
            LOG(INFO) << "Circuit breaker " << key << " transitioning to HALF_OPEN";
            return;
        }
        case CircuitPhase::kHalfOpen:
            if (circuit.trial_in_flight) {
                VLOG(1) << "Circuit breaker " << key << " trial in flight, failing fast";
                throw CircuitOpenError(key);
            }
            circuit.trial_in_flight = true;
            return;
    }
}

void ResilienceExecutor::RecordSuccess(const std::string& key) {
    absl::MutexLock lock(&circuits_mutex_);
    auto it = circuits_.find(key);
    if (it == circuits_.end()) {
        return;
    }
    CircuitState& circuit = it->second;
    if (circuit.phase == CircuitPhase::kHalfOpen) {
        circuit.phase = CircuitPhase::kClosed;
        circuit.consecutive_failures = 0;
        circuit.trial_in_flight = false;
        LOG(INFO) << "Circuit breaker " << key << " reset to CLOSED";
    }
}

void ResilienceExecutor::RecordFailure(const std::string& key, const CircuitBreakerOptions& options) {
    absl::MutexLock lock(&circuits_mutex_);
    auto [it, inserted] = circuits_.try_emplace(key);
    CircuitState& circuit = it->second;
    if (inserted) {
        circuit.key = key;
    }

    circuit.consecutive_failures += 1;
    circuit.last_failure_ms = clock_.NowMs();
    circuit.trial_in_flight = false;

    if (circuit.consecutive_failures >= options.failure_threshold) {
        if (circuit.phase != CircuitPhase::kOpen) {
            LOG(ERROR) << "Circuit breaker " << key << " opened: failures="
                       << circuit.consecutive_failures << " threshold=" << options.failure_threshold;
        }
        circuit.phase = CircuitPhase::kOpen;
    } else if (circuit.phase == CircuitPhase::kHalfOpen) {
        // Trial failed below the threshold (threshold raised or circuit reset mid-trial).
        circuit.phase = CircuitPhase::kOpen;
        LOG(ERROR) << "Circuit breaker " << key << " trial failed, reopening";
    }
}

InvalidationReport ResilienceExecutor::SafeCacheInvalidation(
    const std::vector<std::function<void()>>& operations, const BatchOptions& options) {
    if (options.max_parallel <= 0) {
        throw std::invalid_argument("max_parallel must be positive");
    }
    const size_t batch_size = static_cast<size_t>(options.max_parallel);

    InvalidationReport report;
    report.total = operations.size();

    for (size_t begin = 0; begin < operations.size(); begin += batch_size) {
        const size_t end = std::min(operations.size(), begin + batch_size);
        std::vector<std::function<void()>> batch(operations.begin() + begin, operations.begin() + end);
        ++report.batches;

        if (options.continue_on_error) {
            report.failed += ExecuteAllSettled(batch).failed;
            continue;
        }

        std::vector<std::future<void>> pending;
        pending.reserve(batch.size());
        for (const auto& operation : batch) {
            pending.push_back(pool_->Submit([&operation]() { operation(); }));
        }
        std::exception_ptr first_failure;
        for (auto& future : pending) {
            try {
                future.get();
            } catch (...) {
                ++report.failed;
                if (!first_failure) {
                    first_failure = std::current_exception();
                }
            }
        }
        if (first_failure) {
            LOG(ERROR) << "Critical error in cache invalidation: batch " << report.batches
                       << " of " << operations.size() << " operations failed, stopping";
            std::rethrow_exception(first_failure);
        }
    }

    VLOG(1) << "Cache invalidation finished: total=" << report.total << " failed=" << report.failed
            << " batches=" << report.batches;
    return report;
}

std::optional<CircuitState> ResilienceExecutor::GetCircuitBreakerStatus(const std::string& key) const {
    absl::MutexLock lock(&circuits_mutex_);
    auto it = circuits_.find(key);
    if (it == circuits_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, CircuitState> ResilienceExecutor::GetAllCircuitBreakers() const {
    absl::MutexLock lock(&circuits_mutex_);
    return std::map<std::string, CircuitState>(circuits_.begin(), circuits_.end());
}

bool ResilienceExecutor::ResetCircuitBreaker(const std::string& key) {
    absl::MutexLock lock(&circuits_mutex_);
    auto it = circuits_.find(key);
    if (it == circuits_.end()) {
        return false;
    }
    it->second.phase = CircuitPhase::kClosed;
    it->second.consecutive_failures = 0;
    it->second.last_failure_ms = 0;
    it->second.trial_in_flight = false;
    LOG(INFO) << "Circuit breaker " << key << " manually reset";
    return true;
}

} // namespace Tollgate
