#ifndef TOLLGATE_SRC_RATELIMIT_RATE_LIMITER_H_
#define TOLLGATE_SRC_RATELIMIT_RATE_LIMITER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../common/clock.h"
#include "../common/configuration.h"
#include "../common/worker_pool.h"
#include "../store/atomic_store.h"

namespace Tollgate {

struct RateLimitResult {
    bool allowed = true;
    int64_t limit = 0;
    int64_t remaining = 0;
    // Milliseconds since the Unix epoch at which the quota is next restored.
    int64_t reset_time_ms = 0;
    // Seconds the caller should wait; set only when rejected.
    std::optional<int64_t> retry_after_seconds;
};

struct RateLimitConfig {
    std::string key;
    int64_t limit = 0;
    int64_t window_ms = 0;
};

enum class RateLimitAlgorithm {
    kFixedWindow,
    kSlidingWindow,
    kTokenBucket,
    kExponentialBackoff
};

const char* RateLimitAlgorithmName(RateLimitAlgorithm algorithm);

// One admission rule as selected at a call site. For kTokenBucket, limit is
// the bucket capacity and window_ms is unused.
struct RateLimitPolicy {
    RateLimitAlgorithm algorithm = RateLimitAlgorithm::kFixedWindow;
    std::string key;
    int64_t limit = 0;
    int64_t window_ms = 0;
    double refill_rate = 0.0;     // tokens per second
    int64_t tokens_requested = 1;
};

/**
 * Admission control over the shared AtomicStore.
 *
 * Every algorithm fails open: when the store cannot be reached the request
 * is allowed and the failure is logged. Arguments are validated before any
 * store access and invalid ones throw std::invalid_argument.
 */
class RateLimiter {
public:
    struct Options {
        int token_bucket_ttl_seconds = 3600;
        // Threads used by CheckMultipleLimits
        size_t worker_threads = 4;

        static Options FromConfig(const TollgateConfig& config);
    };

    explicit RateLimiter(AtomicStore& store) : RateLimiter(store, Options()) {}
    RateLimiter(AtomicStore& store, Options options, Clock& clock = SystemClock::Instance());
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Fixed window aligned to multiples of window_ms.
    RateLimitResult CheckLimit(const RateLimitConfig& config);

    // Exact request log over the trailing window_ms.
    RateLimitResult CheckSlidingWindow(const std::string& key, int64_t limit, int64_t window_ms);

    RateLimitResult CheckTokenBucket(const std::string& key, int64_t capacity, double refill_rate,
                                     int64_t tokens_requested = 1);

    /**
     * Fixed window whose limit halves with every recorded violation:
     * max(1, base_limit / 2^violations). A rejection records one more
     * violation, remembered for window_ms * 2^violations.
     */
    RateLimitResult CheckWithBackoff(const std::string& key, int64_t base_limit, int64_t window_ms);

    RateLimitResult Check(const RateLimitPolicy& policy);

    // Evaluates all configs concurrently. Returns the first rejection in
    // config order, otherwise the allowed result with the fewest remaining.
    RateLimitResult CheckMultipleLimits(const std::vector<RateLimitConfig>& configs);

private:
    AtomicStore& store_;
    Options options_;
    Clock& clock_;
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace Tollgate

#endif // TOLLGATE_SRC_RATELIMIT_RATE_LIMITER_H_
