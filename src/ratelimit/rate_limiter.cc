#include "rate_limiter.h"

#include <glog/logging.h>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

#include <algorithm>
#include <cmath>
#include <future>
#include <limits>
#include <stdexcept>

#include "rate_limit_state.pb.h"

namespace Tollgate {

namespace {

namespace pb = ::tollgate::ratelimit;

constexpr char kFixedWindowNamespace[] = "rate-limit";
constexpr char kSlidingWindowNamespace[] = "sliding-window";
constexpr char kTokenBucketNamespace[] = "bucket";
constexpr char kViolationNamespace[] = "backoff-violations";

// Fallback reset horizon for a token bucket that could not be read.
constexpr int64_t kTokenBucketFailOpenResetMs = 60000;

// Upper bound on computed token-bucket waits; keeps millisecond arithmetic
// within int64 for arbitrarily small refill rates.
constexpr double kMaxWaitSeconds = 1e12;

// Seconds, rounded up, never below one: a TTL of zero would not be stored.
int CeilSeconds(int64_t ms) {
    return static_cast<int>(std::max<int64_t>(1, (ms + 999) / 1000));
}

void ValidateWindow(int64_t limit, int64_t window_ms) {
    if (limit <= 0) {
        throw std::invalid_argument("rate limit must be positive");
    }
    if (window_ms <= 0) {
        throw std::invalid_argument("rate limit window must be positive");
    }
}

} // namespace

const char* RateLimitAlgorithmName(RateLimitAlgorithm algorithm) {
    switch (algorithm) {
        case RateLimitAlgorithm::kFixedWindow: return "fixed_window";
        case RateLimitAlgorithm::kSlidingWindow: return "sliding_window";
        case RateLimitAlgorithm::kTokenBucket: return "token_bucket";
        case RateLimitAlgorithm::kExponentialBackoff: return "exponential_backoff";
    }
    return "unknown";
}

RateLimiter::Options RateLimiter::Options::FromConfig(const TollgateConfig& config) {
    Options options;
    options.token_bucket_ttl_seconds = config.rate_limit.token_bucket_ttl_seconds.get();
    return options;
}

RateLimiter::RateLimiter(AtomicStore& store, Options options, Clock& clock)
    : store_(store),
      options_(options),
      clock_(clock),
      pool_(std::make_unique<WorkerPool>(std::max<size_t>(1, options.worker_threads))) {}

RateLimiter::~RateLimiter() {
    pool_->Stop();
}

RateLimitResult RateLimiter::CheckLimit(const RateLimitConfig& config) {
    ValidateWindow(config.limit, config.window_ms);

    const int64_t now = clock_.NowMs();
    const int64_t window_start = (now / config.window_ms) * config.window_ms;
    const int64_t window_end = window_start + config.window_ms;
    const std::string bucket_key =
        store_.BuildKey(kFixedWindowNamespace, absl::StrCat(config.key, ":", window_start));

    RateLimitResult result;
    result.limit = config.limit;
    result.reset_time_ms = window_end;

    try {
        int64_t current = 0;
        std::optional<std::string> stored = store_.Get(bucket_key);
        if (stored && !absl::SimpleAtoi(*stored, &current)) {
            LOG(WARNING) << "Ignoring malformed fixed-window counter for " << config.key;
            current = 0;
        }

        int64_t count = current + 1;
        if (current < config.limit) {
            count = store_.ExecuteScript(AtomicScript::kIncrementWithExpire, {bucket_key},
                                         {std::to_string(CeilSeconds(window_end - now))});
        }

        // Concurrent callers can push the counter past the limit between the
        // read and the increment; the increment result is authoritative.
        if (count > config.limit) {
            result.allowed = false;
            result.remaining = 0;
            result.retry_after_seconds = (window_end - now + 999) / 1000;
            LOG(WARNING) << "Rate limit exceeded for " << config.key << ": " << current << "/"
                         << config.limit << ", retry after " << *result.retry_after_seconds << "s";
            return result;
        }

        result.allowed = true;
        result.remaining = std::max<int64_t>(0, config.limit - count);
        return result;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error checking rate limit for " << config.key << ": " << e.what()
                   << "; failing open";
        result.allowed = true;
        result.remaining = config.limit - 1;
        return result;
    }
}

RateLimitResult RateLimiter::CheckSlidingWindow(const std::string& key, int64_t limit, int64_t window_ms) {
    ValidateWindow(limit, window_ms);

    const int64_t now = clock_.NowMs();
    const int64_t window_start = now - window_ms;
    const std::string log_key = store_.BuildKey(kSlidingWindowNamespace, key);

    RateLimitResult result;
    result.limit = limit;

    try {
        pb::SlidingWindowLog stored_log;
        std::optional<std::string> stored = store_.Get(log_key);
        if (stored && !stored_log.ParseFromString(*stored)) {
            LOG(WARNING) << "Discarding unparsable sliding-window log for " << key;
            stored_log.Clear();
        }

        pb::SlidingWindowLog live;
        int64_t oldest = now;
        for (int64_t ts : stored_log.timestamps_ms()) {
            if (ts > window_start) {
                live.add_timestamps_ms(ts);
                oldest = std::min(oldest, ts);
            }
        }

        if (live.timestamps_ms_size() >= limit) {
            result.allowed = false;
            result.remaining = 0;
            result.reset_time_ms = oldest + window_ms;
            result.retry_after_seconds =
                std::max<int64_t>(1, (oldest + window_ms - now + 999) / 1000);
            VLOG(1) << "Sliding window full for " << key << " (" << live.timestamps_ms_size()
                    << "/" << limit << ")";
            return result;
        }

        live.add_timestamps_ms(now);
        store_.Set(log_key, live.SerializeAsString(), CeilSeconds(window_ms));

        result.allowed = true;
        result.remaining = limit - live.timestamps_ms_size();
        result.reset_time_ms = now + window_ms;
        return result;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error in sliding window rate limit for " << key << ": " << e.what()
                   << "; failing open";
        result.allowed = true;
        result.remaining = limit - 1;
        result.reset_time_ms = now + window_ms;
        return result;
    }
}

RateLimitResult RateLimiter::CheckTokenBucket(const std::string& key, int64_t capacity,
                                              double refill_rate, int64_t tokens_requested) {
    if (capacity <= 0) {
        throw std::invalid_argument("token bucket capacity must be positive");
    }
    if (!std::isfinite(refill_rate) || refill_rate <= 0.0) {
        throw std::invalid_argument("token bucket refill rate must be positive");
    }
    if (tokens_requested <= 0) {
        throw std::invalid_argument("requested tokens must be positive");
    }

    const int64_t now = clock_.NowMs();
    const std::string bucket_key = store_.BuildKey(kTokenBucketNamespace, key);

    RateLimitResult result;
    result.limit = capacity;

    try {
        pb::TokenBucketState bucket;
        bucket.set_tokens(static_cast<double>(capacity));
        bucket.set_last_refill_ms(now);

        std::optional<std::string> stored = store_.Get(bucket_key);
        if (stored && !bucket.ParseFromString(*stored)) {
            LOG(WARNING) << "Resetting unparsable token bucket for " << key;
            bucket.set_tokens(static_cast<double>(capacity));
            bucket.set_last_refill_ms(now);
        }

        const double elapsed_seconds = static_cast<double>(now - bucket.last_refill_ms()) / 1000.0;
        const double tokens_to_add = std::floor(std::max(0.0, elapsed_seconds) * refill_rate);
        const double tokens = std::min(static_cast<double>(capacity), bucket.tokens() + tokens_to_add);

        if (tokens < static_cast<double>(tokens_requested)) {
            const int64_t wait_seconds = static_cast<int64_t>(std::min(
                std::ceil((static_cast<double>(tokens_requested) - tokens) / refill_rate),
                kMaxWaitSeconds));
            result.allowed = false;
            result.remaining = static_cast<int64_t>(tokens);
            result.reset_time_ms = now + wait_seconds * 1000;
            result.retry_after_seconds = wait_seconds;
            VLOG(1) << "Token bucket " << key << " has " << tokens << " tokens, "
                    << tokens_requested << " requested";
            return result;
        }

        bucket.set_tokens(tokens - static_cast<double>(tokens_requested));
        bucket.set_last_refill_ms(now);
        store_.Set(bucket_key, bucket.SerializeAsString(), options_.token_bucket_ttl_seconds);

        result.allowed = true;
        result.remaining = static_cast<int64_t>(bucket.tokens());
        result.reset_time_ms = now + static_cast<int64_t>(std::min(
            (static_cast<double>(capacity) - bucket.tokens()) / refill_rate * 1000.0,
            kMaxWaitSeconds * 1000.0));
        return result;
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error in token bucket rate limit for " << key << ": " << e.what()
                   << "; failing open";
        result.allowed = true;
        result.remaining = capacity - tokens_requested;
        result.reset_time_ms = now + kTokenBucketFailOpenResetMs;
        return result;
    }
}

RateLimitResult RateLimiter::CheckWithBackoff(const std::string& key, int64_t base_limit, int64_t window_ms) {
    ValidateWindow(base_limit, window_ms);

    const std::string violation_key = store_.BuildKey(kViolationNamespace, key);

    int64_t violations = 0;
    try {
        std::optional<std::string> stored = store_.Get(violation_key);
        if (stored && !absl::SimpleAtoi(*stored, &violations)) {
            LOG(WARNING) << "Ignoring malformed violation counter for " << key;
            violations = 0;
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error reading violations for " << key << ": " << e.what()
                   << "; assuming none";
        violations = 0;
    }
    // 2^62 already exceeds any int64 limit.
    violations = std::clamp<int64_t>(violations, 0, 62);

    const int64_t factor = int64_t{1} << violations;
    const int64_t adjusted_limit = std::max<int64_t>(1, base_limit / factor);

    RateLimitResult result = CheckLimit({"backoff:" + key, adjusted_limit, window_ms});

    if (!result.allowed) {
        const double ttl_ms = static_cast<double>(window_ms) * static_cast<double>(factor);
        const int ttl_seconds = static_cast<int>(
            std::min<double>(std::ceil(ttl_ms / 1000.0), static_cast<double>(std::numeric_limits<int>::max())));
        try {
            store_.Set(violation_key, std::to_string(violations + 1), std::max(1, ttl_seconds));
        } catch (const std::exception& e) {
            LOG(ERROR) << "Error recording rate limit violation for " << key << ": " << e.what();
        }
        LOG(WARNING) << "Rate limit violation recorded with backoff for " << key
                     << ": violations=" << violations + 1 << " adjusted_limit=" << adjusted_limit
                     << " base_limit=" << base_limit;
    }
    return result;
}

RateLimitResult RateLimiter::Check(const RateLimitPolicy& policy) {
    switch (policy.algorithm) {
        case RateLimitAlgorithm::kFixedWindow:
            return CheckLimit({policy.key, policy.limit, policy.window_ms});
        case RateLimitAlgorithm::kSlidingWindow:
            return CheckSlidingWindow(policy.key, policy.limit, policy.window_ms);
        case RateLimitAlgorithm::kTokenBucket:
            return CheckTokenBucket(policy.key, policy.limit, policy.refill_rate, policy.tokens_requested);
        case RateLimitAlgorithm::kExponentialBackoff:
            return CheckWithBackoff(policy.key, policy.limit, policy.window_ms);
    }
    throw std::invalid_argument("unknown rate limit algorithm");
}

RateLimitResult RateLimiter::CheckMultipleLimits(const std::vector<RateLimitConfig>& configs) {
    if (configs.empty()) {
        throw std::invalid_argument("CheckMultipleLimits needs at least one config");
    }
    for (const auto& config : configs) {
        ValidateWindow(config.limit, config.window_ms);
    }

    std::vector<std::future<RateLimitResult>> pending;
    pending.reserve(configs.size());
    for (const auto& config : configs) {
        pending.push_back(pool_->Submit([this, config]() { return CheckLimit(config); }));
    }

    std::vector<RateLimitResult> results;
    results.reserve(pending.size());
    for (auto& future : pending) {
        results.push_back(future.get());
    }

    for (const auto& result : results) {
        if (!result.allowed) {
            return result;
        }
    }
    return *std::min_element(results.begin(), results.end(),
                             [](const RateLimitResult& a, const RateLimitResult& b) {
                                 return a.remaining < b.remaining;
                             });
}

} // namespace Tollgate
