#ifndef TOLLGATE_SRC_COMMON_CLOCK_H_
#define TOLLGATE_SRC_COMMON_CLOCK_H_

#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

namespace Tollgate {

/**
 * Wall-clock source used by every time-dependent component (rate windows,
 * signature freshness, breaker timeouts, lock retry sleeps).
 * All timestamps are milliseconds since the Unix epoch.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual int64_t NowMs() const = 0;

    // Blocks the calling thread for the given duration.
    virtual void SleepForMs(int64_t ms) = 0;

    int64_t NowSeconds() const { return NowMs() / 1000; }
};

class SystemClock final : public Clock {
public:
    int64_t NowMs() const override;
    void SleepForMs(int64_t ms) override;

    // Process-wide instance used when no clock is injected.
    static SystemClock& Instance();
};

/**
 * Deterministic clock for tests. Sleeping advances time instead of blocking,
 * and every requested sleep is recorded so retry schedules can be asserted.
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 1700000000000) : now_ms_(start_ms) {}

    int64_t NowMs() const override { return now_ms_.load(); }
    void SleepForMs(int64_t ms) override;

    void AdvanceMs(int64_t ms) { now_ms_ += ms; }
    void SetMs(int64_t ms) { now_ms_ = ms; }

    std::vector<int64_t> Sleeps() const;

private:
    std::atomic<int64_t> now_ms_;
    mutable std::mutex sleeps_mutex_;
    std::vector<int64_t> sleeps_;
};

} // namespace Tollgate

#endif // TOLLGATE_SRC_COMMON_CLOCK_H_
