#pragma once

#include <string>
#include <type_traits>
#include <utility>

#include "../common/clock.h"
#include "../common/configuration.h"
#include "../common/errors.h"
#include "../common/result.h"
#include "../store/atomic_store.h"

namespace Tollgate {

class LockGuard;

/**
 * Advisory mutual exclusion over an arbitrary resource key, coordinated
 * through the shared AtomicStore.
 *
 * A lock is a key holding a random holder token with a TTL. Ownership is
 * proven by the token alone: release and extend are compare-and-act scripts
 * that only touch the key while it still holds the caller's token. The TTL
 * bounds how long a crashed holder can keep the resource.
 */
class DistributedMutex {
public:
    struct Options {
        int default_ttl_seconds = 30;
        int retry_delay_ms = 50;
        int max_retries = 20;

        static Options FromConfig(const TollgateConfig& config);
    };

    explicit DistributedMutex(AtomicStore& store) : DistributedMutex(store, Options()) {}
    DistributedMutex(AtomicStore& store, Options options,
                     Clock& clock = SystemClock::Instance());

    // Acquire with the configured TTL and retry budget.
    std::string Acquire(const std::string& key);

    /**
     * Attempts set-if-not-exists once plus up to max_retries more times,
     * sleeping retry_delay_ms between attempts.
     * Returns the holder token; throws LockAcquisitionTimeout when every
     * attempt found the lock held. Store errors propagate.
     */
    std::string Acquire(const std::string& key, int ttl_seconds, int max_retries);

    // Same as Acquire, reported as kLockTimeout / kStoreUnavailable instead of thrown.
    Result<std::string> TryAcquire(const std::string& key, int ttl_seconds, int max_retries);

    // False if the lock expired or belongs to another token. Never throws.
    bool Release(const std::string& key, const std::string& token);

    // Resets the TTL if token still owns the lock. Never throws.
    bool Extend(const std::string& key, const std::string& token, int ttl_seconds);

    // False when unlocked or the store is unreachable.
    bool IsLocked(const std::string& key);

    /**
     * Runs fn while holding the lock; the lock is released on every exit
     * path, including exceptions thrown by fn. ttl_seconds <= 0 uses the
     * configured default.
     */
    template<typename Fn>
    auto WithLock(const std::string& key, Fn&& fn, int ttl_seconds = 0)
        -> std::invoke_result_t<Fn>;

    // WithLock reported as a Result: kLockTimeout, kStoreUnavailable or
    // kOperationFailed (fn threw) instead of exceptions.
    template<typename Fn>
    auto TryWithLock(const std::string& key, Fn&& fn, int ttl_seconds = 0)
        -> Result<std::conditional_t<std::is_void_v<std::invoke_result_t<Fn>>, Unit,
                                     std::invoke_result_t<Fn>>>;

    // 128 random bits, hex encoded.
    static std::string GenerateToken();

    const Options& options() const { return options_; }

private:
    std::string FullKey(const std::string& key) const;
    int EffectiveTtl(int ttl_seconds) const {
        return ttl_seconds > 0 ? ttl_seconds : options_.default_ttl_seconds;
    }

    AtomicStore& store_;
    Options options_;
    Clock& clock_;
};

/**
 * Scoped lock ownership: releases the lock when it goes out of scope.
 */
class LockGuard {
public:
    LockGuard(DistributedMutex& mutex, std::string key, std::string token)
        : mutex_(&mutex), key_(std::move(key)), token_(std::move(token)) {}

    ~LockGuard() { Release(); }

    // Disable copy
    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;

    // Enable move
    LockGuard(LockGuard&& other) noexcept
        : mutex_(other.mutex_), key_(std::move(other.key_)), token_(std::move(other.token_)) {
        other.mutex_ = nullptr;
    }

    // Release early. Returns whether the lock was still ours.
    bool Release() {
        if (mutex_ == nullptr) {
            return false;
        }
        DistributedMutex* mutex = mutex_;
        mutex_ = nullptr;
        return mutex->Release(key_, token_);
    }

    bool owns_lock() const { return mutex_ != nullptr; }
    const std::string& token() const { return token_; }

private:
    DistributedMutex* mutex_;
    std::string key_;
    std::string token_;
};

template<typename Fn>
auto DistributedMutex::WithLock(const std::string& key, Fn&& fn, int ttl_seconds)
    -> std::invoke_result_t<Fn> {
    LockGuard guard(*this, key, Acquire(key, EffectiveTtl(ttl_seconds), options_.max_retries));
    return std::forward<Fn>(fn)();
}

template<typename Fn>
auto DistributedMutex::TryWithLock(const std::string& key, Fn&& fn, int ttl_seconds)
    -> Result<std::conditional_t<std::is_void_v<std::invoke_result_t<Fn>>, Unit,
                                 std::invoke_result_t<Fn>>> {
    using Value = std::conditional_t<std::is_void_v<std::invoke_result_t<Fn>>, Unit,
                                     std::invoke_result_t<Fn>>;

    Result<std::string> token = TryAcquire(key, EffectiveTtl(ttl_seconds), options_.max_retries);
    if (!token.ok()) {
        return token.error();
    }
    LockGuard guard(*this, key, token.value());
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
            std::forward<Fn>(fn)();
            return Value{};
        } else {
            return Value(std::forward<Fn>(fn)());
        }
    } catch (const std::exception& e) {
        return Error{ErrorCode::kOperationFailed, e.what(), std::current_exception()};
    }
}

} // namespace Tollgate
