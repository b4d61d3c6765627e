#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/concurrency/distributed_mutex.h"
#include "../../src/store/in_memory_store.h"
#include "../mocks/mock_atomic_store.h"

#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Tollgate;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class DistributedMutexTest : public ::testing::Test {
protected:
    static DistributedMutex::Options FastRetry(int max_retries) {
        DistributedMutex::Options options;
        options.max_retries = max_retries;
        options.retry_delay_ms = 50;
        return options;
    }

    ManualClock clock_;
    InMemoryAtomicStore store_{clock_, "tollgate:"};
};

TEST_F(DistributedMutexTest, AcquireStoresTokenUnderNamespacedKey) {
    DistributedMutex mutex(store_, FastRetry(0), clock_);
    const std::string token = mutex.Acquire("invoice-42", 30, 0);

    EXPECT_EQ(token.size(), 32u);
    auto stored = store_.Get("tollgate:distributed-lock:invoice-42");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(*stored, token);
    EXPECT_EQ(*store_.TtlMs("tollgate:distributed-lock:invoice-42"), 30000);
    EXPECT_TRUE(mutex.IsLocked("invoice-42"));
}

TEST_F(DistributedMutexTest, TokensAreUnique) {
    std::set<std::string> tokens;
    for (int i = 0; i < 100; ++i) {
        tokens.insert(DistributedMutex::GenerateToken());
    }
    EXPECT_EQ(tokens.size(), 100u);
}

TEST_F(DistributedMutexTest, HeldLockTimesOutAfterRetryBudget) {
    DistributedMutex mutex(store_, FastRetry(3), clock_);
    mutex.Acquire("resource", 30, 0);

    try {
        mutex.Acquire("resource", 30, 3);
        FAIL() << "expected LockAcquisitionTimeout";
    } catch (const LockAcquisitionTimeout& e) {
        EXPECT_EQ(e.key(), "resource");
        EXPECT_EQ(e.code(), ErrorCode::kLockTimeout);
    }
    // Four attempts, three sleeps; none after the last attempt
    EXPECT_EQ(clock_.Sleeps(), (std::vector<int64_t>{50, 50, 50}));
}

TEST_F(DistributedMutexTest, AcquireSucceedsOnceHolderExpires) {
    DistributedMutex mutex(store_, FastRetry(5), clock_);
    mutex.Acquire("resource", 1, 0);
    clock_.AdvanceMs(900);

    // Sleeps advance the manual clock past the one second TTL
    EXPECT_NO_THROW(mutex.Acquire("resource", 30, 5));
    EXPECT_EQ(clock_.Sleeps().size(), 2u);
}

TEST_F(DistributedMutexTest, ConcurrentAcquireAdmitsOneHolder) {
    DistributedMutex mutex(store_, FastRetry(0), clock_);
    std::atomic<int> holders{0};
    std::atomic<int> timeouts{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            try {
                mutex.Acquire("shared", 30, 0);
                holders++;
            } catch (const LockAcquisitionTimeout&) {
                timeouts++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(holders.load(), 1);
    EXPECT_EQ(timeouts.load(), 7);
}

TEST_F(DistributedMutexTest, ForeignTokenCannotReleaseOrExtend) {
    DistributedMutex mutex(store_, FastRetry(0), clock_);
    const std::string token = mutex.Acquire("resource", 30, 0);

    EXPECT_FALSE(mutex.Release("resource", "not-the-holder"));
    EXPECT_FALSE(mutex.Extend("resource", "not-the-holder", 60));
    EXPECT_TRUE(mutex.IsLocked("resource"));

    EXPECT_TRUE(mutex.Extend("resource", token, 60));
    EXPECT_EQ(*store_.TtlMs("tollgate:distributed-lock:resource"), 60000);
    EXPECT_TRUE(mutex.Release("resource", token));
    EXPECT_FALSE(mutex.IsLocked("resource"));
    EXPECT_FALSE(mutex.Release("resource", token));
}

TEST_F(DistributedMutexTest, ExpiredLockCannotBeExtended) {
    DistributedMutex mutex(store_, FastRetry(0), clock_);
    const std::string token = mutex.Acquire("resource", 1, 0);
    clock_.AdvanceMs(1000);
    EXPECT_FALSE(mutex.Extend("resource", token, 30));
    EXPECT_FALSE(mutex.Release("resource", token));
}

TEST_F(DistributedMutexTest, WithLockReleasesOnReturnAndThrow) {
    DistributedMutex mutex(store_, FastRetry(0), clock_);

    int value = mutex.WithLock("job", [&]() {
        EXPECT_TRUE(mutex.IsLocked("job"));
        return 7;
    });
    EXPECT_EQ(value, 7);
    EXPECT_FALSE(mutex.IsLocked("job"));

    EXPECT_THROW(mutex.WithLock("job", []() { throw std::runtime_error("job failed"); }),
                 std::runtime_error);
    EXPECT_FALSE(mutex.IsLocked("job"));
}

TEST_F(DistributedMutexTest, TryWithLockReportsOutcomes) {
    DistributedMutex mutex(store_, FastRetry(1), clock_);

    Result<int> ok = mutex.TryWithLock("job", []() { return 3; });
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(ok.value(), 3);

    Result<Unit> failed = mutex.TryWithLock("job", []() { throw std::runtime_error("bad input"); });
    EXPECT_EQ(failed.code(), ErrorCode::kOperationFailed);
    EXPECT_EQ(failed.error().message, "bad input");
    EXPECT_FALSE(mutex.IsLocked("job"));

    const std::string token = mutex.Acquire("job");
    Result<Unit> busy = mutex.TryWithLock("job", []() {});
    EXPECT_EQ(busy.code(), ErrorCode::kLockTimeout);
    EXPECT_TRUE(mutex.Release("job", token));
}

TEST_F(DistributedMutexTest, LockGuardReleasesOnce) {
    DistributedMutex mutex(store_, FastRetry(0), clock_);
    {
        LockGuard guard(mutex, "guarded", mutex.Acquire("guarded"));
        EXPECT_TRUE(guard.owns_lock());
        LockGuard moved(std::move(guard));
        EXPECT_FALSE(guard.owns_lock());
        EXPECT_TRUE(mutex.IsLocked("guarded"));
        EXPECT_TRUE(moved.Release());
        EXPECT_FALSE(moved.Release());
    }
    EXPECT_FALSE(mutex.IsLocked("guarded"));
}

TEST(DistributedMutexStoreFailureTest, AcquireErrorsPropagateReleaseErrorsDoNot) {
    MockAtomicStore store;
    ManualClock clock;
    DistributedMutex mutex(store, DistributedMutex::Options(), clock);

    EXPECT_CALL(store, SetIfNotExists(_, _, _))
        .WillRepeatedly(Throw(StoreUnavailableError("connection refused")));
    EXPECT_CALL(store, ExecuteScript(_, _, _))
        .WillRepeatedly(Throw(StoreUnavailableError("connection refused")));
    EXPECT_CALL(store, Get(_))
        .WillRepeatedly(Throw(StoreUnavailableError("connection refused")));

    EXPECT_THROW(mutex.Acquire("resource"), StoreUnavailableError);
    EXPECT_TRUE(clock.Sleeps().empty());
    EXPECT_EQ(mutex.TryAcquire("resource", 30, 3).code(), ErrorCode::kStoreUnavailable);
    EXPECT_FALSE(mutex.Release("resource", "token"));
    EXPECT_FALSE(mutex.Extend("resource", "token", 30));
    EXPECT_FALSE(mutex.IsLocked("resource"));
}

TEST(DistributedMutexOptionsTest, FromConfigUsesLockSection) {
    TollgateConfig config;
    DistributedMutex::Options defaults = DistributedMutex::Options::FromConfig(config);
    EXPECT_EQ(defaults.default_ttl_seconds, 30);
    EXPECT_EQ(defaults.retry_delay_ms, 50);
    EXPECT_EQ(defaults.max_retries, 20);
}

TEST(DistributedMutexOptionsTest, StoreOnlyConstructorUsesDefaults) {
    InMemoryAtomicStore store;
    DistributedMutex mutex(store);
    EXPECT_EQ(mutex.options().default_ttl_seconds, 30);
    EXPECT_EQ(mutex.options().retry_delay_ms, 50);
    EXPECT_EQ(mutex.options().max_retries, 20);

    const std::string token = mutex.Acquire("defaults");
    EXPECT_TRUE(mutex.IsLocked("defaults"));
    EXPECT_TRUE(mutex.Release("defaults", token));
}
