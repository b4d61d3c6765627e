#include <gtest/gtest.h>
#include "../../src/resilience/resilience_executor.h"

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

using namespace Tollgate;

class ResilienceExecutorTest : public ::testing::Test {
protected:
    ResilienceExecutorTest() : executor_(MakeOptions(), clock_) {}

    static ResilienceExecutor::Options MakeOptions() {
        ResilienceExecutor::Options options;
        options.worker_threads = 4;
        return options;
    }

    // Drives the breaker for key into OPEN with the default threshold.
    void OpenCircuit(const std::string& key) {
        for (int i = 0; i < 5; ++i) {
            EXPECT_THROW(executor_.WithCircuitBreaker(key, []() -> int {
                throw std::runtime_error("upstream 500");
            }), std::runtime_error);
        }
    }

    ManualClock clock_;
    ResilienceExecutor executor_;
};

TEST(DefaultRetryPredicateTest, MatchesTransientSignatures) {
    EXPECT_TRUE(DefaultRetryPredicate(std::runtime_error("Request timeout after 30000ms")));
    EXPECT_TRUE(DefaultRetryPredicate(std::runtime_error("read ECONNRESET")));
    EXPECT_TRUE(DefaultRetryPredicate(std::runtime_error("connect ECONNREFUSED 10.0.0.1:443")));
    EXPECT_TRUE(DefaultRetryPredicate(std::runtime_error("getaddrinfo ENOTFOUND api.example.com")));
    EXPECT_TRUE(DefaultRetryPredicate(std::runtime_error("HTTP 502 Bad Gateway")));
    EXPECT_TRUE(DefaultRetryPredicate(std::runtime_error("status=500")));

    EXPECT_FALSE(DefaultRetryPredicate(std::runtime_error("HTTP 404 Not Found")));
    EXPECT_FALSE(DefaultRetryPredicate(std::runtime_error("amount must be below 5000")));
    EXPECT_FALSE(DefaultRetryPredicate(std::invalid_argument("missing customer id")));
}

TEST(DefaultRetryPredicateTest, NeverRetriesOpenCircuitOrLockTimeout) {
    EXPECT_FALSE(DefaultRetryPredicate(CircuitOpenError("billing-api-503")));
    EXPECT_FALSE(DefaultRetryPredicate(CircuitOpenError("network-timeout")));
    EXPECT_FALSE(DefaultRetryPredicate(LockAcquisitionTimeout("tenant:acme", 500)));
    EXPECT_TRUE(DefaultRetryPredicate(StoreUnavailableError("atomic store Get failed (14): unavailable")));
}

TEST_F(ResilienceExecutorTest, NonRetryableErrorMakesOneAttempt) {
    int attempts = 0;
    EXPECT_THROW(executor_.WithRetry([&attempts]() -> int {
        attempts++;
        throw std::invalid_argument("card declined");
    }), std::invalid_argument);

    EXPECT_EQ(attempts, 1);
    EXPECT_TRUE(clock_.Sleeps().empty());
}

TEST_F(ResilienceExecutorTest, RetriesTransientFailuresWithExponentialBackoff) {
    int attempts = 0;
    int result = executor_.WithRetry([&attempts]() {
        if (++attempts < 3) {
            throw std::runtime_error("socket timeout");
        }
        return 42;
    });

    EXPECT_EQ(result, 42);
    EXPECT_EQ(attempts, 3);
    EXPECT_EQ(clock_.Sleeps(), (std::vector<int64_t>{1000, 2000}));
}

TEST_F(ResilienceExecutorTest, ExhaustionRethrowsLastErrorWithoutTrailingDelay) {
    int attempts = 0;
    try {
        executor_.WithRetry([&attempts]() {
            attempts++;
            throw std::runtime_error("503 attempt " + std::to_string(attempts));
        });
        FAIL() << "expected the last error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "503 attempt 3");
    }
    EXPECT_EQ(attempts, 3);
    EXPECT_EQ(clock_.Sleeps(), (std::vector<int64_t>{1000, 2000}));
}

TEST_F(ResilienceExecutorTest, FlatDelayAndCustomPredicate) {
    RetryOptions options;
    options.max_attempts = 4;
    options.delay_ms = 250;
    options.exponential_backoff = false;
    options.retry_on = [](const std::exception& e) {
        return std::string(e.what()) == "try again";
    };

    int attempts = 0;
    EXPECT_THROW(executor_.WithRetry([&attempts]() {
        attempts++;
        throw std::runtime_error("try again");
    }, options), std::runtime_error);

    EXPECT_EQ(attempts, 4);
    EXPECT_EQ(clock_.Sleeps(), (std::vector<int64_t>{250, 250, 250}));
}

TEST_F(ResilienceExecutorTest, CircuitOpensAtThresholdAndFailsFast) {
    OpenCircuit("billing");

    auto state = executor_.GetCircuitBreakerStatus("billing");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->phase, CircuitPhase::kOpen);
    EXPECT_EQ(state->consecutive_failures, 5);
    EXPECT_EQ(state->last_failure_ms, clock_.NowMs());

    int invoked = 0;
    clock_.AdvanceMs(59999);
    try {
        executor_.WithCircuitBreaker("billing", [&invoked]() { return ++invoked; });
        FAIL() << "expected CircuitOpenError";
    } catch (const CircuitOpenError& e) {
        EXPECT_EQ(e.key(), "billing");
        EXPECT_STREQ(e.what(), "Circuit breaker billing is OPEN");
    }
    EXPECT_EQ(invoked, 0);
}

TEST_F(ResilienceExecutorTest, SuccessfulTrialClosesCircuit) {
    OpenCircuit("billing");
    clock_.AdvanceMs(60000);

    EXPECT_EQ(executor_.WithCircuitBreaker("billing", []() { return 7; }), 7);

    auto state = executor_.GetCircuitBreakerStatus("billing");
    EXPECT_EQ(state->phase, CircuitPhase::kClosed);
    EXPECT_EQ(state->consecutive_failures, 0);
    EXPECT_EQ(executor_.WithCircuitBreaker("billing", []() { return 8; }), 8);
}

TEST_F(ResilienceExecutorTest, FailedTrialReopensCircuit) {
    OpenCircuit("billing");
    clock_.AdvanceMs(60000);

    EXPECT_THROW(executor_.WithCircuitBreaker("billing", []() -> int {
        throw std::runtime_error("still down");
    }), std::runtime_error);

    auto state = executor_.GetCircuitBreakerStatus("billing");
    EXPECT_EQ(state->phase, CircuitPhase::kOpen);
    EXPECT_EQ(state->last_failure_ms, clock_.NowMs());
    EXPECT_THROW(executor_.WithCircuitBreaker("billing", []() { return 1; }), CircuitOpenError);
}

TEST_F(ResilienceExecutorTest, OnlyOneHalfOpenTrialAtATime) {
    OpenCircuit("search");
    clock_.AdvanceMs(60000);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> release_future = release.get_future().share();

    std::thread trial([&]() {
        executor_.WithCircuitBreaker("search", [&]() {
            started.set_value();
            release_future.wait();
            return 1;
        });
    });

    started.get_future().wait();
    EXPECT_EQ(executor_.GetCircuitBreakerStatus("search")->phase, CircuitPhase::kHalfOpen);
    EXPECT_THROW(executor_.WithCircuitBreaker("search", []() { return 2; }), CircuitOpenError);

    release.set_value();
    trial.join();
    EXPECT_EQ(executor_.GetCircuitBreakerStatus("search")->phase, CircuitPhase::kClosed);
}

TEST_F(ResilienceExecutorTest, ClosedCircuitSuccessLeavesFailureCount) {
    EXPECT_THROW(executor_.WithCircuitBreaker("crm", []() -> int {
        throw std::runtime_error("blip");
    }), std::runtime_error);
    executor_.WithCircuitBreaker("crm", []() { return 0; });

    auto state = executor_.GetCircuitBreakerStatus("crm");
    EXPECT_EQ(state->phase, CircuitPhase::kClosed);
    EXPECT_EQ(state->consecutive_failures, 1);
}

TEST_F(ResilienceExecutorTest, TryWithCircuitBreakerReportsOutcomes) {
    Result<int> value = executor_.TryWithCircuitBreaker("mail", []() { return 5; });
    ASSERT_TRUE(value.ok());
    EXPECT_EQ(value.value(), 5);

    Result<Unit> failed = executor_.TryWithCircuitBreaker("mail", []() {
        throw std::runtime_error("smtp rejected");
    });
    EXPECT_EQ(failed.code(), ErrorCode::kOperationFailed);
    EXPECT_EQ(failed.error().message, "smtp rejected");

    CircuitBreakerOptions strict;
    strict.failure_threshold = 1;
    executor_.TryWithCircuitBreaker("sms", []() { throw std::runtime_error("down"); }, strict);
    Result<int> refused = executor_.TryWithCircuitBreaker("sms", []() { return 1; }, strict);
    EXPECT_EQ(refused.code(), ErrorCode::kCircuitOpen);
    EXPECT_EQ(refused.value_or(-1), -1);
    EXPECT_EQ(value.value_or(-1), 5);
}

TEST_F(ResilienceExecutorTest, RetryDoesNotHammerAnOpenCircuit) {
    CircuitBreakerOptions strict;
    strict.failure_threshold = 1;
    EXPECT_THROW(executor_.WithCircuitBreaker("billing-api-503", []() -> int {
        throw std::runtime_error("upstream 503");
    }, strict), std::runtime_error);
    const size_t sleeps_before = clock_.Sleeps().size();

    int attempts = 0;
    EXPECT_THROW(executor_.WithRetry([&]() {
        ++attempts;
        return executor_.WithCircuitBreaker("billing-api-503", []() { return 1; }, strict);
    }), CircuitOpenError);

    EXPECT_EQ(attempts, 1);
    EXPECT_EQ(clock_.Sleeps().size(), sleeps_before);
}

TEST_F(ResilienceExecutorTest, MonitoringAndManualReset) {
    EXPECT_FALSE(executor_.GetCircuitBreakerStatus("unknown").has_value());
    EXPECT_FALSE(executor_.ResetCircuitBreaker("unknown"));

    OpenCircuit("a");
    executor_.WithCircuitBreaker("b", []() { return 0; });

    auto all = executor_.GetAllCircuitBreakers();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all["a"].phase, CircuitPhase::kOpen);
    EXPECT_EQ(all["b"].phase, CircuitPhase::kClosed);
    EXPECT_STREQ(CircuitPhaseName(all["a"].phase), "OPEN");

    EXPECT_TRUE(executor_.ResetCircuitBreaker("a"));
    auto state = executor_.GetCircuitBreakerStatus("a");
    EXPECT_EQ(state->phase, CircuitPhase::kClosed);
    EXPECT_EQ(state->consecutive_failures, 0);
    EXPECT_EQ(state->last_failure_ms, 0);
    EXPECT_EQ(executor_.WithCircuitBreaker("a", []() { return 3; }), 3);
}

TEST_F(ResilienceExecutorTest, ExecuteAllSettledKeepsOrderAndCountsFailures) {
    std::vector<std::function<int()>> operations;
    for (int i = 0; i < 6; ++i) {
        operations.push_back([i]() {
            if (i % 3 == 0) {
                throw std::runtime_error("op " + std::to_string(i) + " failed");
            }
            return i * 10;
        });
    }

    auto batch = executor_.ExecuteAllSettled(operations);
    ASSERT_EQ(batch.total(), 6u);
    EXPECT_EQ(batch.failed, 2u);
    EXPECT_FALSE(batch.all_fulfilled());

    EXPECT_FALSE(batch.outcomes[0].fulfilled);
    EXPECT_EQ(batch.outcomes[0].reason, "op 0 failed");
    EXPECT_TRUE(batch.outcomes[0].error != nullptr);
    EXPECT_TRUE(batch.outcomes[1].fulfilled);
    EXPECT_EQ(*batch.outcomes[1].value, 10);
    EXPECT_EQ(*batch.outcomes[5].value, 50);
    EXPECT_FALSE(batch.outcomes[3].fulfilled);
}

TEST_F(ResilienceExecutorTest, ExecuteAllSettledRunsVoidOperations) {
    std::atomic<int> ran{0};
    std::vector<std::function<void()>> operations(8, [&ran]() { ran++; });

    auto batch = executor_.ExecuteAllSettled(operations);
    EXPECT_TRUE(batch.all_fulfilled());
    EXPECT_EQ(ran.load(), 8);
}

TEST_F(ResilienceExecutorTest, CacheInvalidationContinuesPastFailures) {
    std::atomic<int> ran{0};
    std::vector<std::function<void()>> operations;
    for (int i = 0; i < 12; ++i) {
        operations.push_back([i, &ran]() {
            ran++;
            if (i == 3 || i == 7) {
                throw std::runtime_error("cache node unreachable");
            }
        });
    }

    InvalidationReport report = executor_.SafeCacheInvalidation(operations);
    EXPECT_EQ(report.total, 12u);
    EXPECT_EQ(report.failed, 2u);
    EXPECT_EQ(report.batches, 3u);
    EXPECT_EQ(ran.load(), 12);
}

TEST_F(ResilienceExecutorTest, CacheInvalidationFailFastStopsLaterBatches) {
    std::atomic<int> ran{0};
    std::vector<std::function<void()>> operations;
    for (int i = 0; i < 10; ++i) {
        operations.push_back([i, &ran]() {
            ran++;
            if (i == 2) {
                throw std::runtime_error("cache node unreachable");
            }
        });
    }

    BatchOptions options;
    options.continue_on_error = false;
    options.max_parallel = 5;
    EXPECT_THROW(executor_.SafeCacheInvalidation(operations, options), std::runtime_error);
    // The failing batch finishes; the second batch never starts
    EXPECT_EQ(ran.load(), 5);
}

TEST_F(ResilienceExecutorTest, CacheInvalidationRejectsNonPositiveParallelism) {
    BatchOptions options;
    options.max_parallel = 0;
    EXPECT_THROW(executor_.SafeCacheInvalidation({[]() {}}, options), std::invalid_argument);
}

TEST(ResilienceExecutorOptionsTest, FromConfig) {
    TollgateConfig config;
    config.resilience.max_attempts.set(5);
    config.resilience.exponential_backoff.set(false);
    config.resilience.open_timeout_ms.set(1000);

    ResilienceExecutor::Options options = ResilienceExecutor::Options::FromConfig(config);
    EXPECT_EQ(options.retry.max_attempts, 5);
    EXPECT_EQ(options.retry.delay_ms, 1000);
    EXPECT_FALSE(options.retry.exponential_backoff);
    EXPECT_EQ(options.breaker.failure_threshold, 5);
    EXPECT_EQ(options.breaker.open_timeout_ms, 1000);
    EXPECT_EQ(options.batch.max_parallel, 5);
    EXPECT_TRUE(options.batch.continue_on_error);
    EXPECT_EQ(options.worker_threads, 8u);
}

TEST(ResilienceExecutorOptionsTest, DefaultConstructedExecutorUsesDefaults) {
    ResilienceExecutor executor;
    EXPECT_EQ(executor.options().retry.max_attempts, 3);
    EXPECT_EQ(executor.options().retry.delay_ms, 1000);
    EXPECT_EQ(executor.options().breaker.failure_threshold, 5);
    EXPECT_EQ(executor.options().breaker.open_timeout_ms, 60000);
    EXPECT_EQ(executor.options().batch.max_parallel, 5);
    EXPECT_EQ(executor.WithCircuitBreaker("defaults", []() { return 3; }), 3);
}
