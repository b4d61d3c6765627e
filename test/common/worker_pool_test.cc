#include <gtest/gtest.h>
#include "../../src/common/worker_pool.h"

#include <atomic>
#include <stdexcept>
#include <vector>

using namespace Tollgate;

TEST(WorkerPoolTest, SubmitReturnsResults) {
    WorkerPool pool(3);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.Submit([i]() { return i * i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(WorkerPoolTest, ExceptionsSurfaceThroughFuture) {
    WorkerPool pool(1);
    auto future = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(WorkerPoolTest, StopDrainsQueuedTasks) {
    std::atomic<int> ran{0};
    WorkerPool pool(2);
    for (int i = 0; i < 50; ++i) {
        pool.Submit([&ran]() { ran++; });
    }
    pool.Stop();
    EXPECT_EQ(ran.load(), 50);
}

TEST(WorkerPoolTest, SubmitAfterStopThrows) {
    WorkerPool pool(1);
    pool.Stop();
    pool.Stop();  // idempotent
    EXPECT_THROW(pool.Submit([]() { return 1; }), std::runtime_error);
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.Submit([]() { return 7; }).get(), 7);
}
