#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace Tollgate {

/**
 * Fixed-size thread pool. Every submitted task yields a future, so callers
 * always own an explicit join point for the work they fan out.
 *
 * Tasks must not block on futures of other tasks in the same pool.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads = 4);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Run a callable on a worker thread. Exceptions surface from future::get().
    template<typename Callable>
    auto Submit(Callable&& callable) -> std::future<std::invoke_result_t<Callable>> {
        using ReturnType = std::invoke_result_t<Callable>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::forward<Callable>(callable));
        auto future = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("WorkerPool is stopped");
            }
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return future;
    }

    // Drain queued tasks and join the workers. Idempotent.
    void Stop();

    size_t size() const { return num_threads_; }

private:
    void WorkerThread();

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

} // namespace Tollgate
