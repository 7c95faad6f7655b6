#pragma once

/// @file thread_pool.h
/// @brief Worker pool used to bound blocking external calls with a deadline

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace insightx {

/// @brief A fixed-size thread pool
///
/// Model and store calls are issued here so the caller can stop waiting once
/// the call's timeout elapses (see RunWithTimeout). A call that is abandoned
/// keeps running on its worker until the underlying client returns.
class ThreadPool {
public:
    /// @param num_threads Number of worker threads (0: hardware concurrency)
    explicit ThreadPool(size_t num_threads = 0);

    /// @brief Runs every queued call, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Queue a call
    /// @return Future for the call's result
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    size_t Size() const { return workers_.size(); }

    /// @brief Queued plus running tasks
    size_t PendingTasks() const;

    /// @brief Block until the queue is empty and no call is running
    void Wait();

private:
    void WorkerLoop();

    /// Blocks for the next task; false once stopped and drained
    bool NextTask(std::function<void()>* task);
    void FinishTask();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_condition_;

    std::atomic<bool> stop_{false};
    std::atomic<size_t> active_tasks_{0};
};

template <typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using return_type = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_.load(std::memory_order_acquire)) {
            throw std::runtime_error("Cannot submit task to stopped thread pool");
        }
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

/// @brief Run a status-returning call on the pool and wait at most `timeout`
///
/// Everything the callable touches must be owned by the callable itself
/// (capture shared_ptrs and copies), since it may outlive the caller.
/// @param what Short description used in the timeout message
/// @return The call's result, or kResourceExhausted when the deadline passes
template <typename T, typename F>
absl::StatusOr<T> RunWithTimeout(ThreadPool& pool,
                                 std::chrono::milliseconds timeout,
                                 std::string_view what,
                                 F&& call) {
    std::future<absl::StatusOr<T>> future = pool.Submit(std::forward<F>(call));
    if (future.wait_for(timeout) == std::future_status::timeout) {
        return ResourceExhaustedError(
            absl::StrCat(what, " timed out after ", timeout.count(), " ms"));
    }
    return future.get();
}

}  // namespace insightx
