/// @file thread_pool.cpp
/// @brief Worker pool for deadline-bounded model and store calls

#include "thread_pool.h"

namespace insightx {

namespace {

constexpr size_t kFallbackWorkers = 4;

}  // namespace

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
    }
    if (num_threads == 0) {
        num_threads = kFallbackWorkers;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { WorkerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_.store(true, std::memory_order_release);
    }
    condition_.notify_all();

    // Abandoned calls still hold a worker; joining waits for them to return
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::NextTask(std::function<void()>* task) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] {
        return !tasks_.empty() || stop_.load(std::memory_order_acquire);
    });
    // Queued calls are drained before shutdown
    if (tasks_.empty()) {
        return false;
    }
    *task = std::move(tasks_.front());
    tasks_.pop();
    active_tasks_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void ThreadPool::FinishTask() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_tasks_.fetch_sub(1, std::memory_order_relaxed);
    }
    completion_condition_.notify_all();
}

void ThreadPool::WorkerLoop() {
    std::function<void()> task;
    while (NextTask(&task)) {
        // packaged_task stores any exception in the caller's future
        task();
        task = nullptr;
        FinishTask();
    }
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + active_tasks_.load(std::memory_order_relaxed);
}

void ThreadPool::Wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    completion_condition_.wait(lock, [this] {
        return tasks_.empty() && active_tasks_.load(std::memory_order_relaxed) == 0;
    });
}

}  // namespace insightx
