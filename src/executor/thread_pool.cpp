/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

#include <algorithm>

namespace agent_orchestrator {

ThreadPool::ThreadPool(size_t max_workers) {
    const size_t count = std::max<size_t>(max_workers, 1);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { worker_loop(stop); });
    }
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    pending_cv_.notify_all();

    // Join here: the queue and its mutex must outlive the workers.
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void ThreadPool::worker_loop(std::stop_token stop) {
    for (;;) {
        Task task;
        {
            std::unique_lock lock(pending_mutex_);
            pending_cv_.wait(lock, stop, [this] { return !pending_.empty(); });

            // Stop only once nothing is left to run.
            if (pending_.empty()) {
                if (stop.stop_requested()) return;
                continue;
            }
            task = std::move(pending_.front());
            pending_.pop();
        }
        run_task(task);
    }
}

void ThreadPool::run_task(Task& task) {
    const size_t now = ++active_tasks_;
    size_t seen = peak_active_.load();
    while (now > seen && !peak_active_.compare_exchange_weak(seen, now)) {}

    task();
    --active_tasks_;
}

size_t ThreadPool::queued_count() const {
    std::lock_guard lock(pending_mutex_);
    return pending_.size();
}

}  // namespace agent_orchestrator
