/**
 * @file thread_pool.hpp
 * @brief std::jthread-based worker pool bounding how many agents run at once.
 *
 * The orchestrator sizes one pool to `max_concurrency` per run: submitting a
 * whole level queues the agents beyond the cap until a worker frees up.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace agent_orchestrator {

/**
 * @brief Fixed-size thread pool with a concurrency high-water mark.
 *
 * Destruction drains tasks that were already queued before the workers
 * join, so every future handed out by submit() is eventually satisfied.
 */
class ThreadPool {
public:
    /// A bound of 0 is treated as 1.
    explicit ThreadPool(size_t max_workers);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a callable; its result or exception arrives through the future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    [[nodiscard]] size_t active_count() const noexcept { return active_tasks_.load(); }
    [[nodiscard]] size_t peak_active() const noexcept { return peak_active_.load(); }
    [[nodiscard]] size_t queued_count() const;
    [[nodiscard]] size_t thread_count() const noexcept { return workers_.size(); }

private:
    using Task = std::function<void()>;

    void worker_loop(std::stop_token stop);
    void run_task(Task& task);

    std::vector<std::jthread> workers_;
    std::queue<Task> pending_;
    mutable std::mutex pending_mutex_;
    std::condition_variable_any pending_cv_;
    std::atomic<size_t> active_tasks_{0};
    std::atomic<size_t> peak_active_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using R = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<R>>();
    auto future = promise->get_future();

    Task task = [promise, f = std::forward<F>(func)]() mutable {
        try {
            if constexpr (std::is_void_v<R>) {
                f();
                promise->set_value();
            } else {
                promise->set_value(f());
            }
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    {
        std::lock_guard lock(pending_mutex_);
        pending_.push(std::move(task));
    }
    pending_cv_.notify_one();
    return future;
}

}  // namespace agent_orchestrator
