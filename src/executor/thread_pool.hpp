/**
 * @file thread_pool.hpp
 * @brief Bounded std::jthread worker pool with cooperative cancellation.
 * @author Dimitris Kafetzis
 *
 * Subtask evaluations are submitted here; each worker blocks inside one
 * sandbox invocation at a time, so the pool size is the cap on concurrently
 * running sandboxes.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace code_sandbox {

/**
 * @brief Thread pool using std::jthread for automatic join and stop_token support.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = 0);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    /// Submit a callable that accepts a stop_token.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& func);

    /// Ask every worker to stop once its current job finishes; queued jobs are dropped.
    void request_stop();

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

    /**
     * @brief Pool size for a batch of independent jobs.
     *
     * `requested` of 0 means hardware concurrency; the result never exceeds
     * the number of jobs and is at least 1.
     */
    [[nodiscard]] static size_t bounded_size(size_t requested, size_t jobs) noexcept;

private:
    void worker_loop(std::stop_token stop);
    void enqueue(std::function<void(std::stop_token)> task);

    std::vector<std::jthread> workers_;
    std::queue<std::function<void(std::stop_token)>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> ThreadPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f();
                p->set_value();
            } else {
                p->set_value(f());
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> ThreadPool::submit_cancellable(F&& func) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(func)](std::stop_token stop) mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                f(stop);
                p->set_value();
            } else {
                p->set_value(f(stop));
            }
        } catch (...) {
            p->set_exception(std::current_exception());
        }
    });
    return future;
}

}  // namespace code_sandbox
