/**
 * @file request_pool.hpp
 * @brief std::jthread worker pool that runs independent planning requests.
 *
 * Requests share nothing but read-only snapshots, so the pool needs no
 * coordination beyond its queue. Results come back through futures; an
 * exception thrown by a request is rethrown from its future.
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace course_planner {

class RequestPool {
public:
    /// `worker_count == 0` selects hardware concurrency.
    explicit RequestPool(size_t worker_count = 0);
    ~RequestPool();

    RequestPool(const RequestPool&) = delete;
    RequestPool& operator=(const RequestPool&) = delete;

    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& request);

    /// The callable receives the pool's stop token and may abandon early.
    template <std::invocable<std::stop_token> F>
    std::future<std::invoke_result_t<F, std::stop_token>> submit_cancellable(F&& request);

    /**
     * @brief Run `fn` on every input concurrently; results keep input order.
     */
    template <typename In, typename F>
    auto map_ordered(const std::vector<In>& inputs, F fn)
        -> std::vector<std::invoke_result_t<F, const In&>>;

    [[nodiscard]] size_t worker_count() const noexcept;
    [[nodiscard]] uint64_t completed_count() const noexcept;

private:
    using Job = std::function<void(std::stop_token)>;

    void enqueue(Job job);
    void run_worker(std::stop_token stop);

    std::vector<std::jthread> workers_;
    std::queue<Job> jobs_;
    mutable std::mutex jobs_mutex_;
    std::condition_variable_any jobs_cv_;
    std::atomic<uint64_t> completed_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> RequestPool::submit(F&& request) {
    return submit_cancellable([f = std::forward<F>(request)](std::stop_token) mutable {
        return f();
    });
}

template <std::invocable<std::stop_token> F>
std::future<std::invoke_result_t<F, std::stop_token>> RequestPool::submit_cancellable(F&& request) {
    using ReturnType = std::invoke_result_t<F, std::stop_token>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    enqueue([p = std::move(promise), f = std::forward<F>(request)](std::stop_token stop) mutable {
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

template <typename In, typename F>
auto RequestPool::map_ordered(const std::vector<In>& inputs, F fn)
    -> std::vector<std::invoke_result_t<F, const In&>> {
    using Out = std::invoke_result_t<F, const In&>;

    std::vector<std::future<Out>> pending;
    pending.reserve(inputs.size());
    for (const auto& input : inputs) {
        pending.push_back(submit([&input, fn] { return fn(input); }));
    }

    std::vector<Out> results;
    results.reserve(inputs.size());
    for (auto& f : pending) {
        results.push_back(f.get());
    }
    return results;
}

}  // namespace course_planner
