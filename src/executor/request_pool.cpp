/**
 * @file request_pool.cpp
 * @brief RequestPool implementation.
 */

#include "executor/request_pool.hpp"

namespace course_planner {

RequestPool::RequestPool(size_t worker_count) {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
        if (worker_count == 0) worker_count = 2;
    }

    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this](std::stop_token stop) { run_worker(stop); });
    }
}

RequestPool::~RequestPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    jobs_cv_.notify_all();
    // Join before the queue and condition variable go away; queued jobs are drained first.
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void RequestPool::enqueue(Job job) {
    {
        std::lock_guard lock(jobs_mutex_);
        jobs_.push(std::move(job));
    }
    jobs_cv_.notify_one();
}

void RequestPool::run_worker(std::stop_token stop) {
    for (;;) {
        Job job;
        {
            std::unique_lock lock(jobs_mutex_);
            jobs_cv_.wait(lock, stop, [this] { return !jobs_.empty(); });
            if (jobs_.empty()) return;  // stop requested and nothing left

            job = std::move(jobs_.front());
            jobs_.pop();
        }

        job(stop);
        ++completed_;
    }
}

size_t RequestPool::worker_count() const noexcept {
    return workers_.size();
}

uint64_t RequestPool::completed_count() const noexcept {
    return completed_.load();
}

}  // namespace course_planner
