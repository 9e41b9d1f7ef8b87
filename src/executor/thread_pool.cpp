/**
 * @file thread_pool.cpp
 * @brief ThreadPool implementation.
 */

#include "executor/thread_pool.hpp"

namespace pipeflow {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token shutdown) {
            worker_loop(shutdown);
        });
    }
}

ThreadPool::~ThreadPool() {
    cancel_source_.request_stop();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();
    // Join before the queue and its mutex are destroyed.
    workers_.clear();
}

void ThreadPool::enqueue(Job job) {
    {
        std::lock_guard lock(queue_mutex_);
        job_queue_.push(std::move(job));
    }
    queue_cv_.notify_one();
}

void ThreadPool::worker_loop(std::stop_token shutdown) {
    while (!shutdown.stop_requested()) {
        Job job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, shutdown, [this] { return !job_queue_.empty(); });

            if (job_queue_.empty()) continue;

            job = std::move(job_queue_.front());
            job_queue_.pop();
            ++active_jobs_;
        }

        job(cancel_source_.get_token());

        {
            std::lock_guard lock(queue_mutex_);
            --active_jobs_;
        }
        idle_cv_.notify_all();
    }
}

void ThreadPool::cancel_all() noexcept {
    cancel_source_.request_stop();
}

bool ThreadPool::cancel_requested() const noexcept {
    return cancel_source_.stop_requested();
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return job_queue_.empty() && active_jobs_.load() == 0; });
}

size_t ThreadPool::active_count() const noexcept {
    return active_jobs_.load();
}

size_t ThreadPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return job_queue_.size();
}

size_t ThreadPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace pipeflow
