// =============================================================================
// Anchor Explain - Worker Pool Implementation
// =============================================================================

#include "anchor_explain/sampling/worker_pool.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace anchor {
namespace sampling {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
    }
    spdlog::debug("Worker pool started with {} threads", num_threads);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

std::future<void> WorkerPool::submit(std::function<void()> job) {
    std::packaged_task<void()> task(std::move(job));
    std::future<void> future = task.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            spdlog::warn("Job submitted to a stopped worker pool, ignoring");
            return {};
        }
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
    return future;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    spdlog::debug("Worker pool stopped after {} jobs", jobsExecuted());
}

size_t WorkerPool::jobsExecuted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_executed_;
}

bool WorkerPool::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stop_;
}

void WorkerPool::workerLoop() {
    while (true) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });

            // Remaining jobs are drained before the worker exits
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        // Exceptions thrown by the job are stored in its future
        task();

        std::lock_guard<std::mutex> lock(mutex_);
        ++jobs_executed_;
    }
}

}  // namespace sampling
}  // namespace anchor
