#pragma once

// =============================================================================
// Anchor Explain - Worker Pool
// =============================================================================
//
// Fixed-size FIFO pool of worker threads used by the sampling service.
// Jobs are submitted as callables and observed through std::future.
//

#include "anchor_explain/common.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace anchor {
namespace sampling {

class WorkerPool : NonMovable {
  public:
    explicit WorkerPool(size_t num_threads);
    ~WorkerPool();

    /// Queue a job. The returned future becomes ready once the job finished.
    /// Returns an invalid future after shutdown().
    std::future<void> submit(std::function<void()> job);

    /// Drain remaining jobs and join all workers
    void shutdown();

    [[nodiscard]] size_t numThreads() const { return workers_.size(); }
    [[nodiscard]] size_t jobsExecuted() const;
    [[nodiscard]] bool isRunning() const;

  private:
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::packaged_task<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    size_t jobs_executed_ = 0;
};

}  // namespace sampling
}  // namespace anchor
