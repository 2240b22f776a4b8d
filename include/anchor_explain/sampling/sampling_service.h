#pragma once

// =============================================================================
// Anchor Explain - Sampling Service
// =============================================================================
//
// Executes batches of "evaluate this candidate with N more perturbation
// samples" requests and merges the statistics into the candidates.
//
// A Session collects requests and run() blocks until every request is done;
// this is the only suspension point seen by the search. Requests of one
// session may run in any order on the worker pool, but run() is a full
// barrier.
//

#include "anchor_explain/candidate.h"
#include "anchor_explain/common.h"
#include "anchor_explain/error.h"
#include "anchor_explain/sampling/worker_pool.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace anchor {
namespace sampling {

/// Draws `count` perturbation samples for the candidate, merges them into its
/// counters and returns the batch precision. Must be safe to call
/// concurrently.
using SampleFunction = std::function<Result<double>(AnchorCandidate& candidate, size_t count)>;

// =============================================================================
// Sampling Configuration
// =============================================================================

struct SamplingConfig {
    size_t thread_count = 1;        // <= 1 runs sessions on the calling thread
    bool balance_sampling = false;  // Split large requests across all workers
};

// =============================================================================
// Sampling Statistics
// =============================================================================

struct SamplingStats {
    uint64_t sessions_run = 0;
    uint64_t batches_run = 0;
    uint64_t samples_drawn = 0;
};

// =============================================================================
// SamplingService
// =============================================================================

class SamplingService : NonMovable {
  public:
    struct Request {
        AnchorCandidate* candidate = nullptr;
        size_t count = 0;
    };

    class Session {
      public:
        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;
        Session(Session&&) noexcept = default;
        Session& operator=(Session&&) noexcept = default;

        /// Request `count` additional samples for a candidate. Requests for the
        /// same candidate are merged.
        Session& registerCandidateEvaluation(AnchorCandidate* candidate, size_t count);

        /// Run every request and wait for all of them. A finished session
        /// samples nothing when run again.
        Result<void> run();

        [[nodiscard]] size_t pendingRequests() const { return requests_.size(); }
        [[nodiscard]] bool finished() const { return finished_; }

      private:
        friend class SamplingService;
        explicit Session(SamplingService* service) : service_(service) {}

        SamplingService* service_;
        std::vector<Request> requests_;
        bool finished_ = false;
    };

    SamplingService(SampleFunction sample_fn, SamplingConfig config = {});
    ~SamplingService();

    [[nodiscard]] Session createSession() { return Session(this); }

    /// Sampling primitive: evaluate one candidate directly on the calling
    /// thread. Zero samples return 0 without sampling.
    Result<double> evaluate(AnchorCandidate& candidate, size_t count);

    [[nodiscard]] const SamplingConfig& config() const { return config_; }
    [[nodiscard]] SamplingStats stats() const;

  private:
    Result<double> evaluateGuarded(AnchorCandidate& candidate, size_t count);
    Result<void> execute(const std::vector<Request>& requests);
    Result<void> executeInline(const std::vector<Request>& requests);
    Result<void> executeParallel(const std::vector<Request>& requests);

    // Split requests into the batches handed to the worker pool
    [[nodiscard]] std::vector<Request> planBatches(const std::vector<Request>& requests) const;

    SampleFunction sample_fn_;
    SamplingConfig config_;
    std::unique_ptr<WorkerPool> pool_;

    std::atomic<uint64_t> sessions_run_{0};
    std::atomic<uint64_t> batches_run_{0};
    std::atomic<uint64_t> samples_drawn_{0};
};

}  // namespace sampling
}  // namespace anchor
