// =============================================================================
// Anchor Explain - Sampling Service Implementation
// =============================================================================

#include "anchor_explain/sampling/sampling_service.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <future>
#include <utility>

namespace anchor {
namespace sampling {

namespace {

// Releases every claimed candidate when the session leaves run()
class SamplingClaims : NonCopyable {
  public:
    explicit SamplingClaims(size_t expected) { claimed_.reserve(expected); }
    ~SamplingClaims() {
        for (auto* candidate : claimed_) {
            candidate->releaseSampling();
        }
    }

    bool claim(AnchorCandidate* candidate) {
        if (!candidate->acquireSampling()) {
            return false;
        }
        claimed_.push_back(candidate);
        return true;
    }

  private:
    std::vector<AnchorCandidate*> claimed_;
};

}  // namespace

// =============================================================================
// Session
// =============================================================================

SamplingService::Session& SamplingService::Session::registerCandidateEvaluation(
    AnchorCandidate* candidate, size_t count) {
    ANCHOR_ASSERT(candidate != nullptr);
    if (count == 0) {
        return *this;
    }

    auto it = std::find_if(requests_.begin(), requests_.end(),
                           [candidate](const Request& r) { return r.candidate == candidate; });
    if (it != requests_.end()) {
        it->count += count;
    } else {
        requests_.push_back({candidate, count});
    }
    return *this;
}

Result<void> SamplingService::Session::run() {
    if (finished_) {
        return {};
    }
    // Marked before executing: a failed session must not be replayed, since
    // some of its batches may already be merged
    finished_ = true;
    if (requests_.empty()) {
        return {};
    }

    // Claim every candidate; no two sessions may sample the same candidate
    SamplingClaims claims(requests_.size());
    for (const auto& request : requests_) {
        if (!claims.claim(request.candidate)) {
            ANCHOR_RETURN_ERROR(ErrorCode::kSessionConflict,
                                "Candidate " + formatFeatures(request.candidate->orderedFeatures()) +
                                    " is already being sampled by another session");
        }
    }

    return service_->execute(requests_);
}

// =============================================================================
// SamplingService
// =============================================================================

SamplingService::SamplingService(SampleFunction sample_fn, SamplingConfig config)
    : sample_fn_(std::move(sample_fn)), config_(config) {
    if (config_.thread_count > 1) {
        pool_ = std::make_unique<WorkerPool>(config_.thread_count);
    }
}

SamplingService::~SamplingService() = default;

Result<double> SamplingService::evaluate(AnchorCandidate& candidate, size_t count) {
    if (count == 0) {
        return 0.0;
    }
    batches_run_.fetch_add(1, std::memory_order_relaxed);
    auto result = sample_fn_(candidate, count);
    if (result) {
        samples_drawn_.fetch_add(count, std::memory_order_relaxed);
    }
    return result;
}

SamplingStats SamplingService::stats() const {
    SamplingStats stats;
    stats.sessions_run = sessions_run_.load(std::memory_order_relaxed);
    stats.batches_run = batches_run_.load(std::memory_order_relaxed);
    stats.samples_drawn = samples_drawn_.load(std::memory_order_relaxed);
    return stats;
}

Result<void> SamplingService::execute(const std::vector<Request>& requests) {
    sessions_run_.fetch_add(1, std::memory_order_relaxed);
    auto batches = planBatches(requests);
    spdlog::debug("Running sampling session with {} requests in {} batches", requests.size(),
                  batches.size());

    if (!pool_ || batches.size() == 1) {
        return executeInline(batches);
    }
    return executeParallel(batches);
}

Result<double> SamplingService::evaluateGuarded(AnchorCandidate& candidate, size_t count) {
    // Classifiers and perturbation functions are user code; keep their
    // exceptions from crossing the session barrier
    try {
        return evaluate(candidate, count);
    } catch (const std::exception& e) {
        ANCHOR_RETURN_ERROR(ErrorCode::kSamplingFailed, std::string("Sampling threw: ") + e.what());
    } catch (...) {
        ANCHOR_RETURN_ERROR(ErrorCode::kSamplingFailed, "Sampling threw a non-standard exception");
    }
}

Result<void> SamplingService::executeInline(const std::vector<Request>& requests) {
    for (const auto& request : requests) {
        auto result = evaluateGuarded(*request.candidate, request.count);
        if (!result) {
            spdlog::error("Sampling batch failed: {}", result.error().toString());
            return result.error();
        }
    }
    return {};
}

Result<void> SamplingService::executeParallel(const std::vector<Request>& requests) {
    std::vector<Error> errors(requests.size());
    std::vector<std::future<void>> futures;
    futures.reserve(requests.size());

    for (size_t i = 0; i < requests.size(); ++i) {
        const Request request = requests[i];
        Error* slot = &errors[i];
        auto future = pool_->submit([this, request, slot] {
            auto result = evaluateGuarded(*request.candidate, request.count);
            if (!result) {
                *slot = result.error();
            }
        });
        if (!future.valid()) {
            // Wait for what was already queued before reporting
            for (auto& f : futures) {
                f.wait();
            }
            ANCHOR_RETURN_ERROR(ErrorCode::kPoolShutdown, "Sampling pool is not running");
        }
        futures.push_back(std::move(future));
    }

    // Barrier: the session completes only when every batch has merged
    for (auto& future : futures) {
        future.wait();
    }

    for (const auto& error : errors) {
        if (error.isError()) {
            spdlog::error("Sampling batch failed: {}", error.toString());
            return error;
        }
    }
    return {};
}

std::vector<SamplingService::Request> SamplingService::planBatches(
    const std::vector<Request>& requests) const {
    if (!config_.balance_sampling || config_.thread_count <= 1) {
        return requests;
    }

    // Spread every request over all workers so one large request does not
    // serialize on a single thread
    std::vector<Request> batches;
    const size_t threads = config_.thread_count;
    for (const auto& request : requests) {
        size_t chunk = (request.count + threads - 1) / threads;
        size_t remaining = request.count;
        while (remaining > 0) {
            size_t take = std::min(chunk, remaining);
            batches.push_back({request.candidate, take});
            remaining -= take;
        }
    }
    return batches;
}

}  // namespace sampling
}  // namespace anchor
