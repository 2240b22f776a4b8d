#pragma once

// =============================================================================
// Anchor Explain - Anchor Construction (Beam Search)
// =============================================================================
//
// Beam search over feature conjunctions of growing size (Ribeiro et al.):
//
//   A* <- null, A_0 <- {}
//   loop
//     A_t <- GenerateCands(A_t-1, cov(A*))
//     A_t <- B-BestCand(A_t, B, delta)        (best-arm identification)
//     if A_t = {} then break
//     for all A in A_t with prec_lb(A) > tau:
//       if cov(A) > cov(A*) then A* <- A
//   return A*
//
// Keeping B candidates per round allows suboptimal greedy choices to be
// undone. If no anchor is confirmed, the best candidate over all rounds is
// reported instead.
//

#include "anchor_explain/candidate.h"
#include "anchor_explain/common.h"
#include "anchor_explain/config.h"
#include "anchor_explain/error.h"
#include "anchor_explain/exploration/best_arm_identification.h"
#include "anchor_explain/functions.h"
#include "anchor_explain/sampling/sampling_service.h"
#include "anchor_explain/search/candidate_generator.h"
#include "anchor_explain/search/validity_checker.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace anchor {
namespace search {

// =============================================================================
// Search Statistics
// =============================================================================

struct SearchStats {
    size_t rounds = 0;                 // Rounds (anchor sizes) started
    size_t candidates_generated = 0;
    size_t candidates_pruned = 0;      // Dropped by the coverage floor
    size_t validation_rounds = 0;      // Extra batches sampled by validity checks
    size_t validation_cap_hits = 0;    // Checks that gave up undecided
    uint64_t samples_drawn = 0;
    double elapsed_ms = 0.0;
    bool terminated_early = false;     // Anchor with coverage 1 found
    bool used_fallback = false;        // No anchor confirmed
};

// =============================================================================
// Round Snapshot - Passed to the round observer after every round
// =============================================================================

struct RoundSnapshot {
    size_t anchor_size = 0;
    size_t generated = 0;
    size_t shortlisted = 0;
    CandidateId best_anchor = kNoCandidate;
    std::optional<double> best_coverage;  // Unset while no anchor is confirmed
};

using RoundObserver = std::function<void(const RoundSnapshot&)>;

// =============================================================================
// Search Outcome
// =============================================================================

struct SearchOutcome {
    CandidateSnapshot best;
    bool is_anchor = false;  // False: best effort, precision constraints unmet
    SearchStats stats;
};

// =============================================================================
// Collaborators
// =============================================================================

struct SearchCollaborators {
    sampling::SampleFunction sample_fn;
    std::shared_ptr<const CoverageIdentification> coverage;
    std::shared_ptr<exploration::BestAnchorIdentification> best_arm;
};

// =============================================================================
// AnchorConstruction
// =============================================================================

class AnchorConstruction : NonMovable {
  public:
    /// Validate collaborators and configuration. Nothing is allocated when
    /// validation fails. A max anchor size of 0 resolves to feature_count.
    static Result<std::unique_ptr<AnchorConstruction>> create(SearchCollaborators collaborators,
                                                              const AnchorConfig& config,
                                                              size_t feature_count,
                                                              int explained_label);

    ~AnchorConstruction();

    /// Run the beam search.
    /// Errors: kNoCandidateFound when no candidate ever sampled positively,
    /// sampling and coverage errors unchanged.
    Result<SearchOutcome> run();

    void setRoundObserver(RoundObserver observer) { observer_ = std::move(observer); }

    [[nodiscard]] const AnchorConfig& config() const { return config_; }
    [[nodiscard]] size_t featureCount() const { return feature_count_; }
    [[nodiscard]] size_t maxAnchorSize() const { return max_anchor_size_; }
    [[nodiscard]] int explainedLabel() const { return explained_label_; }
    [[nodiscard]] sampling::SamplingService& samplingService() { return *service_; }

    /// Candidates of the most recent run; valid until the next run()
    [[nodiscard]] const CandidatePool& pool() const { return pool_; }

  private:
    AnchorConstruction(SearchCollaborators collaborators, const AnchorConfig& config,
                       size_t feature_count, int explained_label);

    /// Pre-sample every candidate up to init_sample_count, then shortlist
    /// top_n through best-arm identification
    Result<CandidateList> bestCandidates(const CandidateList& candidates, size_t top_n);

    /// Best candidate by precision over all rounds (no anchor confirmed);
    /// the caller finalizes the statistics
    Result<SearchOutcome> fallback(const std::map<size_t, CandidateList>& best_of_size,
                                   SearchStats& stats);

    AnchorConfig config_;
    size_t feature_count_;
    size_t max_anchor_size_;
    int explained_label_;

    std::shared_ptr<const CoverageIdentification> coverage_;
    std::shared_ptr<exploration::BestAnchorIdentification> best_arm_;
    std::unique_ptr<sampling::SamplingService> service_;

    CandidatePool pool_;
    CandidateGenerator generator_;
    ValidityChecker validity_;
    RoundObserver observer_;
};

}  // namespace search
}  // namespace anchor
