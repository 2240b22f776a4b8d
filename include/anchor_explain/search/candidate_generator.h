#pragma once

// =============================================================================
// Anchor Explain - Candidate Generation
// =============================================================================
//
// Extends the survivors of the previous round by one feature each:
//
//   GenerateCands(A, c):
//     for all A in A, a_i in x, a_i not in A:
//       if cov(A and a_i) >= c: add (A and a_i)
//
// Identical feature sets reached through different survivors are kept once.
// Since coverage never grows when features are added, candidates below the
// coverage of the best anchor so far can never replace it and are dropped.
//

#include "anchor_explain/candidate.h"
#include "anchor_explain/error.h"
#include "anchor_explain/functions.h"

#include <cstddef>
#include <memory>

namespace anchor {
namespace search {

struct GenerationStats {
    size_t generated = 0;   // Candidates handed to the round
    size_t duplicates = 0;  // Extensions dropped as duplicates
    size_t pruned = 0;      // Extensions dropped by the coverage floor
};

class CandidateGenerator {
  public:
    CandidateGenerator(CandidatePool& pool,
                       std::shared_ptr<const CoverageIdentification> coverage,
                       bool lazy_coverage);

    /// Candidates of the next round. `previous` empty means round one.
    /// An empty result means the search cannot continue.
    Result<CandidateList> generate(const CandidateList& previous, size_t feature_count,
                                   double min_coverage);

    /// Compute the candidate's coverage unless already known
    Result<void> ensureCoverage(AnchorCandidate& candidate) const;

    [[nodiscard]] const GenerationStats& lastStats() const { return last_stats_; }
    [[nodiscard]] bool lazyCoverage() const { return lazy_coverage_; }

  private:
    Result<double> coverageOf(const FeatureSet& features) const;

    CandidatePool& pool_;
    std::shared_ptr<const CoverageIdentification> coverage_;
    bool lazy_coverage_;
    GenerationStats last_stats_;
};

}  // namespace search
}  // namespace anchor
