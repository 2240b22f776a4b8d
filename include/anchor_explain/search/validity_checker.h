#pragma once

// =============================================================================
// Anchor Explain - Validity Check
// =============================================================================
//
// Best-arm identification picks the best candidates of a round but does not
// guarantee they meet the precision threshold. The validity check samples a
// candidate until its KL confidence bounds place it on one side of tau:
//
//   while (mean >= tau and lb < tau - d) or (mean < tau and ub >= tau + d):
//       sample another batch
//   valid = mean >= tau and lb > tau - d
//
// The number of extra batches is capped; an undecided candidate at the cap is
// reported as not valid.
//

#include "anchor_explain/candidate.h"
#include "anchor_explain/error.h"
#include "anchor_explain/sampling/sampling_service.h"

#include <cstddef>
#include <cstdint>

namespace anchor {
namespace search {

struct PrecisionBounds {
    double mean = 0.0;
    double lower = 0.0;
    double upper = 1.0;
};

struct ValidityConfig {
    double delta = 0.1;
    double tau = 1.0;
    double tau_discrepancy = 0.05;
    size_t beam_width = 2;
    size_t feature_count = 0;
    size_t init_sample_count = 1;        // Batch size of every extra round
    size_t max_validation_rounds = 1000; // Extra batches before giving up
};

struct ValidityDecision {
    bool valid = false;
    bool cap_exhausted = false;  // Still undecided when the cap was reached
    size_t extra_rounds = 0;     // Batches sampled by the check itself
    PrecisionBounds bounds;
};

class ValidityChecker {
  public:
    explicit ValidityChecker(const ValidityConfig& config);

    /// Sample the candidate until it is provably valid or invalid
    Result<ValidityDecision> check(AnchorCandidate& candidate,
                                   sampling::SamplingService& service) const;

    // -------------------------------------------------------------------------
    // Pure helpers
    // -------------------------------------------------------------------------

    /// Significance level corrected for the (beam_width - 1) * feature_count
    /// hypotheses a round can test
    [[nodiscard]] static double computeBeta(double delta, size_t beam_width,
                                            size_t feature_count);

    /// KL bounds at level beta / sampled; [0, 1] without samples
    [[nodiscard]] static PrecisionBounds computeBounds(double mean, uint64_t sampled,
                                                       double beta);

    /// True while the bounds straddle tau by more than the discrepancy
    [[nodiscard]] static bool isUndecided(const PrecisionBounds& bounds, double tau,
                                          double tau_discrepancy);

    /// Terminal decision at a fixed sample count
    [[nodiscard]] static bool isValid(double mean, uint64_t sampled, double beta, double tau,
                                      double tau_discrepancy);

    [[nodiscard]] double beta() const { return beta_; }
    [[nodiscard]] const ValidityConfig& config() const { return config_; }

  private:
    ValidityConfig config_;
    double beta_;
};

}  // namespace search
}  // namespace anchor
