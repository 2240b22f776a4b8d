// =============================================================================
// Anchor Explain - Validity Check Implementation
// =============================================================================

#include "anchor_explain/search/validity_checker.h"

#include "anchor_explain/stats/bernoulli.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace anchor {
namespace search {

ValidityChecker::ValidityChecker(const ValidityConfig& config)
    : config_(config),
      beta_(computeBeta(config.delta, config.beam_width, config.feature_count)) {}

double ValidityChecker::computeBeta(double delta, size_t beam_width, size_t feature_count) {
    // At most (beam_width - 1) tuples are chosen per step and there are at most
    // feature_count steps
    double tests = 1.0 + (static_cast<double>(beam_width) - 1.0) *
                             static_cast<double>(feature_count);
    tests = std::max(1.0, tests);
    return std::log(1.0 / (delta / tests));
}

PrecisionBounds ValidityChecker::computeBounds(double mean, uint64_t sampled, double beta) {
    PrecisionBounds bounds;
    bounds.mean = mean;
    if (sampled == 0) {
        bounds.lower = 0.0;
        bounds.upper = 1.0;
        return bounds;
    }
    const double level = beta / static_cast<double>(sampled);
    bounds.lower = stats::dlowBernoulli(mean, level);
    bounds.upper = stats::dupBernoulli(mean, level);
    return bounds;
}

bool ValidityChecker::isUndecided(const PrecisionBounds& bounds, double tau,
                                  double tau_discrepancy) {
    return (bounds.mean >= tau && bounds.lower < tau - tau_discrepancy) ||
           (bounds.mean < tau && bounds.upper >= tau + tau_discrepancy);
}

bool ValidityChecker::isValid(double mean, uint64_t sampled, double beta, double tau,
                              double tau_discrepancy) {
    auto bounds = computeBounds(mean, sampled, beta);
    return bounds.mean >= tau && bounds.lower > tau - tau_discrepancy;
}

Result<ValidityDecision> ValidityChecker::check(AnchorCandidate& candidate,
                                                sampling::SamplingService& service) const {
    // A zero batch size would never add information
    const size_t batch = std::max<size_t>(1, config_.init_sample_count);

    ValidityDecision decision;
    auto current = candidate.stats();
    decision.bounds = computeBounds(current.precision(), current.sampled, beta_);

    while (isUndecided(decision.bounds, config_.tau, config_.tau_discrepancy)) {
        if (decision.extra_rounds >= config_.max_validation_rounds) {
            spdlog::warn("Could not decide whether {} is an anchor after {} extra batches "
                         "(mean {:.4f}, bounds [{:.4f}, {:.4f}]); treating it as invalid",
                         formatFeatures(candidate.orderedFeatures()), decision.extra_rounds,
                         decision.bounds.mean, decision.bounds.lower, decision.bounds.upper);
            decision.cap_exhausted = true;
            decision.valid = false;
            return decision;
        }

        spdlog::debug("Cannot confirm or reject {} is an anchor. Taking more samples.",
                      formatFeatures(candidate.orderedFeatures()));
        ANCHOR_TRY(service.createSession().registerCandidateEvaluation(&candidate, batch).run());
        ++decision.extra_rounds;

        current = candidate.stats();
        decision.bounds = computeBounds(current.precision(), current.sampled, beta_);
    }

    // Confident the candidate is either an anchor (lb > tau) or not (ub < tau)
    decision.valid = decision.bounds.mean >= config_.tau &&
                     decision.bounds.lower > config_.tau - config_.tau_discrepancy;
    return decision;
}

}  // namespace search
}  // namespace anchor
