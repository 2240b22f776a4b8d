#pragma once

// =============================================================================
// Anchor Explain - Bernoulli KL Confidence Bounds
// =============================================================================
//
// KL-divergence based confidence bounds for the mean of a Bernoulli variable.
// Unlike Gaussian approximations these stay tight for small sample counts and
// for means close to 0 or 1.
//

#include <cstddef>

namespace anchor {
namespace stats {

// Number of bisection steps used by dupBernoulli / dlowBernoulli
constexpr int kBoundBisectionSteps = 16;

/// KL divergence between Bernoulli(p) and Bernoulli(q). Both arguments are
/// clamped into (0, 1) so the result is finite for p, q in {0, 1}.
double klBernoulli(double p, double q);

/// Largest q >= p with KL(p, q) <= level (upper confidence bound)
double dupBernoulli(double p, double level);

/// Smallest q <= p with KL(p, q) <= level (lower confidence bound)
double dlowBernoulli(double p, double level);

/// Exploration rate of KL-LUCB after t rounds over n arms
double lucbBeta(size_t n_arms, size_t t, double delta);

}  // namespace stats
}  // namespace anchor
