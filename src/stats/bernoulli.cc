// =============================================================================
// Anchor Explain - Bernoulli KL Confidence Bounds Implementation
// =============================================================================

#include "anchor_explain/stats/bernoulli.h"

#include <algorithm>
#include <cmath>

namespace anchor {
namespace stats {

namespace {

constexpr double kMinProbability = 0.0000001;
constexpr double kMaxProbability = 0.9999999999999999;

// Constants of the KL-LUCB exploration rate (Kaufmann & Kalyanakrishnan, 2013)
constexpr double kLucbAlpha = 1.1;
constexpr double kLucbK = 405.5;

}  // namespace

double klBernoulli(double p, double q) {
    p = std::min(kMaxProbability, std::max(kMinProbability, p));
    q = std::min(kMaxProbability, std::max(kMinProbability, q));
    return p * std::log(p / q) + (1.0 - p) * std::log((1.0 - p) / (1.0 - q));
}

double dupBernoulli(double p, double level) {
    double lm = p;
    double um = std::min(std::min(1.0, p + std::sqrt(level / 2.0)), 1.0);
    for (int j = 0; j < kBoundBisectionSteps; ++j) {
        double qm = (um + lm) / 2.0;
        if (klBernoulli(p, qm) > level) {
            um = qm;
        } else {
            lm = qm;
        }
    }
    return um;
}

double dlowBernoulli(double p, double level) {
    double um = p;
    double lm = std::max(std::min(1.0, p - std::sqrt(level / 2.0)), 0.0);
    for (int j = 0; j < kBoundBisectionSteps; ++j) {
        double qm = (um + lm) / 2.0;
        if (klBernoulli(p, qm) > level) {
            lm = qm;
        } else {
            um = qm;
        }
    }
    return lm;
}

double lucbBeta(size_t n_arms, size_t t, double delta) {
    double temp = std::log(kLucbK * static_cast<double>(n_arms) *
                           std::pow(static_cast<double>(t), kLucbAlpha) / delta);
    return temp + std::log(temp);
}

}  // namespace stats
}  // namespace anchor
