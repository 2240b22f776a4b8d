// =============================================================================
// Anchor Explain - KL-LUCB Implementation
// =============================================================================

#include "anchor_explain/exploration/kl_lucb.h"

#include "anchor_explain/stats/bernoulli.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <numeric>
#include <vector>

namespace anchor {
namespace exploration {

namespace {

// Arm indices ordered by ascending empirical precision (ties keep input order)
std::vector<size_t> sortByMean(const std::vector<double>& means) {
    std::vector<size_t> order(means.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&means](size_t a, size_t b) { return means[a] < means[b]; });
    return order;
}

}  // namespace

Result<CandidateList> KlLucb::identify(const CandidateList& candidates,
                                       sampling::SamplingService& service, double delta,
                                       size_t top_n) {
    last_iterations_ = 0;
    const size_t n = candidates.size();
    if (n == 0 || top_n == 0) {
        return CandidateList{};
    }

    // Every arm needs at least one sample before its bounds mean anything
    {
        auto session = service.createSession();
        for (auto* candidate : candidates) {
            if (candidate->sampledSize() == 0) {
                session.registerCandidateEvaluation(candidate, 1);
            }
        }
        ANCHOR_TRY(session.run());
    }

    if (n <= top_n) {
        return candidates;
    }

    std::vector<double> means(n);
    std::vector<double> ub(n, 0.0);
    std::vector<double> lb(n, 0.0);
    auto refreshMeans = [&] {
        for (size_t i = 0; i < n; ++i) {
            means[i] = candidates[i]->precision();
        }
    };

    size_t t = 1;
    size_t ut = 0;
    size_t lt = 0;
    auto updateBounds = [&] {
        auto order = sortByMean(means);
        const double beta = stats::lucbBeta(n, t, delta);

        double best_ub = -std::numeric_limits<double>::infinity();
        for (size_t k = 0; k < n - top_n; ++k) {
            size_t arm = order[k];
            ub[arm] = stats::dupBernoulli(
                means[arm], beta / static_cast<double>(candidates[arm]->sampledSize()));
            if (ub[arm] > best_ub) {
                best_ub = ub[arm];
                ut = arm;
            }
        }
        double worst_lb = std::numeric_limits<double>::infinity();
        for (size_t k = n - top_n; k < n; ++k) {
            size_t arm = order[k];
            lb[arm] = stats::dlowBernoulli(
                means[arm], beta / static_cast<double>(candidates[arm]->sampledSize()));
            if (lb[arm] < worst_lb) {
                worst_lb = lb[arm];
                lt = arm;
            }
        }
        return ub[ut] - lb[lt];
    };

    refreshMeans();
    double gap = updateBounds();
    while (gap > config_.epsilon) {
        if (t > config_.max_iterations) {
            spdlog::warn("KL-LUCB stopped after {} iterations with a bound gap of {:.4f}",
                         config_.max_iterations, gap);
            break;
        }

        auto session = service.createSession();
        session.registerCandidateEvaluation(candidates[ut], config_.batch_size);
        session.registerCandidateEvaluation(candidates[lt], config_.batch_size);
        ANCHOR_TRY(session.run());

        refreshMeans();
        ++t;
        gap = updateBounds();
    }
    last_iterations_ = t - 1;
    spdlog::debug("KL-LUCB identified top {} of {} candidates after {} iterations (gap {:.4f})",
                  top_n, n, last_iterations_, gap);

    auto order = sortByMean(means);
    CandidateList best;
    best.reserve(top_n);
    for (size_t k = 0; k < top_n; ++k) {
        best.push_back(candidates[order[n - 1 - k]]);
    }
    return best;
}

}  // namespace exploration
}  // namespace anchor
