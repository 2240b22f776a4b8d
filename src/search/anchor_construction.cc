// =============================================================================
// Anchor Explain - Anchor Construction Implementation
// =============================================================================

#include "anchor_explain/search/anchor_construction.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace anchor {
namespace search {

namespace {

ValidityConfig makeValidityConfig(const AnchorConfig& config, size_t feature_count) {
    ValidityConfig validity;
    validity.delta = config.delta;
    validity.tau = config.tau;
    validity.tau_discrepancy = config.tau_discrepancy;
    validity.beam_width = static_cast<size_t>(config.beam_width);
    validity.feature_count = feature_count;
    validity.init_sample_count = static_cast<size_t>(config.init_sample_count);
    validity.max_validation_rounds = static_cast<size_t>(config.max_validation_rounds);
    return validity;
}

sampling::SamplingConfig makeSamplingConfig(const AnchorConfig& config) {
    sampling::SamplingConfig sampling;
    sampling.thread_count = static_cast<size_t>(config.thread_count);
    sampling.balance_sampling = config.balance_sampling;
    return sampling;
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

Result<std::unique_ptr<AnchorConstruction>> AnchorConstruction::create(
    SearchCollaborators collaborators, const AnchorConfig& config, size_t feature_count,
    int explained_label) {
    if (!collaborators.sample_fn) {
        ANCHOR_RETURN_ERROR(ErrorCode::kMissingCollaborator, "Sample function must not be null");
    }
    if (!collaborators.coverage) {
        ANCHOR_RETURN_ERROR(ErrorCode::kMissingCollaborator,
                            "Coverage identification must not be null");
    }
    if (!collaborators.best_arm) {
        ANCHOR_RETURN_ERROR(ErrorCode::kMissingCollaborator,
                            "Best anchor identification must not be null");
    }
    if (explained_label < 0) {
        ANCHOR_RETURN_ERROR(ErrorCode::kInvalidConfig,
                            "Explained instance label must not be negative");
    }
    ANCHOR_TRY(config.validate());

    // The constructor is private, so make_unique cannot reach it
    return std::unique_ptr<AnchorConstruction>(
        new AnchorConstruction(std::move(collaborators), config, feature_count, explained_label));
}

AnchorConstruction::AnchorConstruction(SearchCollaborators collaborators,
                                       const AnchorConfig& config, size_t feature_count,
                                       int explained_label)
    : config_(config),
      feature_count_(feature_count),
      max_anchor_size_(config.max_anchor_size == 0 ? feature_count
                                                   : static_cast<size_t>(config.max_anchor_size)),
      explained_label_(explained_label),
      coverage_(std::move(collaborators.coverage)),
      best_arm_(std::move(collaborators.best_arm)),
      service_(std::make_unique<sampling::SamplingService>(std::move(collaborators.sample_fn),
                                                           makeSamplingConfig(config))),
      generator_(pool_, coverage_, config.lazy_coverage),
      validity_(makeValidityConfig(config, feature_count)) {}

AnchorConstruction::~AnchorConstruction() = default;

// =============================================================================
// Best Candidate Identification
// =============================================================================

Result<CandidateList> AnchorConstruction::bestCandidates(const CandidateList& candidates,
                                                         size_t top_n) {
    // Every candidate gets the same minimum effort, whatever the strategy
    // would pick on its own
    const auto init = static_cast<uint64_t>(config_.init_sample_count);
    auto session = service_->createSession();
    for (auto* candidate : candidates) {
        uint64_t sampled = candidate->sampledSize();
        if (sampled >= init) {
            continue;
        }
        session.registerCandidateEvaluation(candidate, static_cast<size_t>(init - sampled));
    }
    ANCHOR_TRY(session.run());

    if (candidates.size() <= top_n) {
        spdlog::debug("Number of arms searched for ({}) not below the number of candidates ({}). "
                      "Returning all candidates.",
                      top_n, candidates.size());
        return candidates;
    }
    if (top_n == 0) {
        return CandidateList{};
    }

    spdlog::debug("Calling {} to identify top {} candidates with a significance level of {}",
                  best_arm_->name(), top_n, config_.delta);
    CandidateList best;
    ANCHOR_ASSIGN_OR_RETURN(best, best_arm_->identify(candidates, *service_, config_.delta, top_n));

    if (std::any_of(best.begin(), best.end(), [](const auto* c) { return c == nullptr; })) {
        ANCHOR_RETURN_ERROR(ErrorCode::kIdentificationFailed,
                            fmt::format("{} returned a null candidate", best_arm_->name()));
    }
    if (best.size() > top_n) {
        spdlog::warn("{} returned {} candidates for top {}; keeping the first {}",
                     best_arm_->name(), best.size(), top_n, top_n);
        best.resize(top_n);
    }
    return best;
}

// =============================================================================
// Beam Search
// =============================================================================

Result<SearchOutcome> AnchorConstruction::run() {
    spdlog::info("Starting beam search with beam width {} and a max anchor size of {}",
                 config_.beam_width, max_anchor_size_);
    const auto start = std::chrono::steady_clock::now();
    const uint64_t samples_before = service_->stats().samples_drawn;

    pool_.reset();
    SearchStats stats;
    std::map<size_t, CandidateList> best_of_size;
    AnchorCandidate* best = nullptr;

    auto finishStats = [&] {
        stats.samples_drawn = service_->stats().samples_drawn - samples_before;
        stats.elapsed_ms = std::chrono::duration<double, std::milli>(
                               std::chrono::steady_clock::now() - start)
                               .count();
    };

    bool stop = false;
    for (size_t size = 1; size <= max_anchor_size_ && !stop; ++size) {
        spdlog::info("Adding feature {} of {}", size, max_anchor_size_);
        ++stats.rounds;

        // Extend last round's survivors, pruned by the best anchor's coverage
        const CandidateList none;
        auto previous = best_of_size.find(size - 1);
        CandidateList candidates;
        ANCHOR_ASSIGN_OR_RETURN(
            candidates, generator_.generate(previous != best_of_size.end() ? previous->second : none,
                                            feature_count_, best ? best->coverage() : 0.0));
        stats.candidates_generated += generator_.lastStats().generated;
        stats.candidates_pruned += generator_.lastStats().pruned;
        if (candidates.empty()) {
            spdlog::info("No further candidates could be generated, stopping search");
            break;
        }

        // This round's best candidates, without those that never predicted the label
        const size_t top_n = std::min(candidates.size(), static_cast<size_t>(config_.beam_width));
        CandidateList shortlisted;
        ANCHOR_ASSIGN_OR_RETURN(shortlisted, bestCandidates(candidates, top_n));
        shortlisted.erase(std::remove_if(shortlisted.begin(), shortlisted.end(),
                                         [](const auto* c) { return c->precision() <= 0.0; }),
                          shortlisted.end());
        if (shortlisted.empty()) {
            spdlog::warn("No best candidates with a precision > 0 returned by best arm "
                         "identification, stopping search");
            break;
        }
        best_of_size[size] = shortlisted;

        for (auto* candidate : shortlisted) {
            ValidityDecision decision;
            ANCHOR_ASSIGN_OR_RETURN(decision, validity_.check(*candidate, *service_));
            stats.validation_rounds += decision.extra_rounds;
            if (decision.cap_exhausted) {
                ++stats.validation_cap_hits;
            }
            spdlog::info("Top candidate {} is{} a valid anchor with precision {:.4f}",
                         formatFeatures(candidate->orderedFeatures()),
                         decision.valid ? "" : " not", candidate->precision());
            if (!decision.valid) {
                continue;
            }

            ANCHOR_TRY(generator_.ensureCoverage(*candidate));
            if (best == nullptr || candidate->coverage() > best->coverage()) {
                spdlog::info("Found a new best anchor {} with a coverage of {:.4f}",
                             formatFeatures(candidate->orderedFeatures()), candidate->coverage());
                best = candidate;
                if (candidate->coverage() == 1.0) {
                    // Nothing can cover more than the whole input space
                    spdlog::info("Found an anchor with a coverage of 1. Stopping search "
                                 "prematurely.");
                    stats.terminated_early = true;
                    stop = true;
                    break;
                }
            }
        }

        if (observer_) {
            RoundSnapshot snapshot;
            snapshot.anchor_size = size;
            snapshot.generated = candidates.size();
            snapshot.shortlisted = shortlisted.size();
            if (best != nullptr) {
                snapshot.best_anchor = best->id();
                snapshot.best_coverage = best->coverage();
            }
            observer_(snapshot);
        }
    }

    SearchOutcome outcome;
    if (best == nullptr) {
        ANCHOR_ASSIGN_OR_RETURN(outcome, fallback(best_of_size, stats));
    } else {
        outcome.best = pool_.snapshot(*best);
        outcome.is_anchor = true;
    }

    finishStats();
    if (outcome.is_anchor) {
        spdlog::info("Found result {} in {:.1f}ms", best->toString(), stats.elapsed_ms);
    } else {
        spdlog::info("Search finished without an anchor in {:.1f}ms", stats.elapsed_ms);
    }
    outcome.stats = stats;
    return outcome;
}

Result<SearchOutcome> AnchorConstruction::fallback(
    const std::map<size_t, CandidateList>& best_of_size, SearchStats& stats) {
    spdlog::warn("Could not identify an anchor satisfying the parameters. "
                 "Searching for best candidate.");

    CandidateList all;
    for (const auto& [size, candidates] : best_of_size) {
        all.insert(all.end(), candidates.begin(), candidates.end());
    }

    CandidateList best;
    ANCHOR_ASSIGN_OR_RETURN(best, bestCandidates(all, 1));
    if (best.empty()) {
        spdlog::warn("Could not find an anchor or any candidate with a precision > 0");
        ANCHOR_RETURN_ERROR(ErrorCode::kNoCandidateFound,
                            "No candidate with a precision > 0 could be found");
    }

    AnchorCandidate* candidate = best.front();
    // As the candidate is no anchor, its coverage may not be known yet
    ANCHOR_TRY(generator_.ensureCoverage(*candidate));

    stats.used_fallback = true;
    spdlog::warn("Returning best candidate {} which does not satisfy the anchor constraints",
                 candidate->toString());

    SearchOutcome outcome;
    outcome.best = pool_.snapshot(*candidate);
    outcome.is_anchor = false;
    return outcome;
}

}  // namespace search
}  // namespace anchor
