// =============================================================================
// Anchor Explain - Anchor Candidate Implementation
// =============================================================================

#include "anchor_explain/candidate.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <unordered_set>

namespace anchor {

std::string formatFeatures(const FeatureSet& features) {
    return fmt::format("{{{}}}", fmt::join(features, ", "));
}

size_t FeatureSetHash::operator()(const FeatureSet& canonical) const noexcept {
    // FNV-1a over the indices
    uint64_t hash = 1469598103934665603ULL;
    for (FeatureIndex feature : canonical) {
        hash ^= static_cast<uint64_t>(feature);
        hash *= 1099511628211ULL;
    }
    return static_cast<size_t>(hash);
}

// =============================================================================
// AnchorCandidate
// =============================================================================

AnchorCandidate::AnchorCandidate(CandidateId id, FeatureSet ordered_features, CandidateId parent)
    : id_(id), parent_(parent) {
    ordered_.reserve(ordered_features.size());
    std::unordered_set<FeatureIndex> seen;
    for (FeatureIndex feature : ordered_features) {
        if (seen.insert(feature).second) {
            ordered_.push_back(feature);
        }
    }
    canonical_ = ordered_;
    std::sort(canonical_.begin(), canonical_.end());
}

bool AnchorCandidate::contains(FeatureIndex feature) const {
    return std::binary_search(canonical_.begin(), canonical_.end(), feature);
}

void AnchorCandidate::registerSamples(uint64_t sampled, uint64_t positive) {
    ANCHOR_ASSERT(positive <= sampled);
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.sampled += sampled;
    stats_.positive += positive;
}

CandidateStats AnchorCandidate::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

bool AnchorCandidate::acquireSampling() {
    bool expected = false;
    return in_session_.compare_exchange_strong(expected, true);
}

void AnchorCandidate::releaseSampling() {
    in_session_.store(false);
}

std::string AnchorCandidate::toString() const {
    auto current = stats();
    if (coverage_) {
        return fmt::format("{} precision={:.4f} ({}/{}) coverage={:.4f}",
                           formatFeatures(ordered_), current.precision(), current.positive,
                           current.sampled, *coverage_);
    }
    return fmt::format("{} precision={:.4f} ({}/{})", formatFeatures(ordered_),
                       current.precision(), current.positive, current.sampled);
}

// =============================================================================
// CandidatePool
// =============================================================================

AnchorCandidate* CandidatePool::create(FeatureSet ordered_features, CandidateId parent) {
    // Ids are 1-based positions so that 0 stays free for "no candidate"
    CandidateId id = static_cast<CandidateId>(candidates_.size()) + 1;
    candidates_.push_back(std::make_unique<AnchorCandidate>(id, std::move(ordered_features), parent));
    return candidates_.back().get();
}

AnchorCandidate* CandidatePool::find(CandidateId id) const {
    if (id == kNoCandidate || id > candidates_.size()) {
        return nullptr;
    }
    return candidates_[id - 1].get();
}

const AnchorCandidate* CandidatePool::parentOf(const AnchorCandidate& candidate) const {
    return find(candidate.parentId());
}

std::vector<FeatureSet> CandidatePool::lineage(const AnchorCandidate& candidate) const {
    std::vector<FeatureSet> chain;
    const AnchorCandidate* current = &candidate;
    while (current != nullptr) {
        chain.push_back(current->orderedFeatures());
        current = parentOf(*current);
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
}

CandidateSnapshot CandidatePool::snapshot(const AnchorCandidate& candidate) const {
    CandidateSnapshot snap;
    snap.id = candidate.id();
    snap.parent = candidate.parentId();
    snap.ordered_features = candidate.orderedFeatures();
    snap.canonical_features = candidate.canonicalFeatures();
    snap.stats = candidate.stats();
    snap.coverage = candidate.coverageValue();
    snap.lineage = lineage(candidate);
    return snap;
}

}  // namespace anchor
