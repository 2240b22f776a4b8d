#pragma once

// =============================================================================
// Anchor Explain - Anchor Candidates
// =============================================================================
//
// A candidate is a conjunction of feature indices together with the running
// statistics of the perturbation samples drawn for it.
//
// Features:
// - Immutable feature set (insertion order kept, canonical order derived)
// - Counter pair merged atomically by the sampling service only
// - Lazily computed coverage
// - Lineage through parent ids resolved by the owning CandidatePool
//

#include "anchor_explain/common.h"
#include "anchor_explain/error.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace anchor {

// Ordered set of feature indices (no duplicates)
using FeatureSet = std::vector<FeatureIndex>;

// Format a feature set as "{a, b, c}" for logging
std::string formatFeatures(const FeatureSet& features);

// Hash over the canonical (sorted) representation of a feature set
struct FeatureSetHash {
    size_t operator()(const FeatureSet& canonical) const noexcept;
};

// =============================================================================
// Candidate Statistics
// =============================================================================

struct CandidateStats {
    uint64_t sampled = 0;   // Perturbations evaluated so far
    uint64_t positive = 0;  // Perturbations predicted as the explained label

    [[nodiscard]] double precision() const {
        return sampled == 0 ? 0.0 : static_cast<double>(positive) / static_cast<double>(sampled);
    }
};

// =============================================================================
// Candidate Snapshot - Immutable value copy of a candidate
// =============================================================================

struct CandidateSnapshot {
    CandidateId id = kNoCandidate;
    CandidateId parent = kNoCandidate;
    FeatureSet ordered_features;
    FeatureSet canonical_features;
    CandidateStats stats;
    std::optional<double> coverage;
    std::vector<FeatureSet> lineage;  // Root first, this candidate last

    [[nodiscard]] double precision() const { return stats.precision(); }
};

// =============================================================================
// AnchorCandidate
// =============================================================================

class AnchorCandidate : NonCopyable {
  public:
    AnchorCandidate(CandidateId id, FeatureSet ordered_features,
                    CandidateId parent = kNoCandidate);

    // -------------------------------------------------------------------------
    // Identity
    // -------------------------------------------------------------------------

    [[nodiscard]] CandidateId id() const { return id_; }
    [[nodiscard]] CandidateId parentId() const { return parent_; }
    [[nodiscard]] bool hasParent() const { return parent_ != kNoCandidate; }

    /// Features in the order they were added
    [[nodiscard]] const FeatureSet& orderedFeatures() const { return ordered_; }

    /// Features sorted ascending; equality and hashing use this view
    [[nodiscard]] const FeatureSet& canonicalFeatures() const { return canonical_; }

    [[nodiscard]] size_t size() const { return ordered_.size(); }
    [[nodiscard]] bool contains(FeatureIndex feature) const;

    /// Same feature set regardless of insertion order
    [[nodiscard]] bool sameFeatures(const AnchorCandidate& other) const {
        return canonical_ == other.canonical_;
    }
    bool operator==(const AnchorCandidate& other) const { return sameFeatures(other); }

    // -------------------------------------------------------------------------
    // Sample Statistics
    // -------------------------------------------------------------------------

    /// Merge a finished batch into the counters. Only the sampling service calls
    /// this; the pair is updated under one lock so readers never see a partial
    /// batch.
    void registerSamples(uint64_t sampled, uint64_t positive);

    [[nodiscard]] CandidateStats stats() const;
    [[nodiscard]] uint64_t sampledSize() const { return stats().sampled; }
    [[nodiscard]] uint64_t positiveSamples() const { return stats().positive; }
    [[nodiscard]] double precision() const { return stats().precision(); }

    // -------------------------------------------------------------------------
    // Coverage
    // -------------------------------------------------------------------------

    [[nodiscard]] bool isCoverageUndefined() const { return !coverage_.has_value(); }
    [[nodiscard]] double coverage() const { return coverage_.value_or(0.0); }
    [[nodiscard]] const std::optional<double>& coverageValue() const { return coverage_; }
    void setCoverage(double coverage) { coverage_ = coverage; }

    // -------------------------------------------------------------------------
    // Session Ownership
    // -------------------------------------------------------------------------

    /// Claim the candidate for one sampling session. Fails if another session
    /// is currently sampling it.
    [[nodiscard]] bool acquireSampling();
    void releaseSampling();
    [[nodiscard]] bool isBeingSampled() const { return in_session_.load(); }

    [[nodiscard]] std::string toString() const;

  private:
    CandidateId id_;
    CandidateId parent_;
    FeatureSet ordered_;
    FeatureSet canonical_;

    mutable std::mutex stats_mutex_;
    CandidateStats stats_;

    std::optional<double> coverage_;
    std::atomic<bool> in_session_{false};
};

// Non-owning list of candidates; the owning CandidatePool outlives it
using CandidateList = std::vector<AnchorCandidate*>;

// =============================================================================
// CandidatePool - Owner of every candidate of one search
// =============================================================================

class CandidatePool : NonCopyable {
  public:
    CandidatePool() = default;

    /// Create a candidate; duplicate feature indices are dropped (first
    /// occurrence kept)
    AnchorCandidate* create(FeatureSet ordered_features, CandidateId parent = kNoCandidate);

    /// Look up a candidate by id (nullptr if unknown)
    [[nodiscard]] AnchorCandidate* find(CandidateId id) const;

    /// Parent of a candidate (nullptr for round-one candidates)
    [[nodiscard]] const AnchorCandidate* parentOf(const AnchorCandidate& candidate) const;

    /// Feature sets from the root ancestor to the candidate itself
    [[nodiscard]] std::vector<FeatureSet> lineage(const AnchorCandidate& candidate) const;

    /// Value copy including lineage
    [[nodiscard]] CandidateSnapshot snapshot(const AnchorCandidate& candidate) const;

    [[nodiscard]] size_t size() const { return candidates_.size(); }
    void reset() { candidates_.clear(); }

  private:
    std::vector<std::unique_ptr<AnchorCandidate>> candidates_;
};

}  // namespace anchor
