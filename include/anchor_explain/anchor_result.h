#pragma once

// =============================================================================
// Anchor Explain - Anchor Result
// =============================================================================
//
// Immutable outcome of one explanation: a value snapshot of the best candidate
// together with the explained instance and label. The result never points into
// the candidate pool of the search that produced it.
//

#include "anchor_explain/candidate.h"
#include "anchor_explain/error.h"
#include "anchor_explain/search/anchor_construction.h"

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace anchor {

/// JSON export shared by every AnchorResult<T> (the instance is not exported)
std::string resultToJson(const CandidateSnapshot& candidate, int explained_label, bool is_anchor,
                         const search::SearchStats& stats);

template <typename T>
class AnchorResult {
  public:
    AnchorResult(search::SearchOutcome outcome, T instance, int explained_label)
        : candidate_(std::move(outcome.best)),
          stats_(outcome.stats),
          is_anchor_(outcome.is_anchor),
          instance_(std::move(instance)),
          explained_label_(explained_label) {}

    /// True if the precision constraints were confirmed statistically
    [[nodiscard]] bool isAnchor() const { return is_anchor_; }

    /// kOk for a confirmed anchor, kNoAnchorFound for a best-effort candidate
    [[nodiscard]] ErrorCode status() const {
        return is_anchor_ ? ErrorCode::kOk : ErrorCode::kNoAnchorFound;
    }

    [[nodiscard]] const FeatureSet& orderedFeatures() const { return candidate_.ordered_features; }
    [[nodiscard]] const FeatureSet& canonicalFeatures() const {
        return candidate_.canonical_features;
    }
    [[nodiscard]] size_t size() const { return candidate_.ordered_features.size(); }

    [[nodiscard]] double precision() const { return candidate_.precision(); }
    [[nodiscard]] double coverage() const { return candidate_.coverage.value_or(0.0); }
    [[nodiscard]] uint64_t sampledSize() const { return candidate_.stats.sampled; }
    [[nodiscard]] uint64_t positiveSamples() const { return candidate_.stats.positive; }

    [[nodiscard]] const T& instance() const { return instance_; }
    [[nodiscard]] int explainedLabel() const { return explained_label_; }

    [[nodiscard]] const CandidateSnapshot& candidate() const { return candidate_; }
    [[nodiscard]] const std::vector<FeatureSet>& lineage() const { return candidate_.lineage; }
    [[nodiscard]] const search::SearchStats& searchStats() const { return stats_; }

    [[nodiscard]] std::string toJson() const {
        return resultToJson(candidate_, explained_label_, is_anchor_, stats_);
    }

    [[nodiscard]] std::string toString() const {
        return fmt::format("{} (precision {:.4f}, coverage {:.4f}{})",
                           formatFeatures(candidate_.ordered_features), precision(), coverage(),
                           is_anchor_ ? "" : ", not an anchor");
    }

  private:
    CandidateSnapshot candidate_;
    search::SearchStats stats_;
    bool is_anchor_;
    T instance_;
    int explained_label_;
};

}  // namespace anchor
