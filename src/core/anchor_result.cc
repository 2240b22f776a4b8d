// =============================================================================
// Anchor Explain - Anchor Result Export
// =============================================================================

#include "anchor_explain/anchor_result.h"

#include <nlohmann/json.hpp>

namespace anchor {

std::string resultToJson(const CandidateSnapshot& candidate, int explained_label, bool is_anchor,
                         const search::SearchStats& stats) {
    nlohmann::json j;

    j["features"] = candidate.ordered_features;
    j["canonical_features"] = candidate.canonical_features;
    j["precision"] = candidate.precision();
    if (candidate.coverage) {
        j["coverage"] = *candidate.coverage;
    } else {
        j["coverage"] = nullptr;
    }
    j["sampled"] = candidate.stats.sampled;
    j["positive"] = candidate.stats.positive;
    j["label"] = explained_label;
    j["is_anchor"] = is_anchor;

    nlohmann::json lineage = nlohmann::json::array();
    for (const auto& features : candidate.lineage) {
        lineage.push_back(features);
    }
    j["lineage"] = lineage;

    nlohmann::json sj;
    sj["rounds"] = stats.rounds;
    sj["candidates_generated"] = stats.candidates_generated;
    sj["candidates_pruned"] = stats.candidates_pruned;
    sj["validation_rounds"] = stats.validation_rounds;
    sj["validation_cap_hits"] = stats.validation_cap_hits;
    sj["samples_drawn"] = stats.samples_drawn;
    sj["elapsed_ms"] = stats.elapsed_ms;
    sj["terminated_early"] = stats.terminated_early;
    sj["used_fallback"] = stats.used_fallback;
    j["stats"] = sj;

    return j.dump(2);
}

}  // namespace anchor
