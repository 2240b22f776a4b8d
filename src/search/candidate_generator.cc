// =============================================================================
// Anchor Explain - Candidate Generation Implementation
// =============================================================================

#include "anchor_explain/search/candidate_generator.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <unordered_set>
#include <utility>

namespace anchor {
namespace search {

CandidateGenerator::CandidateGenerator(CandidatePool& pool,
                                       std::shared_ptr<const CoverageIdentification> coverage,
                                       bool lazy_coverage)
    : pool_(pool), coverage_(std::move(coverage)), lazy_coverage_(lazy_coverage) {}

Result<double> CandidateGenerator::coverageOf(const FeatureSet& features) const {
    double value = coverage_->calculateCoverage(features);
    if (std::isnan(value) || value < 0.0 || value > 1.0) {
        ANCHOR_RETURN_ERROR(ErrorCode::kOutOfRange,
                            fmt::format("Coverage of {} is {}, expected a value in [0, 1]",
                                        formatFeatures(features), value));
    }
    return value;
}

Result<void> CandidateGenerator::ensureCoverage(AnchorCandidate& candidate) const {
    if (!candidate.isCoverageUndefined()) {
        return {};
    }
    double value = 0.0;
    ANCHOR_ASSIGN_OR_RETURN(value, coverageOf(candidate.canonicalFeatures()));
    candidate.setCoverage(value);
    return {};
}

Result<CandidateList> CandidateGenerator::generate(const CandidateList& previous,
                                                   size_t feature_count, double min_coverage) {
    last_stats_ = {};

    struct Extension {
        FeatureSet ordered;
        FeatureSet canonical;
        CandidateId parent = kNoCandidate;
    };

    // Collect distinct extensions; the first path reaching a set keeps it
    std::vector<Extension> extensions;
    std::unordered_set<FeatureSet, FeatureSetHash> seen;
    for (size_t f = 0; f < feature_count; ++f) {
        const auto feature = static_cast<FeatureIndex>(f);

        if (previous.empty()) {
            FeatureSet single{feature};
            if (seen.insert(single).second) {
                extensions.push_back({single, single, kNoCandidate});
            }
            continue;
        }

        for (const auto* survivor : previous) {
            if (survivor->contains(feature)) {
                continue;
            }
            FeatureSet canonical = survivor->canonicalFeatures();
            canonical.insert(std::upper_bound(canonical.begin(), canonical.end(), feature),
                             feature);
            if (!seen.insert(canonical).second) {
                ++last_stats_.duplicates;
                continue;
            }
            FeatureSet ordered = survivor->orderedFeatures();
            ordered.push_back(feature);
            extensions.push_back({std::move(ordered), std::move(canonical), survivor->id()});
        }
    }

    CandidateList result;
    result.reserve(extensions.size());
    for (auto& extension : extensions) {
        std::optional<double> coverage;
        // A floor needs the coverage right away even when evaluation is lazy
        if (!lazy_coverage_ || min_coverage > 0.0) {
            double value = 0.0;
            ANCHOR_ASSIGN_OR_RETURN(value, coverageOf(extension.canonical));
            coverage = value;
        }
        if (min_coverage > 0.0 && *coverage < min_coverage) {
            ++last_stats_.pruned;
            continue;
        }

        AnchorCandidate* candidate = pool_.create(std::move(extension.ordered), extension.parent);
        if (coverage) {
            candidate->setCoverage(*coverage);
        }
        result.push_back(candidate);
    }

    last_stats_.generated = result.size();
    spdlog::debug("Generated {} candidates ({} duplicates, {} below coverage {:.4f})",
                  last_stats_.generated, last_stats_.duplicates, last_stats_.pruned,
                  min_coverage);
    return result;
}

}  // namespace search
}  // namespace anchor
