#pragma once

// =============================================================================
// Anchor Explain - Prediction Sampler
// =============================================================================
//
// The sampling primitive: perturb the explained instance with a candidate's
// features fixed, classify the perturbations and count how many keep the
// explained label.
//

#include "anchor_explain/candidate.h"
#include "anchor_explain/error.h"
#include "anchor_explain/functions.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>

namespace anchor {
namespace sampling {

template <typename T>
class PredictionSampler {
  public:
    PredictionSampler(std::shared_ptr<ClassificationFunction<T>> classifier,
                      std::shared_ptr<PerturbationFunction<T>> perturbation, int explained_label)
        : classifier_(std::move(classifier)),
          perturbation_(std::move(perturbation)),
          explained_label_(explained_label) {}

    /// Draw `count` samples for the candidate and merge them into it
    Result<double> operator()(AnchorCandidate& candidate, size_t count) const {
        if (count < 1) {
            return 0.0;
        }

        PerturbationResult<T> perturbed =
            perturbation_->perturb(candidate.canonicalFeatures(), count);
        if (perturbed.raw_result.size() != count) {
            ANCHOR_RETURN_ERROR(ErrorCode::kSamplingFailed,
                                fmt::format("Perturbation returned {} instances, {} requested",
                                            perturbed.raw_result.size(), count));
        }

        std::vector<int> predictions = classifier_->predict(perturbed.raw_result);
        if (predictions.size() != perturbed.raw_result.size()) {
            ANCHOR_RETURN_ERROR(ErrorCode::kSamplingFailed,
                                fmt::format("Classifier returned {} labels for {} instances",
                                            predictions.size(), perturbed.raw_result.size()));
        }

        const auto matching = static_cast<uint64_t>(
            std::count(predictions.begin(), predictions.end(), explained_label_));
        candidate.registerSamples(count, matching);

        double precision = static_cast<double>(matching) / static_cast<double>(predictions.size());
        spdlog::trace("Sampling {} perturbations of {} resulted in {} correct predictions, "
                      "precision {}",
                      count, formatFeatures(candidate.canonicalFeatures()), matching, precision);
        return precision;
    }

    [[nodiscard]] int explainedLabel() const { return explained_label_; }

  private:
    std::shared_ptr<ClassificationFunction<T>> classifier_;
    std::shared_ptr<PerturbationFunction<T>> perturbation_;
    int explained_label_;
};

}  // namespace sampling
}  // namespace anchor
