#pragma once

// =============================================================================
// Anchor Explain - Explainer and Builder
// =============================================================================
//
// Typed front end of the search. The builder collects the collaborators and
// the configuration, the explainer binds them to one explained instance:
//
//   auto explainer = AnchorConstructionBuilder<Row>(classifier, perturbation, row)
//                        .setCoverageIdentification(coverage)
//                        .setTau(0.95)
//                        .build();
//   auto result = explainer->explain();
//

#include "anchor_explain/anchor_result.h"
#include "anchor_explain/config.h"
#include "anchor_explain/error.h"
#include "anchor_explain/exploration/kl_lucb.h"
#include "anchor_explain/functions.h"
#include "anchor_explain/sampling/prediction_sampler.h"
#include "anchor_explain/search/anchor_construction.h"

#include <fmt/format.h>

#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace anchor {

template <typename T>
class AnchorConstructionBuilder;

// =============================================================================
// AnchorExplainer
// =============================================================================

template <typename T>
class AnchorExplainer {
  public:
    AnchorExplainer(AnchorExplainer&&) = default;
    AnchorExplainer& operator=(AnchorExplainer&&) = default;

    /// Run the search. A best-effort candidate is returned as a result with
    /// isAnchor() == false; only a search without any usable candidate fails.
    Result<AnchorResult<T>> explain() {
        search::SearchOutcome outcome;
        ANCHOR_ASSIGN_OR_RETURN(outcome, construction_->run());
        return AnchorResult<T>(std::move(outcome), instance_, construction_->explainedLabel());
    }

    void setRoundObserver(search::RoundObserver observer) {
        construction_->setRoundObserver(std::move(observer));
    }

    [[nodiscard]] const T& instance() const { return instance_; }
    [[nodiscard]] int explainedLabel() const { return construction_->explainedLabel(); }
    [[nodiscard]] const AnchorConfig& config() const { return construction_->config(); }
    [[nodiscard]] search::AnchorConstruction& construction() { return *construction_; }

  private:
    friend class AnchorConstructionBuilder<T>;

    AnchorExplainer(std::unique_ptr<search::AnchorConstruction> construction, T instance)
        : construction_(std::move(construction)), instance_(std::move(instance)) {}

    std::unique_ptr<search::AnchorConstruction> construction_;
    T instance_;
};

// =============================================================================
// AnchorConstructionBuilder
// =============================================================================

template <typename T>
class AnchorConstructionBuilder {
  public:
    AnchorConstructionBuilder(std::shared_ptr<ClassificationFunction<T>> classifier,
                              std::shared_ptr<PerturbationFunction<T>> perturbation, T instance)
        : classifier_(std::move(classifier)),
          perturbation_(std::move(perturbation)),
          instance_(std::move(instance)) {}

    // -------------------------------------------------------------------------
    // Collaborators
    // -------------------------------------------------------------------------

    AnchorConstructionBuilder& setCoverageIdentification(
        std::shared_ptr<const CoverageIdentification> coverage) {
        coverage_ = std::move(coverage);
        return *this;
    }

    /// Defaults to KL-LUCB with the configured epsilon and batch size
    AnchorConstructionBuilder& setBestAnchorIdentification(
        std::shared_ptr<exploration::BestAnchorIdentification> best_arm) {
        best_arm_ = std::move(best_arm);
        return *this;
    }

    /// Defaults to the classifier's prediction for the explained instance
    AnchorConstructionBuilder& setExplainedLabel(int label) {
        explained_label_ = label;
        return *this;
    }

    // -------------------------------------------------------------------------
    // Parameters
    // -------------------------------------------------------------------------

    AnchorConstructionBuilder& setConfig(const AnchorConfig& config) {
        config_ = config;
        return *this;
    }
    AnchorConstructionBuilder& setMaxAnchorSize(int size) {
        config_.max_anchor_size = size;
        return *this;
    }
    AnchorConstructionBuilder& setBeamWidth(int width) {
        config_.beam_width = width;
        return *this;
    }
    AnchorConstructionBuilder& setDelta(double delta) {
        config_.delta = delta;
        return *this;
    }
    AnchorConstructionBuilder& setTau(double tau) {
        config_.tau = tau;
        return *this;
    }
    AnchorConstructionBuilder& setTauDiscrepancy(double discrepancy) {
        config_.tau_discrepancy = discrepancy;
        return *this;
    }
    AnchorConstructionBuilder& setEpsilon(double epsilon) {
        config_.epsilon = epsilon;
        return *this;
    }
    AnchorConstructionBuilder& setInitSampleCount(int count) {
        config_.init_sample_count = count;
        return *this;
    }
    AnchorConstructionBuilder& setThreadCount(int count) {
        config_.thread_count = count;
        return *this;
    }
    AnchorConstructionBuilder& setLucbBatchSize(int size) {
        config_.lucb_batch_size = size;
        return *this;
    }
    AnchorConstructionBuilder& enableBalancedSampling(bool enabled = true) {
        config_.balance_sampling = enabled;
        return *this;
    }
    AnchorConstructionBuilder& enableLazyCoverage(bool enabled = true) {
        config_.lazy_coverage = enabled;
        return *this;
    }
    AnchorConstructionBuilder& setMaxValidationRounds(int rounds) {
        config_.max_validation_rounds = rounds;
        return *this;
    }

    [[nodiscard]] const AnchorConfig& config() const { return config_; }

    // -------------------------------------------------------------------------
    // Build
    // -------------------------------------------------------------------------

    Result<AnchorExplainer<T>> build() const {
        if (!classifier_) {
            ANCHOR_RETURN_ERROR(ErrorCode::kMissingCollaborator,
                                "Classification function must not be null");
        }
        if (!perturbation_) {
            ANCHOR_RETURN_ERROR(ErrorCode::kMissingCollaborator,
                                "Perturbation function must not be null");
        }
        ANCHOR_TRY(config_.validate());

        int label = 0;
        if (explained_label_) {
            label = *explained_label_;
        } else {
            std::vector<int> predicted = classifier_->predict(std::vector<T>{instance_});
            if (predicted.size() != 1) {
                ANCHOR_RETURN_ERROR(ErrorCode::kSamplingFailed,
                                    fmt::format("Classifier returned {} labels for 1 instance",
                                                predicted.size()));
            }
            label = predicted.front();
        }

        auto best_arm = best_arm_;
        if (!best_arm) {
            exploration::KlLucbConfig lucb;
            lucb.epsilon = config_.epsilon;
            lucb.batch_size = static_cast<size_t>(config_.lucb_batch_size);
            best_arm = std::make_shared<exploration::KlLucb>(lucb);
        }

        search::SearchCollaborators collaborators;
        collaborators.sample_fn =
            sampling::PredictionSampler<T>(classifier_, perturbation_, label);
        collaborators.coverage = coverage_;
        collaborators.best_arm = std::move(best_arm);

        std::unique_ptr<search::AnchorConstruction> construction;
        ANCHOR_ASSIGN_OR_RETURN(construction,
                                search::AnchorConstruction::create(std::move(collaborators),
                                                                   config_, featureCount(instance_),
                                                                   label));
        return AnchorExplainer<T>(std::move(construction), instance_);
    }

  private:
    std::shared_ptr<ClassificationFunction<T>> classifier_;
    std::shared_ptr<PerturbationFunction<T>> perturbation_;
    std::shared_ptr<const CoverageIdentification> coverage_;
    std::shared_ptr<exploration::BestAnchorIdentification> best_arm_;
    std::optional<int> explained_label_;
    AnchorConfig config_;
    T instance_;
};

}  // namespace anchor
