#pragma once

// =============================================================================
// Anchor Explain - Test Doubles
// =============================================================================
//
// Simple collaborators shared by the test suites: tabular rows of categorical
// values, rule based and random classifiers, a uniform replacement
// perturbation, monotone coverage and scripted sampling.
//

#include "anchor_explain/candidate.h"
#include "anchor_explain/exploration/best_arm_identification.h"
#include "anchor_explain/functions.h"
#include "anchor_explain/sampling/sampling_service.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <functional>
#include <map>
#include <mutex>
#include <random>
#include <string_view>
#include <utility>
#include <vector>

namespace anchor {
namespace test {

// A row of categorical feature values
using Row = std::vector<int>;

// =============================================================================
// Classifiers
// =============================================================================

class RuleClassifier : public ClassificationFunction<Row> {
  public:
    explicit RuleClassifier(std::function<int(const Row&)> rule) : rule_(std::move(rule)) {}

    std::vector<int> predict(const std::vector<Row>& instances) const override {
        calls_.fetch_add(1);
        std::vector<int> labels;
        labels.reserve(instances.size());
        for (const auto& row : instances) {
            labels.push_back(rule_(row));
        }
        return labels;
    }

    [[nodiscard]] size_t calls() const { return calls_.load(); }

  private:
    std::function<int(const Row&)> rule_;
    mutable std::atomic<size_t> calls_{0};
};

/// Ignores the features entirely: label 0 or 1 with equal probability
class RandomClassifier : public ClassificationFunction<Row> {
  public:
    explicit RandomClassifier(uint32_t seed) : rng_(seed) {}

    std::vector<int> predict(const std::vector<Row>& instances) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::bernoulli_distribution coin(0.5);
        std::vector<int> labels;
        labels.reserve(instances.size());
        for (size_t i = 0; i < instances.size(); ++i) {
            labels.push_back(coin(rng_) ? 1 : 0);
        }
        return labels;
    }

  private:
    mutable std::mutex mutex_;
    mutable std::mt19937 rng_;
};

/// Returns one label too few; violates the classifier contract
class ShortClassifier : public ClassificationFunction<Row> {
  public:
    std::vector<int> predict(const std::vector<Row>& instances) const override {
        return std::vector<int>(instances.empty() ? 0 : instances.size() - 1, 1);
    }
};

// =============================================================================
// Perturbation
// =============================================================================

/// Keeps the fixed features and draws every other feature uniformly from
/// [0, cardinality)
class UniformPerturbation : public PerturbationFunction<Row> {
  public:
    UniformPerturbation(Row instance, int cardinality, uint32_t seed)
        : instance_(std::move(instance)), cardinality_(cardinality), rng_(seed) {}

    PerturbationResult<Row> perturb(const FeatureSet& fixed_features, size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.fetch_add(1);
        std::uniform_int_distribution<int> value(0, cardinality_ - 1);

        PerturbationResult<Row> result;
        result.raw_result.reserve(count);
        result.feature_changed.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            Row row = instance_;
            std::vector<bool> changed(row.size(), false);
            for (size_t f = 0; f < row.size(); ++f) {
                bool fixed = std::find(fixed_features.begin(), fixed_features.end(),
                                       static_cast<FeatureIndex>(f)) != fixed_features.end();
                if (!fixed) {
                    row[f] = value(rng_);
                    changed[f] = row[f] != instance_[f];
                }
            }
            result.raw_result.push_back(std::move(row));
            result.feature_changed.push_back(std::move(changed));
        }
        return result;
    }

    [[nodiscard]] size_t calls() const { return calls_.load(); }

  private:
    Row instance_;
    int cardinality_;
    std::mutex mutex_;
    std::mt19937 rng_;
    std::atomic<size_t> calls_{0};
};

// =============================================================================
// Coverage
// =============================================================================

/// Product of per-feature factors; never grows when a feature is added
class MonotoneCoverage : public CoverageIdentification {
  public:
    explicit MonotoneCoverage(std::vector<double> factors) : factors_(std::move(factors)) {}

    double calculateCoverage(const FeatureSet& features) const override {
        calls_.fetch_add(1);
        double coverage = 1.0;
        for (FeatureIndex f : features) {
            coverage *= factors_.at(f);
        }
        return coverage;
    }

    [[nodiscard]] size_t calls() const { return calls_.load(); }

  private:
    std::vector<double> factors_;
    mutable std::atomic<size_t> calls_{0};
};

class ConstantCoverage : public CoverageIdentification {
  public:
    explicit ConstantCoverage(double value) : value_(value) {}

    double calculateCoverage(const FeatureSet&) const override { return value_; }

  private:
    double value_;
};

// =============================================================================
// Scripted Sampling
// =============================================================================

/// Deterministic sampler: a candidate's running precision is the scripted
/// probability rounded up to the next whole positive count
class ScriptedSampler {
  public:
    ScriptedSampler(std::map<FeatureSet, double> precision, double fallback)
        : precision_(std::move(precision)), fallback_(fallback) {}

    Result<double> operator()(AnchorCandidate& candidate, size_t count) const {
        auto it = precision_.find(candidate.canonicalFeatures());
        const double p = it != precision_.end() ? it->second : fallback_;
        const uint64_t before = candidate.sampledSize();
        const auto positive = static_cast<uint64_t>(
            std::ceil(static_cast<double>(before + count) * p) -
            std::ceil(static_cast<double>(before) * p));
        candidate.registerSamples(count, positive);
        return static_cast<double>(positive) / static_cast<double>(count);
    }

  private:
    std::map<FeatureSet, double> precision_;
    double fallback_;
};

inline sampling::SampleFunction scriptedSampler(std::map<FeatureSet, double> precision,
                                                double fallback) {
    return ScriptedSampler(std::move(precision), fallback);
}

// =============================================================================
// Best-Arm Identification
// =============================================================================

/// Takes the top_n candidates by current precision without sampling and
/// records every invocation
class RecordingBestArm : public exploration::BestAnchorIdentification {
  public:
    Result<CandidateList> identify(const CandidateList& candidates, sampling::SamplingService&,
                                   double delta, size_t top_n) override {
        ++invocations_;
        last_delta_ = delta;
        last_top_n_ = top_n;
        CandidateList sorted = candidates;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const AnchorCandidate* a, const AnchorCandidate* b) {
                             return a->precision() > b->precision();
                         });
        sorted.resize(std::min(top_n, sorted.size()));
        return sorted;
    }

    std::string_view name() const override { return "Recording"; }

    [[nodiscard]] size_t invocations() const { return invocations_; }
    [[nodiscard]] double lastDelta() const { return last_delta_; }
    [[nodiscard]] size_t lastTopN() const { return last_top_n_; }

  private:
    size_t invocations_ = 0;
    double last_delta_ = 0.0;
    size_t last_top_n_ = 0;
};

}  // namespace test
}  // namespace anchor
