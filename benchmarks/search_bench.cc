// =============================================================================
// Anchor Explain - Beam Search Benchmarks
// =============================================================================

#include "anchor_explain/anchor_explain.h"

#include <fmt/format.h>
#include <nanobench.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <mutex>
#include <random>
#include <utility>
#include <vector>

namespace anchor {

namespace {

using Row = std::vector<int>;

// Label 1 while features 0 and 3 keep their observed values
class ConjunctionClassifier : public ClassificationFunction<Row> {
  public:
    std::vector<int> predict(const std::vector<Row>& instances) const override {
        std::vector<int> labels;
        labels.reserve(instances.size());
        for (const auto& row : instances) {
            labels.push_back(row[0] == 1 && row[3] == 1 ? 1 : 0);
        }
        return labels;
    }
};

class ReplacePerturbation : public PerturbationFunction<Row> {
  public:
    explicit ReplacePerturbation(Row instance) : instance_(std::move(instance)), rng_(17) {}

    PerturbationResult<Row> perturb(const FeatureSet& fixed, size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::bernoulli_distribution coin(0.5);
        PerturbationResult<Row> result;
        result.raw_result.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            Row row = instance_;
            for (size_t f = 0; f < row.size(); ++f) {
                if (std::find(fixed.begin(), fixed.end(), static_cast<FeatureIndex>(f)) == fixed.end()) {
                    row[f] = coin(rng_) ? 1 : 0;
                }
            }
            result.raw_result.push_back(std::move(row));
        }
        return result;
    }

  private:
    Row instance_;
    std::mutex mutex_;
    std::mt19937 rng_;
};

class HalvingCoverage : public CoverageIdentification {
  public:
    double calculateCoverage(const FeatureSet& features) const override {
        return std::pow(0.5, static_cast<double>(features.size()));
    }
};

}  // namespace

void benchSearch() {
    ankerl::nanobench::Bench bench;
    bench.title("Anchor Search").minEpochIterations(3);

    const Row instance{1, 0, 1, 1, 0, 1, 0, 0};
    auto classifier = std::make_shared<ConjunctionClassifier>();
    auto coverage = std::make_shared<HalvingCoverage>();

    for (int threads : {1, 4}) {
        bench.run(fmt::format("Explain 8 features, {} thread(s)", threads), [&] {
            auto explainer = AnchorConstructionBuilder<Row>(
                                 classifier, std::make_shared<ReplacePerturbation>(instance),
                                 instance)
                                 .setCoverageIdentification(coverage)
                                 .setTau(0.95)
                                 .setThreadCount(threads)
                                 .build();
            if (!explainer) {
                return;
            }
            auto result = explainer->explain();
            ankerl::nanobench::doNotOptimizeAway(result);
        });
    }
}

}  // namespace anchor
