// =============================================================================
// Anchor Explain - Tabular Explanation Example
// =============================================================================
//
// Explains a rule based "loan approval" classifier over a small categorical
// data set. Perturbations replace every free feature with the value of a
// random data set row; coverage is the share of data set rows matching the
// explained instance on the anchored features.
//

#include "anchor_explain/anchor_explain.h"

#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace {

using Row = std::vector<int>;

// age bucket, education, employment, housing, credit history
const std::vector<std::string> kFeatureNames = {"age", "education", "employment", "housing",
                                                "credit_history"};

std::vector<Row> makeDataset(size_t rows, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> bucket(0, 3);
    std::vector<Row> dataset;
    dataset.reserve(rows);
    for (size_t i = 0; i < rows; ++i) {
        Row row(kFeatureNames.size());
        for (auto& value : row) {
            value = bucket(rng);
        }
        dataset.push_back(std::move(row));
    }
    return dataset;
}

class LoanClassifier : public anchor::ClassificationFunction<Row> {
  public:
    std::vector<int> predict(const std::vector<Row>& instances) const override {
        std::vector<int> labels;
        labels.reserve(instances.size());
        for (const auto& row : instances) {
            bool approved = row[4] >= 2 && (row[2] >= 2 || row[1] == 3);
            labels.push_back(approved ? 1 : 0);
        }
        return labels;
    }
};

class DatasetPerturbation : public anchor::PerturbationFunction<Row> {
  public:
    DatasetPerturbation(Row instance, std::shared_ptr<const std::vector<Row>> dataset)
        : instance_(std::move(instance)), dataset_(std::move(dataset)), rng_(99) {}

    anchor::PerturbationResult<Row> perturb(const anchor::FeatureSet& fixed,
                                            size_t count) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<size_t> pick(0, dataset_->size() - 1);

        anchor::PerturbationResult<Row> result;
        result.raw_result.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            Row row = (*dataset_)[pick(rng_)];
            for (anchor::FeatureIndex f : fixed) {
                row[f] = instance_[f];
            }
            result.raw_result.push_back(std::move(row));
        }
        return result;
    }

  private:
    Row instance_;
    std::shared_ptr<const std::vector<Row>> dataset_;
    std::mutex mutex_;
    std::mt19937 rng_;
};

class DatasetCoverage : public anchor::CoverageIdentification {
  public:
    DatasetCoverage(Row instance, std::shared_ptr<const std::vector<Row>> dataset)
        : instance_(std::move(instance)), dataset_(std::move(dataset)) {}

    double calculateCoverage(const anchor::FeatureSet& features) const override {
        auto matching = std::count_if(dataset_->begin(), dataset_->end(), [&](const Row& row) {
            return std::all_of(features.begin(), features.end(),
                               [&](anchor::FeatureIndex f) { return row[f] == instance_[f]; });
        });
        return static_cast<double>(matching) / static_cast<double>(dataset_->size());
    }

  private:
    Row instance_;
    std::shared_ptr<const std::vector<Row>> dataset_;
};

}  // namespace

int main() {
    anchor::RuntimeConfig runtime;
    runtime.enable_debug_output = false;

    auto init_result = anchor::initialize(runtime);
    if (!init_result) {
        std::cerr << "Failed to initialize: " << init_result.error().toString() << "\n";
        return 1;
    }

    auto dataset = std::make_shared<const std::vector<Row>>(makeDataset(2000, 7));
    const Row instance{2, 1, 3, 0, 3};

    auto explainer =
        anchor::AnchorConstructionBuilder<Row>(std::make_shared<LoanClassifier>(),
                                               std::make_shared<DatasetPerturbation>(instance,
                                                                                     dataset),
                                               instance)
            .setCoverageIdentification(std::make_shared<DatasetCoverage>(instance, dataset))
            .setTau(0.95)
            .setBeamWidth(2)
            .setThreadCount(2)
            .build();
    if (!explainer) {
        std::cerr << "Failed to build explainer: " << explainer.error().toString() << "\n";
        return 1;
    }

    auto result = explainer->explain();
    if (!result) {
        std::cerr << "Explanation failed: " << result.error().toString() << "\n";
        return 1;
    }

    std::cout << "Prediction " << result->explainedLabel() << " holds while:\n";
    for (anchor::FeatureIndex f : result->orderedFeatures()) {
        std::cout << "  " << kFeatureNames[f] << " = " << instance[f] << "\n";
    }
    std::cout << result->toString() << "\n";
    std::cout << result->toJson() << "\n";

    anchor::shutdown();
    return 0;
}
