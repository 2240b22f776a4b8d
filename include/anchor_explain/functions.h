#pragma once

// =============================================================================
// Anchor Explain - Collaborator Interfaces
// =============================================================================
//
// Capability interfaces for the pluggable parts of an explanation: the
// classifier being explained, the perturbation strategy generating synthetic
// neighbours, and the coverage estimator. Each is a single-method abstract
// class so tests and callers can substitute their own implementation.
//

#include "anchor_explain/candidate.h"

#include <cstddef>
#include <vector>

namespace anchor {

// =============================================================================
// Classification
// =============================================================================

/// Black-box classifier. Must return one label per instance and be
/// deterministic for identical input.
template <typename T>
class ClassificationFunction {
  public:
    virtual ~ClassificationFunction() = default;

    [[nodiscard]] virtual std::vector<int> predict(const std::vector<T>& instances) const = 0;
};

// =============================================================================
// Perturbation
// =============================================================================

template <typename T>
struct PerturbationResult {
    // Perturbed instances; each keeps the fixed features of the request
    std::vector<T> raw_result;

    // Optional auxiliary data: feature_changed[i][f] is true when feature f of
    // sample i differs from the explained instance
    std::vector<std::vector<bool>> feature_changed;
};

/// Generates neighbours of the explained instance with some features fixed
template <typename T>
class PerturbationFunction {
  public:
    virtual ~PerturbationFunction() = default;

    /// Must return exactly `count` instances
    [[nodiscard]] virtual PerturbationResult<T> perturb(const FeatureSet& fixed_features,
                                                        size_t count) = 0;
};

// =============================================================================
// Coverage
// =============================================================================

/// Estimates the fraction of the input space a feature conjunction applies to.
/// Must be non-increasing as the feature set grows.
class CoverageIdentification {
  public:
    virtual ~CoverageIdentification() = default;

    [[nodiscard]] virtual double calculateCoverage(const FeatureSet& features) const = 0;
};

// =============================================================================
// Data Instances
// =============================================================================

/// Number of features of an explained instance. Overload for instance types
/// without a size() member.
template <typename T>
size_t featureCount(const T& instance) {
    return instance.size();
}

}  // namespace anchor
