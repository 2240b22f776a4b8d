#pragma once

// =============================================================================
// Anchor Explain - KL-LUCB Best-Arm Identification
// =============================================================================
//
// KL-LUCB (Kaufmann & Kalyanakrishnan, 2013): repeatedly samples the weakest
// member of the current top set and the strongest outsider until their KL
// confidence bounds are separated by at most epsilon.
//

#include "anchor_explain/exploration/best_arm_identification.h"

#include <cstddef>
#include <cstdint>

namespace anchor {
namespace exploration {

struct KlLucbConfig {
    double epsilon = 0.1;          // Accepted gap between the bounds
    size_t batch_size = 100;       // Samples drawn per arm and iteration
    size_t max_iterations = 10000; // Stops sampling even if bounds overlap
};

class KlLucb : public BestAnchorIdentification {
  public:
    KlLucb() = default;
    explicit KlLucb(const KlLucbConfig& config) : config_(config) {}

    [[nodiscard]] Result<CandidateList> identify(const CandidateList& candidates,
                                                 sampling::SamplingService& service, double delta,
                                                 size_t top_n) override;

    [[nodiscard]] std::string_view name() const override { return "KL-LUCB"; }

    [[nodiscard]] const KlLucbConfig& config() const { return config_; }

    /// Iterations used by the most recent identify() call
    [[nodiscard]] size_t lastIterations() const { return last_iterations_; }

  private:
    KlLucbConfig config_;
    size_t last_iterations_ = 0;
};

}  // namespace exploration
}  // namespace anchor
