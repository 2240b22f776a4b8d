#pragma once

// =============================================================================
// Anchor Explain - Search Configuration
// =============================================================================
//
// Tunables of one anchor search. Validated once when a search is constructed
// and immutable afterwards. Can be stored to and loaded from JSON.
//

#include "anchor_explain/error.h"

#include <cstddef>
#include <string>

namespace anchor {

struct AnchorConfig {
    // Beam search
    int max_anchor_size = 0;  // 0 = number of features of the instance
    int beam_width = 2;       // Candidates kept per round (parameter B)

    // Statistical guarantees
    double delta = 0.1;            // Error probability of best-arm identification
    double tau = 1.0;              // Required precision of an anchor
    double tau_discrepancy = 0.05; // Accepted slack around tau when validating
    double epsilon = 0.1;          // KL-LUCB bound gap

    // Sampling
    int init_sample_count = 1;  // Samples every candidate gets before selection
    int thread_count = 1;       // Sampling threads (<= 1 = calling thread)
    int lucb_batch_size = 100;  // KL-LUCB samples per arm and iteration
    bool balance_sampling = false;

    // Coverage
    bool lazy_coverage = false;  // Only compute coverage when it is needed

    // Termination
    int max_validation_rounds = 1000;  // Extra batches before a candidate counts as invalid

    /// Range check of every parameter
    [[nodiscard]] Result<void> validate() const;

    [[nodiscard]] std::string toJson() const;

    /// Missing keys keep their defaults; unknown keys are ignored
    [[nodiscard]] static Result<AnchorConfig> fromJson(const std::string& data);
};

Result<AnchorConfig> loadConfig(const std::string& path);
Result<void> saveConfig(const AnchorConfig& config, const std::string& path);

}  // namespace anchor
