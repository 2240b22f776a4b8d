#pragma once

// =============================================================================
// Anchor Explain - Main Header
// =============================================================================
//
// Model-agnostic "Anchor" explanations for black-box classifiers: the
// smallest-coverage-maximizing set of feature constraints that keeps a
// prediction stable with statistically guaranteed precision.
//
// Include this header for full API access.
//

#include "anchor_explain/anchor_result.h"
#include "anchor_explain/candidate.h"
#include "anchor_explain/common.h"
#include "anchor_explain/config.h"
#include "anchor_explain/error.h"
#include "anchor_explain/explainer.h"
#include "anchor_explain/functions.h"

#include <string>

namespace anchor {

// =============================================================================
// Version Information
// =============================================================================

struct Version {
    static constexpr int major = ANCHOR_VERSION_MAJOR;
    static constexpr int minor = ANCHOR_VERSION_MINOR;
    static constexpr int patch = ANCHOR_VERSION_PATCH;

    static std::string string() {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }
};

// =============================================================================
// Runtime Initialization
// =============================================================================

struct RuntimeConfig {
    // Logging settings
    std::string log_level = "info";    // spdlog level name (trace ... off)
    bool enable_debug_output = false;  // Overrides log_level with debug
};

// Initialize logging (call once at program start)
Result<void> initialize(const RuntimeConfig& config = {});

// Restore the default logging state
void shutdown();

// Check if runtime is initialized
bool isInitialized();

}  // namespace anchor
