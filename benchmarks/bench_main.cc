// =============================================================================
// Anchor Explain - Benchmark Entry Point
// =============================================================================

#define ANKERL_NANOBENCH_IMPLEMENT
#include "anchor_explain/anchor_explain.h"

#include <nanobench.h>

namespace anchor {
void benchBounds();
void benchSearch();
}  // namespace anchor

int main() {
    anchor::RuntimeConfig config;
    config.log_level = "warn";
    if (!anchor::initialize(config)) {
        return 1;
    }

    anchor::benchBounds();
    anchor::benchSearch();

    anchor::shutdown();
    return 0;
}
