// =============================================================================
// Anchor Explain - Configuration Parser Fuzz Target
// =============================================================================

#include "anchor_explain/config.h"

#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0)
        return 0;

    std::string json(reinterpret_cast<const char*>(data), size);

    // Parse errors are reported through Result; anything thrown is a bug
    auto config = anchor::AnchorConfig::fromJson(json);
    if (config) {
        auto valid = config->validate();
        (void)valid;

        // A parsed configuration must survive a round trip
        auto again = anchor::AnchorConfig::fromJson(config->toJson());
        if (!again) {
            __builtin_trap();
        }
    }

    return 0;
}
