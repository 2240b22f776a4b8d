// =============================================================================
// Anchor Explain - Runtime Initialization
// =============================================================================

#include "anchor_explain/anchor_explain.h"

#include <spdlog/spdlog.h>

#include <atomic>

namespace anchor {

namespace {
std::atomic<bool> g_initialized{false};
RuntimeConfig g_config;
}  // namespace

Result<void> initialize(const RuntimeConfig& config) {
    if (g_initialized.exchange(true)) {
        spdlog::warn("Anchor Explain runtime already initialized");
        return {};
    }

    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        g_initialized.store(false);
        ANCHOR_RETURN_ERROR(ErrorCode::kInvalidConfig,
                            "Unknown log level: " + config.log_level);
    }
    g_config = config;

    if (config.enable_debug_output) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(level);
    }

    spdlog::info("Anchor Explain v{} initialized", Version::string());
    return {};
}

void shutdown() {
    if (!g_initialized.exchange(false)) {
        return;  // Not initialized
    }

    spdlog::info("Anchor Explain shutting down");
    spdlog::set_level(spdlog::level::info);
    g_config = RuntimeConfig{};
}

bool isInitialized() {
    return g_initialized.load();
}

}  // namespace anchor
