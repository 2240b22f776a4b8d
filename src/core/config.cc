// =============================================================================
// Anchor Explain - Search Configuration Implementation
// =============================================================================

#include "anchor_explain/config.h"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace anchor {

namespace {

constexpr const char* kNegativeValueMessage = " must not be negative";
constexpr const char* kNotPercentageMessage = " must be within [0, 1]";

bool isPercentage(double value) {
    return value >= 0.0 && value <= 1.0;
}

// Copy `key` into `target` when present
template <typename V>
void readKey(const nlohmann::json& j, const char* key, V& target) {
    if (j.contains(key)) {
        target = j.at(key).get<V>();
    }
}

}  // namespace

// =============================================================================
// Validation
// =============================================================================

Result<void> AnchorConfig::validate() const {
    auto negative = [](const char* name) {
        return Error::make(ErrorCode::kInvalidConfig, std::string(name) + kNegativeValueMessage);
    };
    auto percentage = [](const char* name) {
        return Error::make(ErrorCode::kInvalidConfig, std::string(name) + kNotPercentageMessage);
    };

    if (max_anchor_size < 0)
        return negative("Max anchor size");
    if (beam_width < 0)
        return negative("Beam width");
    if (!isPercentage(delta))
        return percentage("Delta value");
    if (!isPercentage(tau))
        return percentage("Tau value");
    if (!isPercentage(tau_discrepancy))
        return percentage("Tau discrepancy value");
    if (!isPercentage(epsilon))
        return percentage("Epsilon value");
    if (init_sample_count < 0)
        return negative("Initialization sample count");
    if (thread_count < 0)
        return negative("Thread count");
    if (lucb_batch_size < 1) {
        ANCHOR_RETURN_ERROR(ErrorCode::kInvalidConfig, "LUCB batch size must be positive");
    }
    if (max_validation_rounds < 1) {
        ANCHOR_RETURN_ERROR(ErrorCode::kInvalidConfig, "Max validation rounds must be positive");
    }
    return {};
}

// =============================================================================
// JSON
// =============================================================================

std::string AnchorConfig::toJson() const {
    nlohmann::json j;

    j["max_anchor_size"] = max_anchor_size;
    j["beam_width"] = beam_width;
    j["delta"] = delta;
    j["tau"] = tau;
    j["tau_discrepancy"] = tau_discrepancy;
    j["epsilon"] = epsilon;
    j["init_sample_count"] = init_sample_count;
    j["thread_count"] = thread_count;
    j["lucb_batch_size"] = lucb_batch_size;
    j["balance_sampling"] = balance_sampling;
    j["lazy_coverage"] = lazy_coverage;
    j["max_validation_rounds"] = max_validation_rounds;

    return j.dump(2);
}

Result<AnchorConfig> AnchorConfig::fromJson(const std::string& data) {
    AnchorConfig config;
    try {
        auto j = nlohmann::json::parse(data);
        if (!j.is_object()) {
            ANCHOR_RETURN_ERROR(ErrorCode::kParseError, "Configuration must be a JSON object");
        }

        readKey(j, "max_anchor_size", config.max_anchor_size);
        readKey(j, "beam_width", config.beam_width);
        readKey(j, "delta", config.delta);
        readKey(j, "tau", config.tau);
        readKey(j, "tau_discrepancy", config.tau_discrepancy);
        readKey(j, "epsilon", config.epsilon);
        readKey(j, "init_sample_count", config.init_sample_count);
        readKey(j, "thread_count", config.thread_count);
        readKey(j, "lucb_batch_size", config.lucb_batch_size);
        readKey(j, "balance_sampling", config.balance_sampling);
        readKey(j, "lazy_coverage", config.lazy_coverage);
        readKey(j, "max_validation_rounds", config.max_validation_rounds);
    } catch (const std::exception& e) {
        ANCHOR_RETURN_ERROR(ErrorCode::kParseError,
                            fmt::format("Failed to parse configuration: {}", e.what()));
    }
    return config;
}

Result<AnchorConfig> loadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::warn("Failed to open configuration file: {}", path);
        ANCHOR_RETURN_ERROR(ErrorCode::kIoError, "Cannot open " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = AnchorConfig::fromJson(buffer.str());
    if (!config) {
        spdlog::warn("Invalid configuration file {}: {}", path, config.error().toString());
    }
    return config;
}

Result<void> saveConfig(const AnchorConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        spdlog::warn("Failed to open file for export: {}", path);
        ANCHOR_RETURN_ERROR(ErrorCode::kIoError, "Cannot write " + path);
    }

    file << config.toJson();
    if (!file.good()) {
        ANCHOR_RETURN_ERROR(ErrorCode::kIoError, "Failed writing " + path);
    }
    return {};
}

}  // namespace anchor
