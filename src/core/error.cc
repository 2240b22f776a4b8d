// =============================================================================
// Anchor Explain - Error Handling Implementation
// =============================================================================

#include "anchor_explain/error.h"

#include "anchor_explain/common.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>

namespace anchor {

// =============================================================================
// Assert Failure
// =============================================================================

[[noreturn]] void assertFailed(const char* cond, const char* file, int line) {
    spdlog::critical("Assertion failed: {} at {}:{}", cond, file, line);
    std::fflush(stderr);
    std::abort();
}

// =============================================================================
// Error Code to String
// =============================================================================

std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::kOk:
        return "OK";

    // Configuration errors
    case ErrorCode::kInvalidConfig:
        return "InvalidConfig";
    case ErrorCode::kMissingCollaborator:
        return "MissingCollaborator";
    case ErrorCode::kOutOfRange:
        return "OutOfRange";

    // Sampling errors
    case ErrorCode::kSamplingFailed:
        return "SamplingFailed";
    case ErrorCode::kSessionConflict:
        return "SessionConflict";
    case ErrorCode::kPoolShutdown:
        return "PoolShutdown";

    // Search outcomes
    case ErrorCode::kNoAnchorFound:
        return "NoAnchorFound";
    case ErrorCode::kNoCandidateFound:
        return "NoCandidateFound";
    case ErrorCode::kIdentificationFailed:
        return "IdentificationFailed";

    // I/O and serialization errors
    case ErrorCode::kIoError:
        return "IoError";
    case ErrorCode::kParseError:
        return "ParseError";

    default:
        return "UnknownError";
    }
}

// =============================================================================
// Error::toString
// =============================================================================

std::string Error::toString() const {
    if (isOk()) {
        return "OK";
    }

    auto code_str = errorCodeToString(code_);
    if (message_.empty()) {
        return std::string(code_str);
    }

    return fmt::format("{}: {}", code_str, message_);
}

}  // namespace anchor
