#pragma once

// =============================================================================
// Anchor Explain - Common Definitions
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

// Version information
#define ANCHOR_VERSION_MAJOR 0
#define ANCHOR_VERSION_MINOR 3
#define ANCHOR_VERSION_PATCH 0

namespace anchor {

// =============================================================================
// Compiler Attributes
// =============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define ANCHOR_LIKELY(x) __builtin_expect(!!(x), 1)
    #define ANCHOR_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define ANCHOR_LIKELY(x) (x)
    #define ANCHOR_UNLIKELY(x) (x)
#endif

// =============================================================================
// Identifiers
// =============================================================================

// Feature index inside an explained instance
using FeatureIndex = uint32_t;

// Identifier of a candidate inside its CandidatePool (0 = none)
using CandidateId = uint64_t;
constexpr CandidateId kNoCandidate = 0;

// =============================================================================
// Debug Macros
// =============================================================================

#ifdef NDEBUG
    #define ANCHOR_DEBUG_ONLY(x) ((void)0)
    #define ANCHOR_ASSERT(cond) ((void)0)
#else
    #define ANCHOR_DEBUG_ONLY(x) x
    #define ANCHOR_ASSERT(cond)                                  \
        do {                                                     \
            if (ANCHOR_UNLIKELY(!(cond))) {                      \
                anchor::assertFailed(#cond, __FILE__, __LINE__); \
            }                                                    \
        } while (0)
#endif

// Assert failure handler (implemented in error.cc)
[[noreturn]] void assertFailed(const char* cond, const char* file, int line);

// =============================================================================
// Utility Types
// =============================================================================

// Non-copyable base class
class NonCopyable {
  protected:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
};

// Non-movable base class
class NonMovable : public NonCopyable {
  protected:
    NonMovable() = default;
    ~NonMovable() = default;

    NonMovable(NonMovable&&) = delete;
    NonMovable& operator=(NonMovable&&) = delete;
};

}  // namespace anchor
