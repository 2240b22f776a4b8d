#pragma once

// =============================================================================
// Anchor Explain - Error Handling (Exception-Free)
// =============================================================================
//
// LLVM-style error handling using Result<T> types instead of exceptions.
// Every operation that can fail (construction, sampling, searching,
// serialization) returns Result<T>.
//

#include "anchor_explain/common.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace anchor {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : uint32_t {
    // Success (not an error)
    kOk = 0,

    // Configuration errors (1xx)
    kInvalidConfig = 100,
    kMissingCollaborator = 101,
    kOutOfRange = 102,

    // Sampling errors (2xx)
    kSamplingFailed = 200,
    kSessionConflict = 201,
    kPoolShutdown = 202,

    // Search outcomes (3xx)
    kNoAnchorFound = 300,
    kNoCandidateFound = 301,
    kIdentificationFailed = 302,

    // I/O and serialization errors (4xx)
    kIoError = 400,
    kParseError = 401,
};

// Convert error code to string
std::string_view errorCodeToString(ErrorCode code);

// =============================================================================
// Error Class
// =============================================================================

class Error {
  public:
    Error() : code_(ErrorCode::kOk) {}
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    [[nodiscard]] bool isError() const { return code_ != ErrorCode::kOk; }
    [[nodiscard]] bool isOk() const { return code_ == ErrorCode::kOk; }

    // Accessors
    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] std::string_view message() const { return message_; }

    // Get full error description
    [[nodiscard]] std::string toString() const;

    static Error ok() { return Error(); }
    static Error make(ErrorCode code, std::string message) {
        return Error(code, std::move(message));
    }

  private:
    ErrorCode code_;
    std::string message_;
};

// =============================================================================
// Result<T> - Error-or-Value Type
// =============================================================================

template <typename T>
class Result {
  public:
    Result(T value) : data_(std::move(value)) {}      // NOLINT: intentional implicit
    Result(Error error) : data_(std::move(error)) {}  // NOLINT: intentional implicit

    [[nodiscard]] bool hasValue() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return hasValue(); }

    // Only valid on a failed Result
    [[nodiscard]] const Error& error() const { return std::get<Error>(data_); }

    // Value access; asserts hasValue()
    T* operator->() {
        ANCHOR_ASSERT(hasValue() && "Dereferencing error Result via operator->");
        return &std::get<T>(data_);
    }
    const T* operator->() const {
        ANCHOR_ASSERT(hasValue() && "Dereferencing error Result via operator->");
        return &std::get<T>(data_);
    }
    T& operator*() & {
        ANCHOR_ASSERT(hasValue() && "Dereferencing error Result via operator*");
        return std::get<T>(data_);
    }
    const T& operator*() const& {
        ANCHOR_ASSERT(hasValue() && "Dereferencing error Result via operator*");
        return std::get<T>(data_);
    }
    T&& operator*() && {
        ANCHOR_ASSERT(hasValue() && "Dereferencing error Result via operator*");
        return std::get<T>(std::move(data_));
    }

  private:
    std::variant<T, Error> data_;
};

// Success carries no value; a default constructed Result<void> is ok
template <>
class Result<void> {
  public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}  // NOLINT: intentional implicit

    [[nodiscard]] bool hasValue() const { return error_.isOk(); }
    explicit operator bool() const { return hasValue(); }

    [[nodiscard]] const Error& error() const { return error_; }

  private:
    Error error_;
};

// =============================================================================
// Error Propagation Macros
// =============================================================================

// Return early if result is an error
#define ANCHOR_TRY(expr)            \
    do {                            \
        auto&& _result = (expr);    \
        if (!_result) {             \
            return _result.error(); \
        }                           \
    } while (0)

// Assign value or return error
#define ANCHOR_ASSIGN_OR_RETURN(var, expr) \
    auto&& _result_##var = (expr);         \
    if (!_result_##var) {                  \
        return _result_##var.error();      \
    }                                      \
    var = std::move(*_result_##var)

// Return error with message
#define ANCHOR_RETURN_ERROR(code, msg) return ::anchor::Error::make(code, msg)

// Return success
#define ANCHOR_RETURN_OK() return ::anchor::Error::ok()

}  // namespace anchor
