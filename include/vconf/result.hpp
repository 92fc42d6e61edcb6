#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by every vconf module
 *
 * Fallible operations return Result<T>. Check isOk() before accessing
 * value(), or isErr() before error().
 *
 * @example
 * ```cpp
 * auto package = graph.register_package("app", bytes);
 * if (package.isErr()) {
 *     spdlog::error("{}", package.error().message());
 *     return 1;
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace vconf {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // System / IO
    FILE_NOT_FOUND,
    IO_ERROR,
    CONFIG_INVALID,

    // Component binaries
    MALFORMED_BINARY,
    NOT_A_COMPONENT,

    // Composition graph (fatal to composition)
    DUPLICATE_PACKAGE,
    INVALID_HANDLE,
    TYPE_MISMATCH,
    ALREADY_WIRED,
    WOULD_CREATE_CYCLE,
    DUPLICATE_EXPORT,
    MISSING_PROVIDER_EXPORT,
    ENCODE_FAILED,

    // HTTP bridge (local to the call site)
    RESOURCE_NOT_FOUND,
    HEADER_ERROR,
    INVALID_PATH_WITH_QUERY,
    INVALID_STATUS,
    BODY_ALREADY_CONSUMED,
    STREAM_ALREADY_TAKEN,

    // Response channel (fatal to the invocation)
    PRODUCER_DROPPED,
    RESPONSE_ERROR,
    RESPONSE_ALREADY_TAKEN,
    RESPONSE_ALREADY_SENT,

    // Execution
    HOST_UNAVAILABLE,
    HOST_FAILED,
    SCENARIO_INVALID,
    ASSERTION_FAILED,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::CONFIG_INVALID: return "CONFIG_INVALID";
        case ErrorCode::MALFORMED_BINARY: return "MALFORMED_BINARY";
        case ErrorCode::NOT_A_COMPONENT: return "NOT_A_COMPONENT";
        case ErrorCode::DUPLICATE_PACKAGE: return "DUPLICATE_PACKAGE";
        case ErrorCode::INVALID_HANDLE: return "INVALID_HANDLE";
        case ErrorCode::TYPE_MISMATCH: return "TYPE_MISMATCH";
        case ErrorCode::ALREADY_WIRED: return "ALREADY_WIRED";
        case ErrorCode::WOULD_CREATE_CYCLE: return "WOULD_CREATE_CYCLE";
        case ErrorCode::DUPLICATE_EXPORT: return "DUPLICATE_EXPORT";
        case ErrorCode::MISSING_PROVIDER_EXPORT: return "MISSING_PROVIDER_EXPORT";
        case ErrorCode::ENCODE_FAILED: return "ENCODE_FAILED";
        case ErrorCode::RESOURCE_NOT_FOUND: return "RESOURCE_NOT_FOUND";
        case ErrorCode::HEADER_ERROR: return "HEADER_ERROR";
        case ErrorCode::INVALID_PATH_WITH_QUERY: return "INVALID_PATH_WITH_QUERY";
        case ErrorCode::INVALID_STATUS: return "INVALID_STATUS";
        case ErrorCode::BODY_ALREADY_CONSUMED: return "BODY_ALREADY_CONSUMED";
        case ErrorCode::STREAM_ALREADY_TAKEN: return "STREAM_ALREADY_TAKEN";
        case ErrorCode::PRODUCER_DROPPED: return "PRODUCER_DROPPED";
        case ErrorCode::RESPONSE_ERROR: return "RESPONSE_ERROR";
        case ErrorCode::RESPONSE_ALREADY_TAKEN: return "RESPONSE_ALREADY_TAKEN";
        case ErrorCode::RESPONSE_ALREADY_SENT: return "RESPONSE_ALREADY_SENT";
        case ErrorCode::HOST_UNAVAILABLE: return "HOST_UNAVAILABLE";
        case ErrorCode::HOST_FAILED: return "HOST_FAILED";
        case ErrorCode::SCENARIO_INVALID: return "SCENARIO_INVALID";
        case ErrorCode::ASSERTION_FAILED: return "ASSERTION_FAILED";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace vconf
