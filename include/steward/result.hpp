#pragma once

/**
 * @file result.hpp
 * @brief Error and result types shared by every steward component
 *
 * Adapters and platform helpers return Result<T>; manager-level operations
 * (add/remove/enable/disable/start/stop) return OperationResult so the CLI
 * can print a human message for expected failures without exceptions.
 */

#include <optional>
#include <string>
#include <utility>

namespace steward {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for steward operations
 */
enum class ErrorCode {
    // Expected conditions, reported to the caller
    VALIDATION_ERROR,
    DUPLICATE,
    NOT_FOUND,

    // A shelled-out check failed or timed out
    EXTERNAL_TOOL_ERROR,

    // Spawn or signal failure
    PROCESS_ERROR,

    // Infrastructure
    IO_ERROR,
    PARSE_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALIDATION_ERROR: return "validation_error";
        case ErrorCode::DUPLICATE: return "duplicate";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::EXTERNAL_TOOL_ERROR: return "external_tool_error";
        case ErrorCode::PROCESS_ERROR: return "process_error";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::PARSE_ERROR: return "parse_error";
    }
    return "unknown";
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

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
 *
 * Check isOk() before accessing value(), or isErr() before error().
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

// ============================================================================
// Operation Result
// ============================================================================

/**
 * @brief Outcome of a Registrar or Supervisor operation
 *
 * `message` is always printable. When the operation succeeded with a
 * caveat, `warning` holds it and the message carries it as a
 * " [WARNING: ...]" suffix.
 */
struct OperationResult {
    bool ok = false;
    ErrorCode code = ErrorCode::IO_ERROR;  // meaningful only when !ok
    std::string message;
    std::string warning;
    std::string archived_path;

    static OperationResult success(std::string msg) {
        OperationResult r;
        r.ok = true;
        r.message = std::move(msg);
        return r;
    }

    static OperationResult failure(ErrorCode code, std::string msg) {
        OperationResult r;
        r.code = code;
        r.message = std::move(msg);
        return r;
    }

    static OperationResult failure(const Error& error) {
        return failure(error.code(), error.message());
    }

    OperationResult& with_warning(const std::string& text) {
        warning = text;
        message += " [WARNING: " + text + "]";
        return *this;
    }
};

} // namespace steward
