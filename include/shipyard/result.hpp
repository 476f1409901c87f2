#pragma once

#include <optional>
#include <string>
#include <utility>

namespace shipyard {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode {
    // Input / validation
    INVALID_INPUT,
    UNSUPPORTED_API_VERSION,
    // Registry
    REGISTRY_ERROR,
    NOT_FOUND,
    CONFLICT,
    RATE_LIMITED,
    TRANSFER_FAILED,
    // Integrity
    INTEGRITY_CONFLICT,
    AMBIGUOUS_MATCH,
    // Partial failure
    SIGNATURE_FAILED,
    // Timeout
    TIMEOUT,
    // Local
    IO_ERROR,
    ARCHIVE_INVALID,
};

const char* error_code_name(ErrorCode code);

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    /// Prefix the message with where the failure happened
    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    std::string describe() const {
        return std::string(error_code_name(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

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

} // namespace shipyard
