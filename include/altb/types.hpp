#pragma once

/**
 * @file types.hpp
 * @brief Error handling types shared by every altb module
 *
 * Every fallible altb operation returns Result<T>. Check isOk() before
 * accessing value(), or isErr() before error().
 *
 * @example
 * ```cpp
 * auto entry = altb::make_path_entry("/usr/bin/python3.8");
 * if (entry.isErr()) {
 *     std::cerr << entry.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace altb {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Registry document
    CORRUPT_REGISTRY,

    // Entry construction and resolution
    SOURCE_NOT_FOUND,
    TARGET_MISSING,
    EMPTY_COMMAND,

    // Tags and names
    AMBIGUOUS_TAG,
    MISSING_TAG,
    NO_ACTIVE_TAG,
    UNKNOWN_TAG,
    UNKNOWN_APPLICATION,
    INVALID_NAME,

    // Launch entry
    INSTALL_FAILED,
    NOT_RUNNABLE,

    // System / IO
    IO_ERROR,
};

/// Stable snake_case name of an error code (used in JSON output)
const char* error_code_to_string(ErrorCode code);

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
    std::string toString() const { return message_; }

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

} // namespace altb
