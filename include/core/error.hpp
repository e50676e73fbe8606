#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ledgerstore {

/**
 * @brief Error taxonomy shared by the connection, repository and migration layers
 *
 * INVALID_ARGUMENT: caller error, never retried
 * NOT_FOUND:        zero rows for a single-row lookup
 * ALREADY_EXISTS:   uniqueness violation detected on create
 * ABORTED:          optimistic-lock conflict, safe to retry with a fresh read
 * UNAVAILABLE:      store unreachable or no session
 * INTERNAL:         unexpected store failure
 */
enum class ErrorCode {
    NONE,
    INVALID_ARGUMENT,
    NOT_FOUND,
    ALREADY_EXISTS,
    ABORTED,
    UNAVAILABLE,
    INTERNAL
};

[[nodiscard]] constexpr std::string_view error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:             return "OK";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::NOT_FOUND:        return "NOT_FOUND";
        case ErrorCode::ALREADY_EXISTS:   return "ALREADY_EXISTS";
        case ErrorCode::ABORTED:          return "ABORTED";
        case ErrorCode::UNAVAILABLE:      return "UNAVAILABLE";
        case ErrorCode::INTERNAL:         return "INTERNAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    // Re-wrap another result's error
    template<typename U>
    static Result error(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

/**
 * @brief Result for operations without a value
 */
template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    template<typename U>
    static Result error(const Result<U>& other) {
        return error(other.error_code(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

using VoidResult = Result<void>;

} // namespace ledgerstore
