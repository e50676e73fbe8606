#include "db/store_error.hpp"
#include "core/utils.hpp"

#include <array>
#include <string>

namespace ledgerstore {

namespace {

template<size_t N>
bool matches_any(const std::string& lower, const std::array<std::string_view, N>& patterns) {
    for (const auto p : patterns) {
        if (lower.find(p) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

StoreErrorKind classify_store_error(std::string_view message) {
    if (message.empty()) return StoreErrorKind::NONE;

    const std::string lower = utils::to_lower(std::string(message));

    // Session-level loss: checked first, "permission denied" after expiry
    // is a session symptom rather than an authorization decision
    static constexpr std::array<std::string_view, 8> session_patterns = {
        "session not found", "session expired", "invalid session",
        "permissiondenied", "permission denied",
        "server closed the connection", "terminating connection",
        "no connection to the server"
    };
    if (matches_any(lower, session_patterns)) return StoreErrorKind::SESSION_LOST;

    static constexpr std::array<std::string_view, 4> timeout_patterns = {
        "context deadline exceeded", "context canceled",
        "canceling statement", "statement timeout"
    };
    if (matches_any(lower, timeout_patterns)) return StoreErrorKind::TIMEOUT;

    static constexpr std::array<std::string_view, 9> connection_patterns = {
        "connection refused", "could not connect", "could not translate host",
        "no route", "connection reset", "broken pipe",
        "could not send", "could not receive", "timeout expired"
    };
    if (matches_any(lower, connection_patterns)) return StoreErrorKind::CONNECTION_FAILURE;

    static constexpr std::array<std::string_view, 3> unique_patterns = {
        "unique", "duplicate", "key already exists"
    };
    if (matches_any(lower, unique_patterns)) return StoreErrorKind::UNIQUE_VIOLATION;

    static constexpr std::array<std::string_view, 2> version_patterns = {
        "version mismatch", "version conflict"
    };
    if (matches_any(lower, version_patterns)) return StoreErrorKind::VERSION_CONFLICT;

    static constexpr std::array<std::string_view, 2> missing_patterns = {
        "does not exist", "no such table"
    };
    if (matches_any(lower, missing_patterns)) return StoreErrorKind::TABLE_NOT_FOUND;

    return StoreErrorKind::OTHER;
}

ErrorCode to_error_code(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::NONE:               return ErrorCode::NONE;
        case StoreErrorKind::SESSION_LOST:
        case StoreErrorKind::CONNECTION_FAILURE:
        case StoreErrorKind::TIMEOUT:            return ErrorCode::UNAVAILABLE;
        case StoreErrorKind::UNIQUE_VIOLATION:   return ErrorCode::ALREADY_EXISTS;
        case StoreErrorKind::VERSION_CONFLICT:   return ErrorCode::ABORTED;
        case StoreErrorKind::TABLE_NOT_FOUND:
        case StoreErrorKind::OTHER:              return ErrorCode::INTERNAL;
    }
    return ErrorCode::INTERNAL;
}

std::string_view store_error_kind_to_string(StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::NONE:               return "NONE";
        case StoreErrorKind::SESSION_LOST:       return "SESSION_LOST";
        case StoreErrorKind::CONNECTION_FAILURE: return "CONNECTION_FAILURE";
        case StoreErrorKind::TIMEOUT:            return "TIMEOUT";
        case StoreErrorKind::UNIQUE_VIOLATION:   return "UNIQUE_VIOLATION";
        case StoreErrorKind::VERSION_CONFLICT:   return "VERSION_CONFLICT";
        case StoreErrorKind::TABLE_NOT_FOUND:    return "TABLE_NOT_FOUND";
        case StoreErrorKind::OTHER:              return "OTHER";
    }
    return "OTHER";
}

} // namespace ledgerstore
