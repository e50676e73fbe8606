#pragma once

#include "core/error.hpp"

#include <string_view>

namespace ledgerstore {

/**
 * @brief Classes of failure recognised in store error text
 *
 * The store reports constraint violations and session loss only as
 * message text. All pattern matching against that text lives in
 * classify_store_error(); callers switch on the enum.
 */
enum class StoreErrorKind {
    NONE,
    SESSION_LOST,        // session not found / expired / revoked, server closed it
    CONNECTION_FAILURE,  // refused, unreachable, reset
    TIMEOUT,             // deadline exceeded or statement cancelled
    UNIQUE_VIOLATION,    // duplicate key / unique constraint
    VERSION_CONFLICT,    // optimistic-lock mismatch reported by the store
    TABLE_NOT_FOUND,     // relation does not exist
    OTHER
};

[[nodiscard]] StoreErrorKind classify_store_error(std::string_view message);

[[nodiscard]] inline bool is_session_error(std::string_view message) {
    return classify_store_error(message) == StoreErrorKind::SESSION_LOST;
}

/// Map a store failure class onto the public error taxonomy
[[nodiscard]] ErrorCode to_error_code(StoreErrorKind kind);

[[nodiscard]] std::string_view store_error_kind_to_string(StoreErrorKind kind);

} // namespace ledgerstore
