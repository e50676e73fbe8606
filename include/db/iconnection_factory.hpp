#pragma once

#include "core/context.hpp"
#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace ledgerstore {

/**
 * @brief Abstract factory for opening store sessions
 *
 * The production factory wraps PQconnectdb against the store's
 * PostgreSQL wire endpoint; tests substitute an in-memory store.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open and authenticate a new session
     * @param connection_string Backend-specific connection string
     * @param ctx Bounds the connect
     * @return New connection, or UNAVAILABLE with the store's error text
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const std::string& connection_string, const Context& ctx) = 0;
};

} // namespace ledgerstore
