#pragma once

#include "core/context.hpp"
#include "db/sql_statement.hpp"
#include <string>
#include <vector>

namespace ledgerstore {

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 * NULL values are returned as empty strings.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // For SELECT
    std::vector<std::string> column_names;
    std::vector<std::vector<std::string>> rows;

    // SELECT vs DML/DDL
    bool has_rows = false;

    static DbResultSet failure(std::string message) {
        DbResultSet rs;
        rs.success = false;
        rs.error_message = std::move(message);
        return rs;
    }
};

/**
 * @brief One authenticated session to the store
 *
 * Wraps a single native connection handle. The logical database is
 * selected when the connection is opened.
 * Implementations are not thread-safe; thread safety comes from the pool.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute one statement
     * @param stmt SQL text with positional parameters
     * @param ctx Deadline/cancellation; an in-flight statement is cancelled
     *            when the context finishes
     */
    [[nodiscard]] virtual DbResultSet execute(const SqlStatement& stmt, const Context& ctx) = 0;

    /**
     * @brief Lightweight liveness round trip
     */
    [[nodiscard]] virtual DbResultSet ping(const Context& ctx) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace ledgerstore
