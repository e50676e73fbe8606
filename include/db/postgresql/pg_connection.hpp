#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace ledgerstore {

struct StoreConfig;

/**
 * @brief Store session over the PostgreSQL wire protocol (libpq)
 *
 * Wraps PGconn* and provides the IDbConnection interface.
 * All libpq calls are encapsulated here. Statements are sent
 * asynchronously and the socket is polled so a finished Context
 * cancels the in-flight query.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const SqlStatement& stmt, const Context& ctx) override;
    DbResultSet ping(const Context& ctx) override;
    bool is_connected() const override;
    void close() override;

private:
    /**
     * @brief Wait until the pending result is readable or ctx finishes
     * @return Empty string on success, error text otherwise
     */
    std::string wait_for_result(const Context& ctx);

    /**
     * @brief Cancel the running statement and drain its results
     *
     * The drain is bounded; a server that stays silent past the grace
     * period costs the session, which is closed so the pool discards it.
     */
    void cancel_in_flight();

    /**
     * @brief Process a SELECT result (PGRES_TUPLES_OK)
     */
    static DbResultSet process_tuples_result(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief Opens PgConnection instances using PQconnectdb
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    Result<std::unique_ptr<IDbConnection>> create(
        const std::string& connection_string, const Context& ctx) override;

    /**
     * @brief Build a libpq conninfo string from store settings
     * Values are single-quoted with backslash escaping.
     */
    static std::string build_conninfo(const StoreConfig& config);
};

} // namespace ledgerstore
