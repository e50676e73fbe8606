#include "db/postgresql/pg_connection.hpp"
#include "config/config_types.hpp"
#include "core/utils.hpp"
#include <poll.h>
#include <algorithm>
#include <format>
#include <thread>
#include <vector>

namespace ledgerstore {

namespace {

constexpr std::chrono::milliseconds kPollSlice{100};
constexpr std::chrono::milliseconds kCancelGrace{1000};

/// Poll the libpq socket for one event class, bounded by a slice of ctx
bool poll_socket(int sock, short events, const Context& ctx) {
    pollfd pfd{};
    pfd.fd = sock;
    pfd.events = events;
    const auto wait = std::min(ctx.remaining(kPollSlice), kPollSlice);
    return ::poll(&pfd, 1, static_cast<int>(wait.count())) > 0;
}

std::string quote_conninfo_value(const std::string& value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const SqlStatement& stmt, const Context& ctx) {
    if (!conn_) {
        return DbResultSet::failure("no connection to the server");
    }
    if (const auto err = ctx.err(); err.is_error()) {
        return DbResultSet::failure(err.error_message());
    }

    int sent = 0;
    if (stmt.params.empty()) {
        sent = PQsendQuery(conn_, stmt.sql.c_str());
    } else {
        std::vector<const char*> values;
        values.reserve(stmt.params.size());
        for (const auto& p : stmt.params) {
            values.push_back(p ? p->c_str() : nullptr);
        }
        sent = PQsendQueryParams(conn_, stmt.sql.c_str(),
            static_cast<int>(values.size()), nullptr, values.data(),
            nullptr, nullptr, 0);
    }
    if (!sent) {
        return DbResultSet::failure(PQerrorMessage(conn_));
    }

    DbResultSet result;
    bool have_result = false;
    std::string error;

    // Collect every result of the statement; the first decides the outcome
    while (true) {
        if (auto wait_error = wait_for_result(ctx); !wait_error.empty()) {
            return DbResultSet::failure(std::move(wait_error));
        }
        PGresult* res = PQgetResult(conn_);
        if (!res) break;

        if (!have_result && error.empty()) {
            const ExecStatusType status = PQresultStatus(res);
            if (status == PGRES_TUPLES_OK) {
                result = process_tuples_result(res);
                have_result = true;
            } else if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
                // Affected-row counts from the store are not reliable; writes
                // are confirmed by reading them back
                result.success = true;
                have_result = true;
            } else {
                const char* msg = PQresultErrorMessage(res);
                error = (msg && *msg) ? msg : PQerrorMessage(conn_);
            }
        }
        PQclear(res);
    }

    if (!error.empty()) {
        return DbResultSet::failure(utils::trim(error));
    }
    if (!have_result) {
        return DbResultSet::failure(utils::trim(PQerrorMessage(conn_)));
    }
    return result;
}

DbResultSet PgConnection::ping(const Context& ctx) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return DbResultSet::failure("no connection to the server");
    }
    return execute(SqlStatement{"SELECT 1"}, ctx);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

std::string PgConnection::wait_for_result(const Context& ctx) {
    const int sock = PQsocket(conn_);
    if (sock < 0) {
        return "no connection to the server";
    }

    while (true) {
        if (!PQconsumeInput(conn_)) {
            return utils::trim(PQerrorMessage(conn_));
        }
        if (!PQisBusy(conn_)) {
            return "";
        }
        if (ctx.done()) {
            cancel_in_flight();
            return ctx.err().error_message();
        }
        poll_socket(sock, POLLIN, ctx);
    }
}

void PgConnection::cancel_in_flight() {
    // PQcancel opens its own blocking socket to the server; keep it off the
    // caller's clock. The PGcancel copy does not reference conn_.
    if (PGcancel* cancel = PQgetCancel(conn_)) {
        std::thread([cancel] {
            char errbuf[256];
            if (!PQcancel(cancel, errbuf, sizeof(errbuf))) {
                utils::log::warn(std::format("Failed to cancel statement: {}", errbuf));
            }
            PQfreeCancel(cancel);
        }).detach();
    }

    // Discard what the server still sends, but only for the grace period
    const auto grace = Context::background().with_timeout(kCancelGrace);
    const int sock = PQsocket(conn_);
    while (sock >= 0 && !grace.done()) {
        if (!PQconsumeInput(conn_)) {
            break;
        }
        if (PQisBusy(conn_)) {
            poll_socket(sock, POLLIN, grace);
            continue;
        }
        PGresult* res = PQgetResult(conn_);
        if (!res) {
            return;
        }
        PQclear(res);
    }

    utils::log::warn("Store did not finish the cancelled statement in time, closing session");
    close();
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::string> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back();
            } else {
                const char* val = PQgetvalue(res, i, j);
                row.emplace_back(val ? val : "");
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(
    const std::string& connection_string, const Context& ctx) {
    using R = Result<std::unique_ptr<IDbConnection>>;

    if (const auto err = ctx.err(); err.is_error()) {
        return R::error(err);
    }

    PGconn* conn = PQconnectStart(connection_string.c_str());
    if (!conn) {
        return R::error(ErrorCode::UNAVAILABLE, "failed to allocate PGconn");
    }

    auto fail = [conn](std::string message) {
        PQfinish(conn);
        return R::error(ErrorCode::UNAVAILABLE, std::move(message));
    };

    if (PQstatus(conn) == CONNECTION_BAD) {
        return fail(std::format("could not connect: {}", utils::trim(PQerrorMessage(conn))));
    }

    // Non-blocking handshake so the context bounds the whole connect
    PostgresPollingStatusType poll_status = PGRES_POLLING_WRITING;
    while (poll_status != PGRES_POLLING_OK) {
        if (poll_status == PGRES_POLLING_FAILED) {
            return fail(std::format("could not connect: {}", utils::trim(PQerrorMessage(conn))));
        }
        if (ctx.done()) {
            return fail(ctx.err().error_message());
        }
        const int sock = PQsocket(conn);
        if (sock < 0) {
            return fail("could not connect: socket unavailable");
        }
        const short events = poll_status == PGRES_POLLING_READING ? POLLIN : POLLOUT;
        if (!poll_socket(sock, events, ctx)) {
            continue;
        }
        poll_status = PQconnectPoll(conn);
    }

    utils::log::debug(std::format("Opened store session to {}:{}/{}",
        PQhost(conn) ? PQhost(conn) : "", PQport(conn) ? PQport(conn) : "",
        PQdb(conn) ? PQdb(conn) : ""));

    return R::ok(std::make_unique<PgConnection>(conn));
}

std::string PgConnectionFactory::build_conninfo(const StoreConfig& config) {
    const auto connect_seconds = std::max<int64_t>(2,
        std::chrono::duration_cast<std::chrono::seconds>(config.connect_timeout).count());

    return std::format(
        "host={} port={} dbname={} user={} password={} sslmode={} connect_timeout={}",
        quote_conninfo_value(config.host),
        config.port,
        quote_conninfo_value(config.database),
        quote_conninfo_value(config.username),
        quote_conninfo_value(config.password),
        quote_conninfo_value(config.sslmode),
        connect_seconds);
}

} // namespace ledgerstore
