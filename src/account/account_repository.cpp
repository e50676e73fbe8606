#include "account/account_repository.hpp"
#include "db/sql_statement.hpp"
#include "db/store_error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <unordered_set>

namespace ledgerstore {

namespace {

constexpr const char* kColumns =
    "id, name, external_id, external_group_id, currency_code, account_type, "
    "created_at, updated_at, version";

constexpr size_t kColumnCount = 9;

constexpr std::array<std::string_view, 6> kImmutableFields = {
    "id", "external_id", "currency_code", "created_at", "version", "updated_at"
};

bool is_immutable_field(std::string_view field) {
    return std::find(kImmutableFields.begin(), kImmutableFields.end(), field) != kImmutableFields.end();
}

Result<Account> parse_row(const std::vector<std::string>& row) {
    using R = Result<Account>;
    if (row.size() < kColumnCount) {
        return R::error(ErrorCode::INTERNAL,
            std::format("account row has {} columns, expected {}", row.size(), kColumnCount));
    }

    Account a;
    a.id = row[0];
    a.name = row[1];
    a.external_id = row[2];
    if (!row[3].empty()) a.external_group_id = row[3];
    a.currency_code = row[4];

    const auto type = parse_account_type(row[5]);
    if (!type) {
        return R::error(ErrorCode::INTERNAL,
            std::format("account {} has unknown account_type '{}'", a.id, row[5]));
    }
    a.account_type = *type;

    const auto created = utils::parse_store_timestamp(row[6]);
    const auto updated = utils::parse_store_timestamp(row[7]);
    const auto version = utils::try_parse_int<int64_t>(row[8]);
    if (!created || !updated || !version) {
        return R::error(ErrorCode::INTERNAL,
            std::format("account {} has malformed bookkeeping columns", a.id));
    }
    a.created_at = *created;
    a.updated_at = *updated;
    a.version = *version;
    return R::ok(std::move(a));
}

} // anonymous namespace

AccountRepository::AccountRepository(SessionProvider session, std::string table,
                                     WriteVerifiedHook on_verified)
    : session_(std::move(session)),
      table_(safe_identifier(table)),
      on_verified_(std::move(on_verified)) {}

Result<std::unique_ptr<PooledConnection>> AccountRepository::lease(const Context& ctx) const {
    using R = Result<std::unique_ptr<PooledConnection>>;
    if (table_.empty()) {
        return R::error(ErrorCode::INTERNAL, "account table name is not a valid identifier");
    }
    auto pool = session_ ? session_() : nullptr;
    if (!pool) {
        return R::error(ErrorCode::UNAVAILABLE, "storage unavailable: not connected");
    }
    return pool->acquire(ctx);
}

VoidResult AccountRepository::store_failure(PooledConnection& conn, const DbResultSet& rs,
                                            std::string_view action) const {
    const auto kind = classify_store_error(rs.error_message);
    if (kind == StoreErrorKind::SESSION_LOST) {
        conn.invalidate();
    }
    return VoidResult::error(to_error_code(kind),
        std::format("failed to {}: {}", action, rs.error_message));
}

Result<Account> AccountRepository::fetch_one(PooledConnection& conn, std::string_view column,
                                             const std::string& key, const Context& ctx) const {
    SqlStatement stmt;
    const auto p_key = stmt.bind(SqlValue{key});
    stmt.sql = std::format("SELECT {} FROM {} WHERE {} = {}", kColumns, table_, column, p_key);

    const auto rs = conn->execute(stmt, ctx);
    if (!rs.success) {
        return Result<Account>::error(store_failure(conn, rs, "query account"));
    }
    if (rs.rows.empty()) {
        if (column == "id") {
            return Result<Account>::error(ErrorCode::NOT_FOUND, std::format("account {} not found", key));
        }
        return Result<Account>::error(ErrorCode::NOT_FOUND,
            std::format("account with {} {} not found", column, key));
    }
    return parse_row(rs.rows.front());
}

// ============================================================================
// create
// ============================================================================

Result<Account> AccountRepository::create(const Context& ctx, Account account) {
    using R = Result<Account>;

    if (auto valid = validator_.validate_new_account(account); valid.is_error()) {
        return R::error(valid);
    }

    auto conn_result = lease(ctx);
    if (conn_result.is_error()) {
        return R::error(conn_result);
    }
    auto& conn = *conn_result.value();

    // No unique constraints beyond the primary key: check first
    auto existing = fetch_one(conn, "external_id", account.external_id, ctx);
    if (existing.is_ok()) {
        return R::error(ErrorCode::ALREADY_EXISTS,
            std::format("account with external_id {} already exists", account.external_id));
    }
    if (existing.error_code() != ErrorCode::NOT_FOUND) {
        return R::error(existing);
    }

    if (account.id.empty()) {
        account.id = utils::generate_uuid();
    }
    const auto stamp = utils::unique_now_micros();
    account.created_at = stamp;
    account.updated_at = stamp;
    account.version = 1;
    if (account.external_group_id && account.external_group_id->empty()) {
        account.external_group_id.reset();
    }

    SqlStatement stmt;
    const auto p_id = stmt.bind(SqlValue{account.id});
    const auto p_name = stmt.bind(SqlValue{account.name});
    const auto p_ext = stmt.bind(SqlValue{account.external_id});
    const auto p_group = stmt.bind(account.external_group_id);
    const auto p_currency = stmt.bind(SqlValue{account.currency_code});
    const auto p_type = stmt.bind(SqlValue{std::string(account_type_to_string(account.account_type))});
    const auto p_created = stmt.bind(SqlValue{utils::format_store_timestamp(stamp)});
    const auto p_updated = stmt.bind(SqlValue{utils::format_store_timestamp(stamp)});
    const auto p_version = stmt.bind(account.version);
    stmt.sql = std::format("INSERT INTO {} ({}) VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {})",
        table_, kColumns, p_id, p_name, p_ext, p_group, p_currency, p_type,
        p_created, p_updated, p_version);

    const auto rs = conn->execute(stmt, ctx);
    if (!rs.success) {
        if (classify_store_error(rs.error_message) == StoreErrorKind::UNIQUE_VIOLATION) {
            return R::error(ErrorCode::ALREADY_EXISTS,
                std::format("account with external_id {} already exists", account.external_id));
        }
        return R::error(store_failure(conn, rs, "create account"));
    }

    if (on_verified_) {
        auto stored = fetch_one(conn, "id", account.id, ctx);
        if (stored.is_error()) {
            return R::error(stored.error_code(),
                std::format("account {} not readable after insert: {}", account.id, stored.error_message()));
        }
        if (stored.value().version != 1 || stored.value().updated_at != stamp) {
            return R::error(ErrorCode::INTERNAL,
                std::format("account {} read back does not match the committed insert", account.id));
        }
        on_verified_();
    }

    utils::log::debug(std::format("Created account {} ({})", account.id, account.external_id));
    return R::ok(std::move(account));
}

// ============================================================================
// get
// ============================================================================

Result<Account> AccountRepository::get_by_id(const Context& ctx, const std::string& id) {
    if (id.empty()) {
        return Result<Account>::error(ErrorCode::INVALID_ARGUMENT, "account_id is required");
    }
    auto conn = lease(ctx);
    if (conn.is_error()) {
        return Result<Account>::error(conn);
    }
    return fetch_one(*conn.value(), "id", id, ctx);
}

Result<Account> AccountRepository::get_by_external_id(const Context& ctx, const std::string& external_id) {
    if (external_id.empty()) {
        return Result<Account>::error(ErrorCode::INVALID_ARGUMENT, "external_id is required");
    }
    auto conn = lease(ctx);
    if (conn.is_error()) {
        return Result<Account>::error(conn);
    }
    return fetch_one(*conn.value(), "external_id", external_id, ctx);
}

// ============================================================================
// update
// ============================================================================

Result<Account> AccountRepository::update(const Context& ctx, const std::string& id,
                                          const FieldUpdates& updates, int64_t expected_version) {
    using R = Result<Account>;

    if (id.empty()) {
        return R::error(ErrorCode::INVALID_ARGUMENT, "account_id is required");
    }
    if (expected_version < 1) {
        return R::error(ErrorCode::INVALID_ARGUMENT,
            std::format("expected_version must be at least 1, got {}", expected_version));
    }
    if (updates.empty()) {
        return R::error(ErrorCode::INVALID_ARGUMENT, "no fields to update");
    }

    // Validate everything before touching the store
    SqlStatement stmt;
    std::vector<std::string> set_clauses;
    std::unordered_set<std::string> seen;

    for (const auto& [field, value] : updates) {
        if (is_immutable_field(field)) {
            return R::error(ErrorCode::INVALID_ARGUMENT, std::format("field {} is immutable", field));
        }
        if (!seen.insert(field).second) {
            return R::error(ErrorCode::INVALID_ARGUMENT,
                std::format("field {} specified more than once", field));
        }

        SqlValue bound;
        if (field == "name") {
            auto valid = validator_.validate_name(value.value_or(""));
            if (valid.is_error()) return R::error(valid);
            bound = value;
        } else if (field == "account_type") {
            auto valid = validator_.validate_account_type(value.value_or(""));
            if (valid.is_error()) return R::error(valid);
            bound = std::string(account_type_to_string(*parse_account_type(*value)));
        } else if (field == "external_group_id") {
            if (value && !value->empty()) {
                auto valid = validator_.validate_external_group_id(*value);
                if (valid.is_error()) return R::error(valid);
                bound = value;
            }
        } else {
            return R::error(ErrorCode::INVALID_ARGUMENT, std::format("unknown field {}", field));
        }
        set_clauses.push_back(std::format("{} = {}", field, stmt.bind(std::move(bound))));
    }

    auto conn_result = lease(ctx);
    if (conn_result.is_error()) {
        return R::error(conn_result);
    }
    auto& conn = *conn_result.value();

    const auto stamp = utils::unique_now_micros();
    const int64_t next_version = expected_version + 1;
    set_clauses.push_back(std::format("version = {}", stmt.bind(next_version)));
    set_clauses.push_back(std::format("updated_at = {}",
        stmt.bind(SqlValue{utils::format_store_timestamp(stamp)})));

    std::string set_sql;
    for (size_t i = 0; i < set_clauses.size(); ++i) {
        if (i > 0) set_sql += ", ";
        set_sql += set_clauses[i];
    }
    const auto p_id = stmt.bind(SqlValue{id});
    const auto p_version = stmt.bind(expected_version);
    stmt.sql = std::format("UPDATE {} SET {} WHERE id = {} AND version = {}",
        table_, set_sql, p_id, p_version);

    const auto rs = conn->execute(stmt, ctx);
    if (!rs.success) {
        if (classify_store_error(rs.error_message) == StoreErrorKind::VERSION_CONFLICT) {
            auto current = fetch_one(conn, "id", id, ctx);
            if (current.is_error()) {
                return current;
            }
            return R::error(ErrorCode::ABORTED,
                std::format("account {} was modified concurrently, retry update", id));
        }
        return R::error(store_failure(conn, rs, "update account"));
    }

    // Affected-row counts are unreliable here; the re-read decides
    auto updated = fetch_one(conn, "id", id, ctx);
    if (updated.is_error()) {
        return updated;
    }
    const auto& row = updated.value();
    if (row.version != next_version || row.updated_at != stamp) {
        utils::log::debug(std::format("Update of account {} at version {} lost the race (now {})",
            id, expected_version, row.version));
        return R::error(ErrorCode::ABORTED,
            std::format("account {} was modified concurrently, retry update", id));
    }
    if (on_verified_) on_verified_();
    return updated;
}

// ============================================================================
// list
// ============================================================================

Result<AccountPage> AccountRepository::list(const Context& ctx, const ListFilter& filter) {
    using R = Result<AccountPage>;

    if (filter.page_size < 0) {
        return R::error(ErrorCode::INVALID_ARGUMENT,
            std::format("page_size must not be negative, got {}", filter.page_size));
    }
    const int32_t limit = filter.page_size == 0
        ? kDefaultPageSize : std::min(filter.page_size, kMaxPageSize);

    int64_t offset = 0;
    if (!filter.page_token.empty()) {
        const auto parsed = utils::try_parse_int<int64_t>(filter.page_token);
        if (!parsed || *parsed < 0) {
            return R::error(ErrorCode::INVALID_ARGUMENT,
                std::format("invalid page_token '{}'", filter.page_token));
        }
        offset = *parsed;
    }

    SqlStatement count_stmt;
    SqlStatement page_stmt;
    std::vector<std::string> where;
    auto add_filter = [&](std::string_view lhs, std::string_view op, const std::string& value) {
        const auto placeholder = count_stmt.bind(SqlValue{value});
        page_stmt.bind(SqlValue{value});
        where.push_back(std::format("{} {} {}", lhs, op, placeholder));
    };

    if (filter.account_type) {
        add_filter("account_type", "=", std::string(account_type_to_string(*filter.account_type)));
    }
    if (!filter.currency_code.empty()) {
        add_filter("currency_code", "=", filter.currency_code);
    }
    if (!filter.external_group_id.empty()) {
        add_filter("external_group_id", "=", filter.external_group_id);
    }
    if (!filter.name_search.empty()) {
        add_filter("LOWER(name)", "LIKE", "%" + utils::to_lower(filter.name_search) + "%");
    }

    std::string where_sql;
    for (size_t i = 0; i < where.size(); ++i) {
        where_sql += (i == 0) ? " WHERE " : " AND ";
        where_sql += where[i];
    }

    auto conn_result = lease(ctx);
    if (conn_result.is_error()) {
        return R::error(conn_result);
    }
    auto& conn = *conn_result.value();

    count_stmt.sql = std::format("SELECT COUNT(*) FROM {}{}", table_, where_sql);
    const auto count_rs = conn->execute(count_stmt, ctx);
    if (!count_rs.success) {
        return R::error(store_failure(conn, count_rs, "count accounts"));
    }

    AccountPage page;
    if (!count_rs.rows.empty() && !count_rs.rows[0].empty()) {
        page.total_count = utils::parse_int<int64_t>(count_rs.rows[0][0]);
    }

    page_stmt.sql = std::format("SELECT {} FROM {}{} ORDER BY created_at DESC, id LIMIT {} OFFSET {}",
        kColumns, table_, where_sql, limit, offset);
    const auto rs = conn->execute(page_stmt, ctx);
    if (!rs.success) {
        return R::error(store_failure(conn, rs, "list accounts"));
    }

    page.accounts.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        auto account = parse_row(row);
        if (account.is_error()) {
            return R::error(account);
        }
        page.accounts.push_back(std::move(account.value()));
    }

    const int64_t next = offset + static_cast<int64_t>(page.accounts.size());
    if (!page.accounts.empty() && next < page.total_count) {
        page.next_page_token = std::to_string(next);
    }
    return R::ok(std::move(page));
}

} // namespace ledgerstore
