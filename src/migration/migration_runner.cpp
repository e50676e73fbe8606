#include "migration/migration_runner.hpp"
#include "migration/sql_script.hpp"
#include "db/sql_statement.hpp"
#include "db/store_error.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <regex>
#include <sstream>

namespace ledgerstore {

namespace fs = std::filesystem;

namespace {

const std::regex& migration_filename_regex() {
    static const std::regex re(R"(^(\d{3})_(.+)\.sql$)");
    return re;
}

std::string format_label(int version, const std::string& name) {
    return std::format("{:03d}_{}", version, name);
}

bool parse_bool_column(const std::string& value) {
    const auto lower = utils::to_lower(value);
    return lower == "t" || lower == "true" || lower == "1";
}

std::string today_utc() {
    return std::format("{:%Y-%m-%d}",
        std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now()));
}

} // anonymous namespace

std::string Migration::label() const {
    return format_label(version, name);
}

std::string AppliedMigration::label() const {
    return format_label(version, name);
}

std::string MigrationStatus::summary() const {
    if (pending.empty()) {
        return std::format("All {} migrations applied", applied.size());
    }
    return std::format("{} migrations applied, {} pending", applied.size(), pending.size());
}

MigrationRunner::MigrationRunner(MigrationConfig config, SessionProvider session)
    : config_(std::move(config)),
      table_(safe_identifier(config_.ledger_table())),
      session_(std::move(session)) {}

// ============================================================================
// Loading and validation
// ============================================================================

Result<std::vector<Migration>> MigrationRunner::load_migrations() const {
    using R = Result<std::vector<Migration>>;

    std::error_code ec;
    if (!fs::is_directory(config_.migrations_path, ec)) {
        return R::error(ErrorCode::NOT_FOUND,
            std::format("migrations directory not found: {}", config_.migrations_path));
    }

    std::vector<Migration> migrations;
    for (const auto& entry : fs::directory_iterator(config_.migrations_path, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".sql") continue;

        const std::string filename = entry.path().filename().string();
        std::smatch match;
        if (!std::regex_match(filename, match, migration_filename_regex())) {
            utils::log::warn(std::format("Skipping invalid migration filename: {}", filename));
            continue;
        }

        std::ifstream in(entry.path(), std::ios::binary);
        if (!in) {
            return R::error(ErrorCode::INTERNAL,
                std::format("failed to read migration file {}", filename));
        }
        std::ostringstream buf;
        buf << in.rdbuf();

        Migration m;
        m.version = utils::parse_int<int>(match[1].str());
        m.name = match[2].str();
        m.filename = filename;
        m.path = entry.path().string();
        m.content = buf.str();
        m.checksum = sha256_hex(m.content);
        migrations.push_back(std::move(m));
    }
    if (ec) {
        return R::error(ErrorCode::INTERNAL,
            std::format("failed to list migration files: {}", ec.message()));
    }

    std::sort(migrations.begin(), migrations.end(), [](const Migration& a, const Migration& b) {
        return a.version != b.version ? a.version < b.version : a.filename < b.filename;
    });
    return R::ok(std::move(migrations));
}

std::vector<std::string> MigrationRunner::check_sequence(const std::vector<Migration>& migrations) const {
    std::vector<std::string> problems;

    std::map<int, std::string> seen;
    for (const auto& m : migrations) {
        if (const auto it = seen.find(m.version); it != seen.end()) {
            problems.push_back(std::format("duplicate migration version {:03d} in files: {} and {}",
                m.version, it->second, m.filename));
        } else {
            seen.emplace(m.version, m.filename);
        }
    }

    int expected = 1;
    for (const auto& [version, filename] : seen) {
        if (version != expected) {
            problems.push_back(std::format("migration numbering gap: expected {:03d}, got {:03d} in {}",
                expected, version, filename));
            expected = version;
        }
        ++expected;
    }
    return problems;
}

std::vector<std::string> MigrationRunner::check_script(const Migration& migration) const {
    std::vector<std::string> problems;

    const auto statements = split_sql_statements(migration.content);
    if (statements.empty()) {
        problems.push_back(std::format("{}: contains no SQL statements", migration.filename));
        return problems;
    }

    for (size_t i = 0; i < statements.size(); ++i) {
        if (const auto err = check_statement_syntax(statements[i])) {
            problems.push_back(std::format("{}: statement {}: {}", migration.filename, i + 1, *err));
        }
        if (const auto op = find_destructive_operation(statements[i])) {
            problems.push_back(std::format("{}: statement {}: destructive operation {} is not allowed on an append-only store",
                migration.filename, i + 1, *op));
        }
    }
    return problems;
}

Result<size_t> MigrationRunner::validate() const {
    auto loaded = load_migrations();
    if (loaded.is_error()) {
        return Result<size_t>::error(loaded);
    }
    const auto& migrations = loaded.value();

    std::vector<std::string> problems;

    // Files that look like migrations but break the naming convention
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(config_.migrations_path, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".sql") continue;
        const auto filename = entry.path().filename().string();
        if (!std::regex_match(filename, migration_filename_regex())) {
            problems.push_back(std::format("{}: name must match NNN_description.sql", filename));
        }
    }

    const auto sequence = check_sequence(migrations);
    problems.insert(problems.end(), sequence.begin(), sequence.end());

    for (const auto& m : migrations) {
        const auto script = check_script(m);
        problems.insert(problems.end(), script.begin(), script.end());
    }

    if (!problems.empty()) {
        std::string combined = std::format("{} problem(s) found:", problems.size());
        for (const auto& p : problems) { combined += "\n  - "; combined += p; }
        return Result<size_t>::error(ErrorCode::INVALID_ARGUMENT, std::move(combined));
    }

    utils::log::info(std::format("Validated {} migration file(s)", migrations.size()));
    return Result<size_t>::ok(migrations.size());
}

std::string MigrationRunner::sanitize_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (const char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            out += c;
        } else if (c == ' ' || c == '-') {
            out += '_';
        }
    }
    return out;
}

Result<std::string> MigrationRunner::create_migration(const std::string& name) const {
    using R = Result<std::string>;

    const auto clean = sanitize_name(name);
    if (clean.empty()) {
        return R::error(ErrorCode::INVALID_ARGUMENT,
            std::format("invalid migration name \"{}\": no usable characters", name));
    }

    std::error_code ec;
    fs::create_directories(config_.migrations_path, ec);
    if (ec) {
        return R::error(ErrorCode::INTERNAL,
            std::format("failed to create migrations directory {}: {}", config_.migrations_path, ec.message()));
    }

    auto loaded = load_migrations();
    if (loaded.is_error()) {
        return R::error(loaded);
    }
    const int next_version = loaded.value().empty() ? 1 : loaded.value().back().version + 1;
    if (next_version > 999) {
        return R::error(ErrorCode::INVALID_ARGUMENT, "migration sequence exhausted (999)");
    }

    const auto filename = std::format("{:03d}_{}.sql", next_version, clean);
    const auto path = (fs::path(config_.migrations_path) / filename).string();
    if (fs::exists(path, ec)) {
        return R::error(ErrorCode::ALREADY_EXISTS, std::format("migration file already exists: {}", path));
    }

    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return R::error(ErrorCode::INTERNAL, std::format("failed to create migration file {}", path));
    }
    out << std::format(
        "-- Migration: {:03d}_{}\n"
        "-- Author: [Author Name]\n"
        "-- Date: {}\n"
        "-- Description: [Description]\n"
        "\n"
        "-- Add your migration SQL here\n"
        "-- The store is append-only: CREATE TABLE IF NOT EXISTS only, no DROP,\n"
        "-- DELETE, TRUNCATE or destructive ALTER, indexes only on empty tables\n",
        next_version, clean, today_utc());
    out.close();
    if (!out) {
        return R::error(ErrorCode::INTERNAL, std::format("failed to write migration file {}", path));
    }

    utils::log::info(std::format("Created migration file: {}", filename));
    return R::ok(path);
}

// ============================================================================
// Ledger access
// ============================================================================

Result<std::unique_ptr<PooledConnection>> MigrationRunner::lease(const Context& ctx) const {
    using R = Result<std::unique_ptr<PooledConnection>>;
    if (config_.service_name.empty()) {
        return R::error(ErrorCode::INVALID_ARGUMENT, "migration service name must not be empty");
    }
    if (table_.empty()) {
        return R::error(ErrorCode::INVALID_ARGUMENT,
            std::format("migration table name '{}' is not a valid identifier", config_.ledger_table()));
    }
    auto pool = session_ ? session_() : nullptr;
    if (!pool) {
        return R::error(ErrorCode::UNAVAILABLE, "storage unavailable: not connected");
    }
    return pool->acquire(ctx);
}

VoidResult MigrationRunner::ensure_ledger_table(PooledConnection& conn, const Context& ctx) {
    const SqlStatement stmt{std::format(
        "CREATE TABLE IF NOT EXISTS {} ("
        "version INTEGER, "
        "name VARCHAR[255], "
        "service VARCHAR[100], "
        "checksum VARCHAR[64], "
        "executed_at TIMESTAMP, "
        "execution_time_ms INTEGER, "
        "applied_by VARCHAR[100], "
        "success BOOLEAN, "
        "error_message VARCHAR, "
        "PRIMARY KEY (service, version, executed_at))", table_)};

    const auto rs = conn->execute(stmt, ctx);
    if (!rs.success) {
        const auto kind = classify_store_error(rs.error_message);
        if (kind == StoreErrorKind::SESSION_LOST) conn.invalidate();
        return VoidResult::error(to_error_code(kind),
            std::format("failed to create migration table: {}", rs.error_message));
    }
    return VoidResult::ok();
}

Result<std::vector<AppliedMigration>> MigrationRunner::applied_migrations(PooledConnection& conn, const Context& ctx) {
    using R = Result<std::vector<AppliedMigration>>;

    SqlStatement stmt;
    const auto service = stmt.bind(config_.service_name);
    const auto success = stmt.bind(SqlValue{"true"});
    stmt.sql = std::format(
        "SELECT version, name, checksum, executed_at, execution_time_ms, applied_by, success, error_message "
        "FROM {} WHERE service = {} AND success = {} ORDER BY version, executed_at DESC",
        table_, service, success);

    const auto rs = conn->execute(stmt, ctx);
    if (!rs.success) {
        const auto kind = classify_store_error(rs.error_message);
        // Ledger table not created yet
        if (kind == StoreErrorKind::TABLE_NOT_FOUND) {
            return R::ok({});
        }
        if (kind == StoreErrorKind::SESSION_LOST) conn.invalidate();
        return R::error(to_error_code(kind),
            std::format("failed to query applied migrations: {}", rs.error_message));
    }

    std::vector<AppliedMigration> applied;
    applied.reserve(rs.rows.size());
    for (const auto& row : rs.rows) {
        if (row.size() < 8) continue;
        AppliedMigration a;
        a.version = utils::parse_int<int>(row[0]);
        a.name = row[1];
        a.checksum = row[2];
        a.executed_at = utils::parse_store_timestamp(row[3]);
        a.execution_time_ms = utils::parse_int<int64_t>(row[4]);
        a.applied_by = row[5];
        a.success = parse_bool_column(row[6]);
        a.error_message = row[7];
        applied.push_back(std::move(a));
    }
    return R::ok(std::move(applied));
}

VoidResult MigrationRunner::record_migration(PooledConnection& conn, const Migration& migration,
                                             int64_t execution_time_ms, const std::string& error,
                                             const Context& ctx) {
    SqlStatement stmt;
    const auto p_version = stmt.bind(int64_t{migration.version});
    const auto p_name = stmt.bind(SqlValue{migration.name});
    const auto p_service = stmt.bind(SqlValue{config_.service_name});
    const auto p_checksum = stmt.bind(SqlValue{migration.checksum});
    const auto p_executed = stmt.bind(SqlValue{utils::format_store_timestamp(utils::unique_now_micros())});
    const auto p_time = stmt.bind(execution_time_ms);
    const auto p_applied_by = stmt.bind(SqlValue{config_.applied_by});
    const auto p_success = stmt.bind(SqlValue{utils::booltostr(error.empty())});
    const auto p_error = stmt.bind(SqlValue{error});
    stmt.sql = std::format(
        "INSERT INTO {} (version, name, service, checksum, executed_at, execution_time_ms, "
        "applied_by, success, error_message) VALUES ({}, {}, {}, {}, {}, {}, {}, {}, {})",
        table_, p_version, p_name, p_service, p_checksum, p_executed, p_time,
        p_applied_by, p_success, p_error);

    const auto rs = conn->execute(stmt, ctx);
    if (!rs.success) {
        const auto kind = classify_store_error(rs.error_message);
        if (kind == StoreErrorKind::SESSION_LOST) conn.invalidate();
        return VoidResult::error(to_error_code(kind),
            std::format("failed to record migration {}: {}", migration.label(), rs.error_message));
    }
    return VoidResult::ok();
}

// ============================================================================
// Status
// ============================================================================

MigrationStatus MigrationRunner::diff(std::vector<Migration> on_disk,
                                      std::vector<AppliedMigration> applied) const {
    MigrationStatus status;
    status.total = on_disk.size();

    // Latest successful record per version wins
    std::map<int, const AppliedMigration*> by_version;
    for (const auto& a : applied) {
        auto [it, inserted] = by_version.emplace(a.version, &a);
        if (!inserted && a.executed_at &&
            (!it->second->executed_at || *a.executed_at > *it->second->executed_at)) {
            it->second = &a;
        }
        if (a.executed_at && (!status.last_run || *a.executed_at > *status.last_run)) {
            status.last_run = a.executed_at;
        }
    }

    for (auto& m : on_disk) {
        const auto it = by_version.find(m.version);
        if (it == by_version.end()) {
            status.pending.push_back(std::move(m));
            continue;
        }
        if (it->second->checksum != m.checksum) {
            utils::log::warn(std::format("Migration {} has been modified since it was applied", m.label()));
            status.drifted.push_back(DriftedMigration{
                m.version, m.name, it->second->checksum, m.checksum});
        }
    }

    for (const auto& [version, record] : by_version) {
        status.applied.push_back(*record);
    }
    return status;
}

Result<MigrationStatus> MigrationRunner::status(const Context& ctx) {
    using R = Result<MigrationStatus>;

    auto loaded = load_migrations();
    if (loaded.is_error()) {
        return R::error(loaded);
    }

    auto conn = lease(ctx);
    if (conn.is_error()) {
        return R::error(conn);
    }

    auto applied = applied_migrations(*conn.value(), ctx);
    if (applied.is_error()) {
        return R::error(applied);
    }

    return R::ok(diff(std::move(loaded.value()), std::move(applied.value())));
}

// ============================================================================
// Run
// ============================================================================

VoidResult MigrationRunner::verify_index_target_empty(PooledConnection& conn, const std::string& table,
                                                     const Context& ctx) {
    const auto safe_table = safe_identifier(table);
    if (safe_table.empty()) {
        return VoidResult::error(ErrorCode::INVALID_ARGUMENT,
            std::format("invalid index target table name \"{}\"", table));
    }

    const auto rs = conn->execute(SqlStatement{std::format("SELECT COUNT(*) FROM {}", safe_table)}, ctx);
    if (!rs.success) {
        const auto kind = classify_store_error(rs.error_message);
        // Unknown table: let the CREATE INDEX itself report it
        if (kind == StoreErrorKind::TABLE_NOT_FOUND) return VoidResult::ok();
        if (kind == StoreErrorKind::SESSION_LOST) conn.invalidate();
        return VoidResult::error(to_error_code(kind),
            std::format("failed to count rows in {}: {}", safe_table, rs.error_message));
    }

    const int64_t rows = (!rs.rows.empty() && !rs.rows[0].empty())
        ? utils::parse_int<int64_t>(rs.rows[0][0]) : 0;
    if (rows > 0) {
        return VoidResult::error(ErrorCode::INVALID_ARGUMENT,
            std::format("cannot create index on non-empty table {} ({} rows)", safe_table, rows));
    }
    return VoidResult::ok();
}

VoidResult MigrationRunner::execute_migration(PooledConnection& conn, const Migration& migration,
                                              const Context& ctx) {
    const auto statements = split_sql_statements(migration.content);

    if (config_.use_transactions) {
        const auto begin = conn->execute(SqlStatement{"BEGIN"}, ctx);
        if (!begin.success) {
            return VoidResult::error(ErrorCode::INTERNAL,
                std::format("failed to begin transaction: {}", begin.error_message));
        }
    }

    std::string error;
    for (size_t i = 0; i < statements.size() && error.empty(); ++i) {
        if (config_.verify_index_tables_empty) {
            if (const auto table = create_index_target(statements[i])) {
                if (auto empty = verify_index_target_empty(conn, *table, ctx); empty.is_error()) {
                    error = std::format("statement {}: {}", i + 1, empty.error_message());
                    break;
                }
            }
        }

        const auto rs = conn->execute(SqlStatement{statements[i]}, ctx);
        if (!rs.success) {
            error = std::format("failed to execute statement {}: {}", i + 1, rs.error_message);
        }
    }

    if (config_.use_transactions) {
        if (error.empty()) {
            const auto commit = conn->execute(SqlStatement{"COMMIT"}, ctx);
            if (!commit.success) {
                error = std::format("failed to commit: {}", commit.error_message);
            }
        } else {
            const auto rollback = conn->execute(SqlStatement{"ROLLBACK"}, ctx);
            if (!rollback.success) {
                utils::log::warn(std::format("Rollback of migration {} failed: {}",
                    migration.label(), rollback.error_message));
            }
        }
    }

    if (!error.empty()) {
        if (is_session_error(error)) conn.invalidate();
        return VoidResult::error(ErrorCode::INTERNAL, std::move(error));
    }
    return VoidResult::ok();
}

Result<RunReport> MigrationRunner::run(const Context& ctx) {
    using R = Result<RunReport>;
    std::lock_guard lock(run_mutex_);

    auto loaded = load_migrations();
    if (loaded.is_error()) {
        return R::error(loaded);
    }

    // Whole-set ordering checks
    if (const auto problems = check_sequence(loaded.value()); !problems.empty()) {
        return R::error(ErrorCode::INVALID_ARGUMENT,
            std::format("migration set is invalid: {}", problems.front()));
    }

    auto conn_result = lease(ctx);
    if (conn_result.is_error()) {
        return R::error(conn_result);
    }
    auto& conn = *conn_result.value();

    RunReport report;
    report.dry_run = config_.dry_run;

    if (!config_.dry_run) {
        if (auto ensured = ensure_ledger_table(conn, ctx); ensured.is_error()) {
            return R::error(ensured);
        }
    }

    auto applied = applied_migrations(conn, ctx);
    if (applied.is_error()) {
        return R::error(applied);
    }

    auto status = diff(std::move(loaded.value()), std::move(applied.value()));
    report.planned = status.pending;

    if (status.pending.empty()) {
        utils::log::info("No pending migrations");
        return R::ok(std::move(report));
    }

    // Preflight every pending script before touching the store
    std::vector<std::string> problems;
    for (const auto& m : status.pending) {
        const auto script = check_script(m);
        problems.insert(problems.end(), script.begin(), script.end());
    }
    if (!problems.empty()) {
        std::string combined = "pending migrations failed preflight:";
        for (const auto& p : problems) { combined += "\n  - "; combined += p; }
        return R::error(ErrorCode::INVALID_ARGUMENT, std::move(combined));
    }

    utils::log::info(std::format("Found {} pending migration(s)", status.pending.size()));

    if (config_.dry_run) {
        for (const auto& m : status.pending) {
            utils::log::info(std::format("[DRY RUN] Would execute migration {}", m.label()));
        }
        return R::ok(std::move(report));
    }

    for (const auto& m : status.pending) {
        utils::log::info(std::format("Executing migration {}...", m.label()));

        utils::Timer timer;
        const auto executed = execute_migration(conn, m, ctx.with_timeout(config_.timeout));
        const int64_t elapsed_ms = timer.elapsed_ms().count();

        MigrationOutcome outcome{m.version, m.name, executed.is_ok(), elapsed_ms,
                                 executed.is_ok() ? std::string() : executed.error_message()};

        const auto recorded = conn.is_broken()
            ? VoidResult::error(ErrorCode::UNAVAILABLE, "session lost")
            : record_migration(conn, m, elapsed_ms, outcome.error, ctx);
        report.executed.push_back(outcome);

        if (executed.is_error()) {
            if (recorded.is_error()) {
                utils::log::error(std::format("Failed to record migration: {}", recorded.error_message()));
            }
            utils::log::error(std::format("Migration {} failed: {}", m.label(), executed.error_message()));
            return R::error(ErrorCode::INTERNAL,
                std::format("migration {} failed: {}", m.label(), executed.error_message()));
        }

        if (recorded.is_error()) {
            return R::error(ErrorCode::INTERNAL,
                std::format("migration {} applied but could not be recorded: {}",
                    m.label(), recorded.error_message()));
        }

        utils::log::info(std::format("Migration {} completed in {}ms", m.label(), elapsed_ms));
    }

    return R::ok(std::move(report));
}

} // namespace ledgerstore
