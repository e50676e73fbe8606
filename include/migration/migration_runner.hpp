#pragma once

#include "config/config_types.hpp"
#include "core/context.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ledgerstore {

/**
 * @brief One on-disk migration script ("NNN_description.sql")
 */
struct Migration {
    int version = 0;
    std::string name;
    std::string filename;
    std::string path;
    std::string content;
    std::string checksum;       // SHA-256 hex of content

    /// "001_initial_schema"
    [[nodiscard]] std::string label() const;
};

/**
 * @brief Ledger row for an executed migration
 */
struct AppliedMigration {
    int version = 0;
    std::string name;
    std::string checksum;
    std::optional<utils::Timestamp> executed_at;
    int64_t execution_time_ms = 0;
    std::string applied_by;
    bool success = false;
    std::string error_message;

    [[nodiscard]] std::string label() const;
};

/**
 * @brief Applied migration whose script changed after it ran
 */
struct DriftedMigration {
    int version = 0;
    std::string name;
    std::string recorded_checksum;
    std::string current_checksum;
};

struct MigrationStatus {
    std::vector<AppliedMigration> applied;
    std::vector<Migration> pending;
    size_t total = 0;
    std::optional<utils::Timestamp> last_run;
    std::vector<DriftedMigration> drifted;

    /// "All N migrations applied" / "N migrations applied, M pending"
    [[nodiscard]] std::string summary() const;
};

struct MigrationOutcome {
    int version = 0;
    std::string name;
    bool success = false;
    int64_t execution_time_ms = 0;
    std::string error;
};

struct RunReport {
    bool dry_run = false;
    std::vector<Migration> planned;            // pending at start of run
    std::vector<MigrationOutcome> executed;    // empty for dry runs
};

/**
 * @brief Applies ordered, irreversible schema migrations to the store
 *
 * Applied state lives in the "<service>_schema_migrations" ledger table.
 * Only rows with success = true count as applied; failed attempts are
 * recorded for audit and retried on the next run.
 *
 * Thread Safety: run() is serialized per runner. Separate processes
 * running migrations concurrently against one store are not coordinated.
 */
class MigrationRunner {
public:
    MigrationRunner(MigrationConfig config, SessionProvider session);

    /**
     * @brief Diff on-disk scripts against the ledger
     *
     * Read-only: a missing ledger table means nothing is applied.
     * Checksum drift is logged and reported, never an error.
     */
    [[nodiscard]] Result<MigrationStatus> status(const Context& ctx);

    /**
     * @brief Apply every pending migration in ascending order
     *
     * Pending scripts are preflighted first; the run stops at the first
     * failure. Dry runs only report the plan.
     */
    [[nodiscard]] Result<RunReport> run(const Context& ctx);

    /**
     * @brief Check every on-disk script without executing it
     * @return Number of scripts validated, or INVALID_ARGUMENT listing
     *         every problem found
     */
    [[nodiscard]] Result<size_t> validate() const;

    /**
     * @brief Write a skeleton for the next sequence number
     * @return Path of the new file
     */
    [[nodiscard]] Result<std::string> create_migration(const std::string& name) const;

    /**
     * @brief Scripts under migrations_path whose names match NNN_name.sql,
     * sorted by version. Other files are skipped with a warning.
     */
    [[nodiscard]] Result<std::vector<Migration>> load_migrations() const;

    /// Letters, digits and '_' kept; ' ' and '-' become '_'; the rest dropped
    [[nodiscard]] static std::string sanitize_name(const std::string& name);

    [[nodiscard]] const MigrationConfig& config() const { return config_; }

private:
    Result<std::unique_ptr<PooledConnection>> lease(const Context& ctx) const;

    VoidResult ensure_ledger_table(PooledConnection& conn, const Context& ctx);

    Result<std::vector<AppliedMigration>> applied_migrations(PooledConnection& conn, const Context& ctx);

    MigrationStatus diff(std::vector<Migration> on_disk, std::vector<AppliedMigration> applied) const;

    /// Content checks (syntax, destructive statements) for one script
    std::vector<std::string> check_script(const Migration& migration) const;

    /// Naming, duplicate and gap checks over the whole set
    std::vector<std::string> check_sequence(const std::vector<Migration>& migrations) const;

    VoidResult execute_migration(PooledConnection& conn, const Migration& migration, const Context& ctx);

    VoidResult verify_index_target_empty(PooledConnection& conn, const std::string& table, const Context& ctx);

    VoidResult record_migration(PooledConnection& conn, const Migration& migration,
                                int64_t execution_time_ms, const std::string& error, const Context& ctx);

    MigrationConfig config_;
    std::string table_;
    SessionProvider session_;
    std::mutex run_mutex_;
};

} // namespace ledgerstore
