#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace ledgerstore {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServiceConfig {
    std::string name = "ledger-service";
    std::string environment = "dev";   // dev | staging | prod | local
};

struct LoggingConfig {
    std::string level = "info";        // debug | info | warn | error
};

/**
 * @brief Store endpoint and session-lifecycle settings
 *
 * The store is reached through its PostgreSQL wire endpoint.
 */
struct StoreConfig {
    std::string host = "immudb";
    uint32_t port = 5432;
    std::string database = "ledgerdb";
    std::string username = "ledger_user";
    std::string password = "ledger_pass";
    std::string sslmode = "disable";

    // Signed so a negative TOML value is caught by validation, not wrapped
    int64_t min_connections = 1;
    int64_t max_connections = 25;

    // connect(): attempt n waits backoff_base * 2^(n-2) first
    int max_connect_attempts = 5;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds connect_timeout{10000};

    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds ping_timeout{5000};
    std::chrono::milliseconds reconnect_timeout{5000};
    std::chrono::seconds health_check_interval{30};

    // Confirm each repository write by reading it back
    bool verify_transactions = true;
};

struct MigrationConfig {
    std::string migrations_path = "./migrations";
    bool run_on_boot = false;
    bool dry_run = false;
    std::chrono::milliseconds timeout{30000};   // per migration
    std::string table_name;                // empty = "<service_name>_schema_migrations"
    std::string service_name = "ledger";
    std::string applied_by = "ledger-migrate";
    bool use_transactions = true;
    bool verify_index_tables_empty = true;

    [[nodiscard]] std::string ledger_table() const {
        return table_name.empty() ? service_name + "_schema_migrations" : table_name;
    }
};

struct LedgerConfig {
    ServiceConfig service;
    LoggingConfig logging;
    StoreConfig store;
    MigrationConfig migration;
};

} // namespace ledgerstore
