#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace ledgerstore;
using namespace std::chrono_literals;

namespace {

void clear_env() {
    for (const char* name : {"IMMUDB_HOST", "IMMUDB_PORT", "IMMUDB_DATABASE", "IMMUDB_USERNAME",
                             "IMMUDB_PASSWORD", "IMMUDB_MAX_CONNECTIONS", "IMMUDB_VERIFY_TRANSACTIONS",
                             "IMMUDB_PING_TIMEOUT",
                             "LEDGER_MIGRATION_PATH", "LEDGER_MIGRATION_RUN_ON_BOOT",
                             "LEDGER_MIGRATION_TIMEOUT", "LEDGER_MIGRATION_TABLE", "LOG_LEVEL"}) {
        ::unsetenv(name);
    }
}

} // anonymous namespace

TEST_CASE("ConfigLoader: defaults without a file", "[config]") {
    clear_env();
    auto result = ConfigLoader::load_from_env();
    REQUIRE(result.success);

    const auto& c = result.config;
    CHECK(c.service.name == "ledger-service");
    CHECK(c.store.host == "immudb");
    CHECK(c.store.port == 5432);
    CHECK(c.store.max_connect_attempts == 5);
    CHECK(c.store.reconnect_timeout == 5s);
    CHECK(c.migration.migrations_path == "./migrations");
    CHECK_FALSE(c.migration.run_on_boot);
    CHECK(c.migration.ledger_table() == "ledger_schema_migrations");
}

TEST_CASE("ConfigLoader: sections and durations", "[config]") {
    clear_env();
    auto result = ConfigLoader::load_from_string(R"(
[service]
name = "ledger-eu"
environment = "staging"

[logging]
level = "debug"

[store]
host = "immudb.internal"
port = 5433
max_connections = 10
backoff_base = "250ms"
ping_timeout = 1500
health_check_interval = "1m"

[migration]
path = "/srv/migrations"
run_on_boot = true
timeout = "2m"
service = "billing"
)");
    REQUIRE(result.success);

    const auto& c = result.config;
    CHECK(c.service.environment == "staging");
    CHECK(c.logging.level == "debug");
    CHECK(c.store.host == "immudb.internal");
    CHECK(c.store.port == 5433);
    CHECK(c.store.max_connections == 10);
    CHECK(c.store.backoff_base == 250ms);
    CHECK(c.store.ping_timeout == 1500ms);
    CHECK(c.store.health_check_interval == 60s);
    CHECK(c.migration.run_on_boot);
    CHECK(c.migration.timeout == 120s);
    CHECK(c.migration.ledger_table() == "billing_schema_migrations");
}

TEST_CASE("ConfigLoader: ${VAR} expansion and env overrides", "[config][env]") {
    clear_env();
    ::setenv("LEDGER_TEST_SECRET", "s3cret", 1);
    ::setenv("IMMUDB_HOST", "override-host", 1);
    ::setenv("LEDGER_MIGRATION_RUN_ON_BOOT", "yes", 1);
    ::setenv("IMMUDB_VERIFY_TRANSACTIONS", "false", 1);
    ::setenv("LEDGER_MIGRATION_TIMEOUT", "750ms", 1);

    auto result = ConfigLoader::load_from_string(R"(
[store]
host = "from-file"
password = "${LEDGER_TEST_SECRET}"
)");
    REQUIRE(result.success);
    CHECK(result.config.store.password == "s3cret");
    CHECK(result.config.store.host == "override-host");
    CHECK(result.config.migration.run_on_boot);
    CHECK_FALSE(result.config.store.verify_transactions);
    CHECK(result.config.migration.timeout == 750ms);

    ::unsetenv("LEDGER_TEST_SECRET");
    clear_env();
}

TEST_CASE("ConfigLoader: malformed env overrides are reported", "[config][env]") {
    clear_env();
    ::setenv("IMMUDB_PORT", "fifty", 1);
    ::setenv("LEDGER_MIGRATION_TIMEOUT", "soon", 1);
    ::setenv("IMMUDB_VERIFY_TRANSACTIONS", "maybe", 1);

    auto result = ConfigLoader::load_from_env();
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("IMMUDB_PORT is not a number") != std::string::npos);
    CHECK(result.error_message.find("LEDGER_MIGRATION_TIMEOUT is not a duration") != std::string::npos);
    CHECK(result.error_message.find("IMMUDB_VERIFY_TRANSACTIONS is not a boolean") != std::string::npos);

    clear_env();
}

TEST_CASE("ConfigLoader: validation collects every error", "[config][validation]") {
    clear_env();
    auto result = ConfigLoader::load_from_string(R"(
[service]
environment = "qa"

[logging]
level = "verbose"

[store]
port = 70000
min_connections = 5
max_connections = 2

[migration]
table = "bad-name;"
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.find("service.environment") != std::string::npos);
    CHECK(msg.find("logging.level") != std::string::npos);
    CHECK(msg.find("store.port must be 1-65535") != std::string::npos);
    CHECK(msg.find("store.min_connections (5) > max_connections (2)") != std::string::npos);
    CHECK(msg.find("migration.table") != std::string::npos);
}

TEST_CASE("ConfigLoader: pool sizes and durations must be positive", "[config][validation]") {
    clear_env();

    SECTION("negative max_connections") {
        auto result = ConfigLoader::load_from_string("[store]\nmax_connections = -1\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("store.max_connections must be >= 1, got -1") != std::string::npos);
    }

    SECTION("zero max_connections") {
        auto result = ConfigLoader::load_from_string("[store]\nmin_connections = 0\nmax_connections = 0\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("store.max_connections must be >= 1, got 0") != std::string::npos);
    }

    SECTION("negative min_connections") {
        auto result = ConfigLoader::load_from_string("[store]\nmin_connections = -3\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("store.min_connections must be >= 0, got -3") != std::string::npos);
    }

    SECTION("negative max_connections from the environment") {
        ::setenv("IMMUDB_MAX_CONNECTIONS", "-1", 1);
        auto result = ConfigLoader::load_from_env();
        clear_env();
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("store.max_connections must be >= 1") != std::string::npos);
    }

    SECTION("negative integer durations") {
        auto result = ConfigLoader::load_from_string(R"(
[store]
backoff_base = -100
reconnect_timeout = -1
acquire_timeout = 0
)");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("store.backoff_base must be > 0, got -100ms") != std::string::npos);
        CHECK(result.error_message.find("store.reconnect_timeout must be > 0") != std::string::npos);
        CHECK(result.error_message.find("store.acquire_timeout must be > 0") != std::string::npos);
    }

    SECTION("health interval that rounds to zero seconds") {
        auto zero = ConfigLoader::load_from_string("[store]\nhealth_check_interval = 0\n");
        REQUIRE_FALSE(zero.success);
        CHECK(zero.error_message.find("store.health_check_interval must be > 0") != std::string::npos);

        auto sub_second = ConfigLoader::load_from_string("[store]\nhealth_check_interval = \"500ms\"\n");
        CHECK_FALSE(sub_second.success);
    }

    SECTION("migration timeout keeps millisecond precision") {
        auto sub_second = ConfigLoader::load_from_string("[migration]\ntimeout = \"500ms\"\n");
        REQUIRE(sub_second.success);
        CHECK(sub_second.config.migration.timeout == 500ms);

        auto zero = ConfigLoader::load_from_string("[migration]\ntimeout = 0\n");
        REQUIRE_FALSE(zero.success);
        CHECK(zero.error_message.find("migration.timeout must be > 0, got 0ms") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: parse errors", "[config]") {
    clear_env();
    CHECK_FALSE(ConfigLoader::load_from_string("[store\nhost = 1").success);
    CHECK_FALSE(ConfigLoader::load_from_string("[store]\nbackoff_base = \"fast\"").success);
    CHECK_FALSE(ConfigLoader::load_from_string("[store]\nhost = \"${UNCLOSED\"").success);
    CHECK_FALSE(ConfigLoader::load_from_file("/nonexistent/ledger.toml").success);
}

TEST_CASE("ConfigLoader: shipped config file loads", "[config]") {
    clear_env();
    auto result = ConfigLoader::load_from_file("config/ledger.toml");
    REQUIRE(result.success);
    CHECK(result.config.store.database == "ledgerdb");
    CHECK(result.config.migration.applied_by == "ledger-service");
}

TEST_CASE("ConfigLoader: parse_duration", "[config]") {
    CHECK(ConfigLoader::parse_duration("250ms") == 250ms);
    CHECK(ConfigLoader::parse_duration("5s") == 5s);
    CHECK(ConfigLoader::parse_duration("2m") == 120s);
    CHECK(ConfigLoader::parse_duration("1h") == 3600s);
    CHECK(ConfigLoader::parse_duration("30") == 30s);
    CHECK_FALSE(ConfigLoader::parse_duration("").has_value());
    CHECK_FALSE(ConfigLoader::parse_duration("5 days").has_value());
    CHECK_FALSE(ConfigLoader::parse_duration("-5s").has_value());
}
