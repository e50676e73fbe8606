#include <catch2/catch_test_macros.hpp>
#include "migration/migrate_cli.hpp"
#include "mocks/fake_store.hpp"
#include "mocks/temp_dir.hpp"

#include <filesystem>
#include <sstream>

using namespace ledgerstore;
using namespace ledgerstore::testing;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

constexpr const char* kAccounts =
    "-- Migration: 001_create_accounts\n"
    "CREATE TABLE IF NOT EXISTS accounts (\n"
    "    id VARCHAR[36],\n"
    "    name VARCHAR[255],\n"
    "    PRIMARY KEY (id)\n"
    ");\n";

constexpr const char* kCurrencies =
    "-- Migration: 002_create_currencies\n"
    "CREATE TABLE IF NOT EXISTS currencies (code VARCHAR[3], PRIMARY KEY (code));\n";

struct CliFixture {
    TempDir dir;
    TempDir migrations;
    std::shared_ptr<FakeStore> store = std::make_shared<FakeStore>();
    std::ostringstream out;
    std::ostringstream err;

    CliFixture() {
        dir.write("ledger.toml",
            "[store]\n"
            "max_connect_attempts = 1\n"
            "backoff_base = \"5ms\"\n"
            "acquire_timeout = \"200ms\"\n");
        migrations.write("001_create_accounts.sql", kAccounts);
        migrations.write("002_create_currencies.sql", kCurrencies);
    }

    int run(std::vector<std::string> args) {
        args.push_back("--config");
        args.push_back((dir.path() / "ledger.toml").string());
        args.push_back("--migrations=" + migrations.path().string());
        return run_migrate(args, Context::background(), std::make_shared<FakeConnectionFactory>(store), out, err);
    }
};

} // anonymous namespace

TEST_CASE("parse_migrate_args: flags and values", "[migrate_cli]") {
    SECTION("both flag forms") {
        auto parsed = parse_migrate_args({"up", "--config", "a.toml", "--service=billing", "--verbose"});
        REQUIRE(parsed.is_ok());
        const auto& opts = parsed.value();
        CHECK(opts.command == "up");
        CHECK(opts.config_file == "a.toml");
        CHECK(opts.service_name == "billing");
        CHECK(opts.verbose);
        CHECK_FALSE(opts.dry_run.has_value());
        CHECK_FALSE(opts.timeout.has_value());
    }

    SECTION("positional arguments are kept in order") {
        auto parsed = parse_migrate_args({"create", "add_ledger", "--dry-run", "extra"});
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().args == std::vector<std::string>{"add_ledger", "extra"});
        CHECK(parsed.value().dry_run == true);
    }

    SECTION("sub-second timeout is kept") {
        auto parsed = parse_migrate_args({"up", "--timeout", "500ms"});
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().timeout == 500ms);
    }

    SECTION("explicit dry-run=false") {
        auto parsed = parse_migrate_args({"up", "--dry-run=false"});
        REQUIRE(parsed.is_ok());
        CHECK(parsed.value().dry_run == false);
    }

    SECTION("rejections") {
        auto none = parse_migrate_args({});
        REQUIRE(none.is_error());
        CHECK(none.error_code() == ErrorCode::INVALID_ARGUMENT);

        auto unknown = parse_migrate_args({"up", "--force"});
        REQUIRE(unknown.is_error());
        CHECK(unknown.error_message() == "unknown flag --force");

        auto missing = parse_migrate_args({"up", "--config"});
        REQUIRE(missing.is_error());
        CHECK(missing.error_message() == "flag --config needs a value");

        CHECK(parse_migrate_args({"up", "--timeout", "0s"}).is_error());
        CHECK(parse_migrate_args({"up", "--timeout=fast"}).is_error());
        CHECK(parse_migrate_args({"up", "--dry-run=maybe"}).is_error());
        CHECK(parse_migrate_args({"up", "--service="}).is_error());
    }
}

TEST_CASE("apply_migrate_options: only given flags override", "[migrate_cli]") {
    LedgerConfig config;
    config.migration.dry_run = true;
    config.migration.timeout = 30s;
    config.migration.service_name = "ledger";

    SECTION("absent flags keep the file values") {
        auto parsed = parse_migrate_args({"up"});
        REQUIRE(parsed.is_ok());
        apply_migrate_options(parsed.value(), config);
        CHECK(config.migration.dry_run);
        CHECK(config.migration.timeout == 30s);
        CHECK(config.migration.service_name == "ledger");
    }

    SECTION("given flags win") {
        auto parsed = parse_migrate_args({"up", "--dry-run=false", "--timeout=500ms", "--service", "billing"});
        REQUIRE(parsed.is_ok());
        apply_migrate_options(parsed.value(), config);
        CHECK_FALSE(config.migration.dry_run);
        CHECK(config.migration.timeout == 500ms);
        CHECK(config.migration.service_name == "billing");
    }
}

TEST_CASE("run_migrate: exit codes", "[migrate_cli]") {
    CliFixture f;

    SECTION("no arguments") {
        CHECK(run_migrate({}, Context::background(), std::make_shared<FakeConnectionFactory>(f.store), f.out, f.err) == 1);
        CHECK(f.err.str().find("Usage:") != std::string::npos);
    }

    SECTION("help and version") {
        CHECK(f.run({"help"}) == 0);
        CHECK(f.out.str().find("Available Commands:") != std::string::npos);
        CHECK(f.run({"version"}) == 0);
        CHECK(f.out.str().find("migration tool") != std::string::npos);
    }

    SECTION("unknown command") {
        CHECK(f.run({"rollback"}) == 1);
        CHECK(f.err.str().find("Unknown command: rollback") != std::string::npos);
    }

    SECTION("bad flag prints usage") {
        CHECK(f.run({"up", "--timeout", "0s"}) == 1);
        CHECK(f.err.str().find("invalid --timeout '0s'") != std::string::npos);
        CHECK(f.store->connect_attempts() == 0);
    }

    SECTION("validate works offline") {
        CHECK(f.run({"validate"}) == 0);
        f.migrations.write("003_drop_accounts.sql", "DROP TABLE accounts;\n");
        CHECK(f.run({"validate"}) == 1);
        CHECK(f.store->connect_attempts() == 0);
    }

    SECTION("create writes the next file") {
        CHECK(f.run({"create", "add_journal"}) == 0);
        CHECK(fs::exists(f.migrations.path() / "003_add_journal.sql"));
        CHECK(f.run({"create"}) == 1);
        CHECK(f.err.str().find("create <name>") != std::string::npos);
    }

    SECTION("up applies, status reports") {
        CHECK(f.run({"up"}) == 0);
        CHECK(f.store->has_table("accounts"));
        CHECK(f.store->has_table("currencies"));

        CHECK(f.run({"status"}) == 0);
        CHECK(f.out.str().find("All 2 migrations applied") != std::string::npos);
    }

    SECTION("dry run lists without applying") {
        CHECK(f.run({"up", "--dry-run"}) == 0);
        CHECK_FALSE(f.store->has_table("accounts"));
        CHECK(f.out.str().find("2 migration(s) would be applied") != std::string::npos);
    }

    SECTION("unreachable store") {
        f.store->refuse_connections(true);
        CHECK(f.run({"up"}) == 1);
        CHECK(f.run({"status"}) == 1);
    }

    SECTION("missing config file") {
        std::vector<std::string> args{"up", "--config", (f.dir.path() / "absent.toml").string()};
        CHECK(run_migrate(args, Context::background(), std::make_shared<FakeConnectionFactory>(f.store), f.out, f.err) == 1);
    }
}
