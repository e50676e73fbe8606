#include "migration/migrate_cli.hpp"
#include "migration/migration_runner.hpp"
#include "config/config_loader.hpp"
#include "core/build_info.hpp"
#include "core/utils.hpp"
#include "db/connection_manager.hpp"

#include <format>
#include <ostream>

namespace ledgerstore {

namespace {

constexpr const char* kCommands[] = {"up", "status", "validate", "create", "version", "help"};

std::string format_time(const std::optional<utils::Timestamp>& ts) {
    if (!ts) return "-";
    return std::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::floor<std::chrono::seconds>(*ts));
}

void print_status(std::ostream& out, const MigrationStatus& status, const LedgerConfig& config) {
    const auto& mc = config.migration;

    out << "\nMigration Status for " << config.service.name << "\n";
    out << "====================================\n";
    out << std::format("Database: {} @ {}:{}\n",
        config.store.database, config.store.host, config.store.port);
    out << std::format("Tracking Table: {}\n", mc.ledger_table());
    out << std::format("Migration Path: {}\n", mc.migrations_path);

    if (!status.applied.empty()) {
        out << std::format("\nApplied Migrations ({}):\n", status.applied.size());
        for (const auto& m : status.applied) {
            out << std::format("  [x] {:<40} ({}, {}ms)\n",
                m.label(), format_time(m.executed_at), m.execution_time_ms);
        }
    } else {
        out << "\nNo applied migrations\n";
    }

    if (!status.pending.empty()) {
        out << std::format("\nPending Migrations ({}):\n", status.pending.size());
        for (const auto& m : status.pending) {
            out << std::format("  [ ] {}\n", m.label());
        }
    } else {
        out << "\nNo pending migrations\n";
    }

    if (!status.drifted.empty()) {
        out << std::format("\nModified Since Applied ({}):\n", status.drifted.size());
        for (const auto& d : status.drifted) {
            out << std::format("  [!] {:03d}_{} (recorded {}, now {})\n",
                d.version, d.name, d.recorded_checksum.substr(0, 12), d.current_checksum.substr(0, 12));
        }
    }

    out << "\nSummary:\n";
    out << std::format("  Service:  {}\n", mc.service_name);
    out << std::format("  Applied:  {}\n", status.applied.size());
    out << std::format("  Pending:  {}\n", status.pending.size());
    out << std::format("  Total:    {}\n", status.total);
    if (status.last_run) {
        out << std::format("  Last Run: {}\n", format_time(status.last_run));
    }
    out << std::format("  {}\n", status.summary());
}

int run_with_store(const MigrateOptions& opts, const Context& root, MigrationRunner& runner,
                   ConnectionManager& store, const LedgerConfig& config, std::ostream& out) {
    auto connected = store.connect(root);
    if (connected.is_error()) {
        utils::log::error(std::format("Failed to connect to ImmuDB: {}", connected.error_message()));
        return 1;
    }

    int rc = 0;
    if (opts.command == "up") {
        if (config.migration.dry_run) {
            utils::log::info("Running in DRY RUN mode - no changes will be made");
        }
        utils::log::info("Running database migrations...");
        auto report = runner.run(root);
        if (report.is_error()) {
            utils::log::error(std::format("Migration failed: {}", report.error_message()));
            rc = 1;
        } else if (report.value().dry_run) {
            out << std::format("{} migration(s) would be applied\n", report.value().planned.size());
            for (const auto& m : report.value().planned) {
                out << std::format("  [ ] {}\n", m.label());
            }
        } else {
            utils::log::info(std::format("Migrations completed successfully ({} applied)",
                report.value().executed.size()));
        }
    } else {
        auto status = runner.status(root);
        if (status.is_error()) {
            utils::log::error(std::format("Failed to get status: {}", status.error_message()));
            rc = 1;
        } else {
            print_status(out, status.value(), config);
        }
    }

    auto closed = store.disconnect(Context::background());
    if (closed.is_error()) {
        utils::log::warn(std::format("Error disconnecting from ImmuDB: {}", closed.error_message()));
    }
    return rc;
}

} // anonymous namespace

bool is_migrate_command(const std::string& command) {
    for (const char* known : kCommands) {
        if (command == known) return true;
    }
    return false;
}

void print_migrate_usage(std::ostream& out) {
    out <<
        "ledger-service database migration tool\n"
        "\n"
        "Usage:\n"
        "  ledger_migrate <command> [flags]\n"
        "\n"
        "Available Commands:\n"
        "  up          Run pending migrations\n"
        "  status      Show migration status\n"
        "  validate    Validate migration files\n"
        "  create      Create new migration file (create <name>)\n"
        "  version     Show migration tool version\n"
        "  help        Show this help\n"
        "\n"
        "Flags:\n"
        "  --config string      Config file path (TOML)\n"
        "  --dry-run            Show what would be executed\n"
        "  --migrations string  Migration files path (default \"./migrations\")\n"
        "  --service string     Service name (default \"ledger\")\n"
        "  --timeout duration   Per-migration timeout, e.g. 30s or 500ms (default 30s)\n"
        "  --verbose            Enable debug logging\n";
}

Result<MigrateOptions> parse_migrate_args(const std::vector<std::string>& args) {
    using R = Result<MigrateOptions>;
    if (args.empty()) {
        return R::error(ErrorCode::INVALID_ARGUMENT, "no command given");
    }

    MigrateOptions opts;
    opts.command = args.front();

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (!arg.starts_with("--")) {
            opts.args.push_back(arg);
            continue;
        }

        std::string flag = arg.substr(2);
        std::optional<std::string> inline_value;
        if (const auto eq = flag.find('='); eq != std::string::npos) {
            inline_value = flag.substr(eq + 1);
            flag.erase(eq);
        }

        if (flag == "verbose") {
            opts.verbose = true;
            continue;
        }
        if (flag == "dry-run") {
            if (!inline_value || *inline_value == "true") {
                opts.dry_run = true;
            } else if (*inline_value == "false") {
                opts.dry_run = false;
            } else {
                return R::error(ErrorCode::INVALID_ARGUMENT,
                    std::format("invalid --dry-run '{}'", *inline_value));
            }
            continue;
        }

        std::string value;
        if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < args.size()) {
            value = args[++i];
        } else {
            return R::error(ErrorCode::INVALID_ARGUMENT, std::format("flag --{} needs a value", flag));
        }

        if (flag == "config") {
            opts.config_file = value;
        } else if (flag == "migrations") {
            opts.migrations_path = value;
        } else if (flag == "service") {
            if (value.empty()) {
                return R::error(ErrorCode::INVALID_ARGUMENT, "--service must not be empty");
            }
            opts.service_name = value;
        } else if (flag == "timeout") {
            opts.timeout = ConfigLoader::parse_duration(value);
            if (!opts.timeout || opts.timeout->count() <= 0) {
                return R::error(ErrorCode::INVALID_ARGUMENT, std::format("invalid --timeout '{}'", value));
            }
        } else {
            return R::error(ErrorCode::INVALID_ARGUMENT, std::format("unknown flag --{}", flag));
        }
    }
    return R::ok(std::move(opts));
}

void apply_migrate_options(const MigrateOptions& opts, LedgerConfig& config) {
    if (opts.migrations_path) config.migration.migrations_path = *opts.migrations_path;
    if (opts.service_name) config.migration.service_name = *opts.service_name;
    if (opts.timeout) config.migration.timeout = *opts.timeout;
    if (opts.dry_run) config.migration.dry_run = *opts.dry_run;
}

int run_migrate(const std::vector<std::string>& args, const Context& root,
                std::shared_ptr<IConnectionFactory> factory,
                std::ostream& out, std::ostream& err) {
    auto parsed = parse_migrate_args(args);
    if (parsed.is_error()) {
        err << parsed.error_message() << "\n\n";
        print_migrate_usage(err);
        return 1;
    }
    const auto& opts = parsed.value();

    if (opts.command == "help" || opts.command == "--help" || opts.command == "-h") {
        print_migrate_usage(out);
        return 0;
    }
    if (opts.command == "version") {
        out << std::format("ledger-service migration tool {}\n", BuildInfo::current().summary());
        return 0;
    }
    if (!is_migrate_command(opts.command)) {
        err << std::format("Unknown command: {}\n\n", opts.command);
        print_migrate_usage(err);
        return 1;
    }

    try {
        auto loaded = opts.config_file ? ConfigLoader::load_from_file(*opts.config_file)
                                       : ConfigLoader::load_from_env();
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return 1;
        }
        LedgerConfig config = loaded.config;
        apply_migrate_options(opts, config);

        if (opts.verbose) {
            utils::log::set_level(utils::log::Level::DEBUG);
        } else if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        ConnectionManager store(config.store, std::move(factory));
        MigrationRunner runner(config.migration, [&store] { return store.session(); });

        if (opts.command == "validate") {
            utils::log::info("Validating migration files...");
            auto validated = runner.validate();
            if (validated.is_error()) {
                utils::log::error(std::format("Validation failed: {}", validated.error_message()));
                return 1;
            }
            utils::log::info(std::format("All {} migration files are valid", validated.value()));
            return 0;
        }

        if (opts.command == "create") {
            if (opts.args.empty()) {
                err << "Usage: ledger_migrate create <name>\n";
                return 1;
            }
            auto created = runner.create_migration(opts.args.front());
            if (created.is_error()) {
                utils::log::error(std::format("Failed to create migration: {}", created.error_message()));
                return 1;
            }
            out << created.value() << "\n";
            return 0;
        }

        return run_with_store(opts, root, runner, store, config, out);

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}

} // namespace ledgerstore
