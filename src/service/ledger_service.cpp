#include "service/ledger_service.hpp"
#include "core/utils.hpp"

#include <format>

namespace ledgerstore {

LedgerService::LedgerService(LedgerConfig config, BuildInfo build,
                             std::shared_ptr<IConnectionFactory> factory)
    : config_(std::move(config)),
      build_(std::move(build)),
      store_(std::make_unique<ConnectionManager>(config_.store, std::move(factory))) {
    ConnectionManager* store = store_.get();
    migrations_ = std::make_unique<MigrationRunner>(config_.migration,
        [store] { return store->session(); });

    checkers_.push_back(std::make_unique<StoreHealthChecker>(store));
    checkers_.push_back(std::make_unique<MigrationHealthChecker>(*migrations_, config_.migration.run_on_boot));
}

LedgerService::~LedgerService() {
    shutdown(Context::background());
}

VoidResult LedgerService::start(const Context& ctx) {
    utils::log::info(std::format("[2/{}] Connecting to ImmuDB at {}:{}/{}",
        kBootSteps, config_.store.host, config_.store.port, config_.store.database));

    auto connected = store_->connect(ctx);
    storage_available_ = connected.is_ok();
    if (!storage_available_) {
        utils::log::error(std::format("Failed to connect to ImmuDB: {}", connected.error_message()));
        utils::log::warn("Service will continue without ImmuDB functionality");
    }

    utils::log::info(std::format("[3/{}] Migrations: {} (path={}, table={})", kBootSteps,
        config_.migration.run_on_boot ? "run on boot" : "manual",
        config_.migration.migrations_path, config_.migration.ledger_table()));

    if (config_.migration.run_on_boot) {
        if (!storage_available_) {
            utils::log::warn("Skipping migrations on boot: storage unavailable");
        } else {
            auto report = migrations_->run(ctx);
            if (report.is_error()) {
                return VoidResult::error(report.error_code(),
                    std::format("failed to run migrations on boot: {}", report.error_message()));
            }
            utils::log::info(std::format("Migrations on boot: {} executed",
                report.value().executed.size()));
        }
    } else if (storage_available_) {
        auto status = migrations_->status(ctx);
        if (status.is_ok()) {
            utils::log::info(std::format("Migration status: {}", status.value().summary()));
        } else {
            utils::log::warn(std::format("Failed to check migration status: {}", status.error_message()));
        }
    }

    utils::log::info(std::format("[4/{}] Account repository: {}", kBootSteps,
        storage_available_ ? "enabled" : "disabled (storage unavailable)"));
    if (storage_available_) {
        ConnectionManager* store = store_.get();
        WriteVerifiedHook on_verified;
        if (store->config().verify_transactions) {
            on_verified = [store] { store->record_verified_transaction(); };
        }
        accounts_ = std::make_unique<AccountRepository>(
            [store] { return store->session(); }, "accounts", std::move(on_verified));
    }
    return VoidResult::ok();
}

void LedgerService::shutdown(const Context& ctx) {
    accounts_.reset();
    if (store_) {
        auto closed = store_->disconnect(ctx);
        if (closed.is_error()) {
            utils::log::warn(std::format("Error disconnecting from ImmuDB: {}", closed.error_message()));
        }
    }
}

std::vector<DependencyHealth> LedgerService::check_health(const Context& ctx) {
    std::vector<DependencyHealth> reports;
    reports.reserve(checkers_.size());
    for (const auto& checker : checkers_) {
        reports.push_back(checker->check(ctx));
    }
    return reports;
}

void LedgerService::log_health(const Context& ctx) {
    const auto reports = check_health(ctx);
    for (const auto& r : reports) {
        const auto line = std::format("Health {}: {} - {}", r.name, health_status_to_string(r.status), r.message);
        if (r.status == HealthStatus::HEALTHY) {
            utils::log::debug(line);
        } else {
            utils::log::warn(r.error.empty() ? line : std::format("{} ({})", line, r.error));
        }
    }
    utils::log::info(std::format("Overall health: {}", health_status_to_string(overall_status(reports))));
}

} // namespace ledgerstore
