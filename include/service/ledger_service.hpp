#pragma once

#include "account/account_repository.hpp"
#include "config/config_types.hpp"
#include "core/build_info.hpp"
#include "core/context.hpp"
#include "core/error.hpp"
#include "db/connection_manager.hpp"
#include "db/iconnection_factory.hpp"
#include "health/migration_health_checker.hpp"
#include "health/store_health_checker.hpp"
#include "migration/migration_runner.hpp"

#include <memory>
#include <vector>

namespace ledgerstore {

/**
 * @brief Wires the store session, migrations, repository and health probes
 *
 * Boot order: connect (storage-degraded on failure), migrations on boot
 * (fatal on failure), then the account repository if storage is up.
 */
class LedgerService {
public:
    LedgerService(LedgerConfig config, BuildInfo build, std::shared_ptr<IConnectionFactory> factory);
    ~LedgerService();

    LedgerService(const LedgerService&) = delete;
    LedgerService& operator=(const LedgerService&) = delete;

    /**
     * @brief Run the boot sequence
     * @return Error only for failures that must stop the process
     */
    [[nodiscard]] VoidResult start(const Context& ctx);

    /// Disconnect from the store; safe to call more than once
    void shutdown(const Context& ctx);

    /// Store and migration reports, in that order
    [[nodiscard]] std::vector<DependencyHealth> check_health(const Context& ctx);

    /// Log one line per dependency plus the overall status
    void log_health(const Context& ctx);

    /// nullptr while running storage-degraded
    [[nodiscard]] IAccountRepository* accounts() const { return accounts_.get(); }

    [[nodiscard]] bool storage_available() const { return storage_available_; }

    [[nodiscard]] ConnectionManager& store() { return *store_; }
    [[nodiscard]] MigrationRunner& migrations() { return *migrations_; }
    [[nodiscard]] const BuildInfo& build() const { return build_; }

    static constexpr int kBootSteps = 4;

private:
    LedgerConfig config_;
    BuildInfo build_;

    std::unique_ptr<ConnectionManager> store_;
    std::unique_ptr<MigrationRunner> migrations_;
    std::unique_ptr<AccountRepository> accounts_;

    std::vector<std::unique_ptr<IDependencyChecker>> checkers_;
    bool storage_available_ = false;
};

} // namespace ledgerstore
