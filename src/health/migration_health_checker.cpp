#include "health/migration_health_checker.hpp"
#include "migration/migration_runner.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <vector>

namespace ledgerstore {

DependencyHealth MigrationHealthChecker::check(const Context& ctx) {
    utils::Timer timer;

    DependencyHealth dep;
    dep.name = kName;
    dep.type = DependencyType::DATABASE;
    dep.is_critical = false;
    dep.config.hostname = runner_.config().ledger_table();
    dep.config.protocol = "immudb-sql";
    dep.config.database_name = "migrations";

    auto result = runner_.status(ctx);
    const auto now = utils::now();
    dep.last_check = utils::format_rfc3339(now);

    if (result.is_error()) {
        dep.status = HealthStatus::DEGRADED;
        dep.message = std::format("Failed to check migration status: {}", result.error_message());
        dep.error = result.error_message();
        dep.response_time_ms = timer.elapsed_ms().count();
        return dep;
    }

    const auto& status = result.value();
    std::string message = std::format("Applied: {}, Pending: {}, Total: {}",
        status.applied.size(), status.pending.size(), status.total);

    if (status.pending.empty()) {
        dep.status = HealthStatus::HEALTHY;
        message = "All migrations applied. " + message;
    } else if (run_on_boot_) {
        dep.status = HealthStatus::HEALTHY;
        message = "Auto-migration enabled. " + message;
    } else {
        dep.status = HealthStatus::DEGRADED;
        message = "Manual migration required. " + message;
    }

    std::vector<std::string> details;
    if (!status.pending.empty()) {
        std::string pending = "Pending: ";
        const size_t shown = std::min(status.pending.size(), kMaxPendingListed);
        for (size_t i = 0; i < shown; ++i) {
            if (i > 0) pending += ", ";
            pending += status.pending[i].label();
        }
        if (status.pending.size() > shown) {
            pending += std::format(", ... and {} more", status.pending.size() - shown);
        }
        details.push_back(std::move(pending));
    }
    if (!status.applied.empty()) {
        std::string recent = "Recent: ";
        const size_t first = status.applied.size() > kMaxRecentListed
            ? status.applied.size() - kMaxRecentListed : 0;
        for (size_t i = first; i < status.applied.size(); ++i) {
            if (i > first) recent += ", ";
            recent += status.applied[i].label();
        }
        details.push_back(std::move(recent));
    }
    for (const auto& d : details) {
        message += " | ";
        message += d;
    }
    dep.message = std::move(message);

    if (status.last_run) {
        dep.last_success = utils::format_rfc3339(
            std::chrono::time_point_cast<std::chrono::system_clock::duration>(*status.last_run));
    }
    dep.response_time_ms = timer.elapsed_ms().count();
    return dep;
}

} // namespace ledgerstore
