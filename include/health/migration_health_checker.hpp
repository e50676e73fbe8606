#pragma once

#include "health/dependency_health.hpp"

#include <string>

namespace ledgerstore {

class MigrationRunner;

/**
 * @brief Reports whether the schema is at the expected version
 *
 * HEALTHY when nothing is pending, or when pending scripts will be applied
 * on boot. DEGRADED when a manual run is required or status cannot be
 * read. Never critical: a stale schema does not take the service down.
 */
class MigrationHealthChecker : public IDependencyChecker {
public:
    MigrationHealthChecker(MigrationRunner& runner, bool run_on_boot)
        : runner_(runner), run_on_boot_(run_on_boot) {}

    [[nodiscard]] DependencyHealth check(const Context& ctx) override;

    [[nodiscard]] std::string name() const override { return kName; }

    static constexpr const char* kName = "database-migrations";

    /// Pending/recent listings shown after the counts
    static constexpr size_t kMaxPendingListed = 3;
    static constexpr size_t kMaxRecentListed = 2;

private:
    MigrationRunner& runner_;
    bool run_on_boot_;
};

} // namespace ledgerstore
