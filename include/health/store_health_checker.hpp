#pragma once

#include "health/dependency_health.hpp"

namespace ledgerstore {

class ConnectionManager;

/**
 * @brief Health probe over the store session
 *
 * Delegates to ConnectionManager::check_health(), which reconnects once on
 * session loss. The manager is not owned and may be null when the service
 * booted without one.
 */
class StoreHealthChecker : public IDependencyChecker {
public:
    explicit StoreHealthChecker(ConnectionManager* manager) : manager_(manager) {}

    [[nodiscard]] DependencyHealth check(const Context& ctx) override;

    [[nodiscard]] std::string name() const override;

private:
    ConnectionManager* manager_;
};

} // namespace ledgerstore
