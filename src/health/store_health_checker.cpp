#include "health/store_health_checker.hpp"
#include "db/connection_manager.hpp"
#include "core/utils.hpp"

namespace ledgerstore {

DependencyHealth StoreHealthChecker::check(const Context& ctx) {
    if (manager_ != nullptr) {
        return manager_->check_health(ctx);
    }

    DependencyHealth dep;
    dep.name = ConnectionManager::kDependencyName;
    dep.type = DependencyType::DATABASE;
    dep.is_critical = true;
    dep.status = HealthStatus::UNHEALTHY;
    dep.message = "ImmuDB manager not initialized";
    dep.error = "Manager is nil";
    dep.last_check = utils::format_rfc3339(utils::now());
    return dep;
}

std::string StoreHealthChecker::name() const {
    return ConnectionManager::kDependencyName;
}

} // namespace ledgerstore
