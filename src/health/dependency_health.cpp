#include "health/dependency_health.hpp"

namespace ledgerstore {

std::string_view health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::UNKNOWN:   return "UNKNOWN";
        case HealthStatus::HEALTHY:   return "HEALTHY";
        case HealthStatus::DEGRADED:  return "DEGRADED";
        case HealthStatus::UNHEALTHY: return "UNHEALTHY";
    }
    return "UNKNOWN";
}

std::string_view dependency_type_to_string(DependencyType type) {
    switch (type) {
        case DependencyType::DATABASE: return "DATABASE";
        case DependencyType::CACHE:    return "CACHE";
        case DependencyType::SERVICE:  return "SERVICE";
        case DependencyType::OTHER:    return "OTHER";
    }
    return "OTHER";
}

nlohmann::json to_json(const DependencyHealth& health) {
    nlohmann::json config = {
        {"hostname", health.config.hostname},
        {"port", health.config.port},
        {"protocol", health.config.protocol},
        {"database_name", health.config.database_name}
    };
    if (health.config.pool_info) {
        const auto& pool = *health.config.pool_info;
        config["pool_info"] = {
            {"max_connections", pool.max_connections},
            {"active_connections", pool.active_connections},
            {"idle_connections", pool.idle_connections},
            {"wait_count", pool.wait_count}
        };
    }

    nlohmann::json j = {
        {"name", health.name},
        {"type", std::string(dependency_type_to_string(health.type))},
        {"is_critical", health.is_critical},
        {"status", std::string(health_status_to_string(health.status))},
        {"message", health.message},
        {"config", std::move(config)},
        {"last_check", health.last_check},
        {"response_time_ms", health.response_time_ms}
    };
    if (!health.error.empty()) {
        j["error"] = health.error;
    }
    if (!health.last_success.empty()) {
        j["last_success"] = health.last_success;
    }
    return j;
}

HealthStatus overall_status(const std::vector<DependencyHealth>& reports) {
    HealthStatus overall = HealthStatus::HEALTHY;
    for (const auto& r : reports) {
        if (r.status == HealthStatus::HEALTHY) continue;
        if (r.is_critical && r.status == HealthStatus::UNHEALTHY) {
            return HealthStatus::UNHEALTHY;
        }
        overall = HealthStatus::DEGRADED;
    }
    return overall;
}

} // namespace ledgerstore
