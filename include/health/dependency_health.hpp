#pragma once

#include "core/context.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ledgerstore {

enum class HealthStatus {
    UNKNOWN,
    HEALTHY,
    DEGRADED,
    UNHEALTHY
};

enum class DependencyType {
    DATABASE,
    CACHE,
    SERVICE,
    OTHER
};

[[nodiscard]] std::string_view health_status_to_string(HealthStatus status);
[[nodiscard]] std::string_view dependency_type_to_string(DependencyType type);

struct ConnectionPoolInfo {
    size_t max_connections = 0;
    size_t active_connections = 0;
    size_t idle_connections = 0;
    size_t wait_count = 0;
};

struct DependencyConfig {
    std::string hostname;
    uint32_t port = 0;
    std::string protocol;
    std::string database_name;
    std::optional<ConnectionPoolInfo> pool_info;
};

/**
 * @brief Uniform health report for one external dependency
 *
 * Timestamps are RFC 3339 strings; last_success is empty until a check
 * has passed at least once.
 */
struct DependencyHealth {
    std::string name;
    DependencyType type = DependencyType::OTHER;
    bool is_critical = false;
    HealthStatus status = HealthStatus::UNKNOWN;
    std::string message;
    std::string error;
    DependencyConfig config;
    std::string last_success;
    std::string last_check;
    int64_t response_time_ms = 0;
};

[[nodiscard]] nlohmann::json to_json(const DependencyHealth& health);

/**
 * @brief Roll up dependency reports into one service status
 *
 * UNHEALTHY if a critical dependency is UNHEALTHY, DEGRADED if anything
 * else is not HEALTHY.
 */
[[nodiscard]] HealthStatus overall_status(const std::vector<DependencyHealth>& reports);

/**
 * @brief Health probe for one dependency
 */
class IDependencyChecker {
public:
    virtual ~IDependencyChecker() = default;

    [[nodiscard]] virtual DependencyHealth check(const Context& ctx) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace ledgerstore
