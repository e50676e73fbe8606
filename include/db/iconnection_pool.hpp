#pragma once

#include "core/context.hpp"
#include "core/error.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace ledgerstore {

// Forward declarations
class PooledConnection;

/**
 * @brief Pool configuration
 */
struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 10;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds idle_timeout{300000};
    std::chrono::seconds max_lifetime{3600};  // 0 = disabled
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t max_connections = 0;
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
};

/**
 * @brief Abstract connection pool interface
 *
 * This is the session handle the repository layer queries through.
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Acquire connection from pool (blocking, bounded by ctx and acquire_timeout)
     * @return RAII connection handle, or UNAVAILABLE on timeout/connect failure
     */
    [[nodiscard]] virtual Result<std::unique_ptr<PooledConnection>> acquire(const Context& ctx) = 0;

    /**
     * @brief Get pool statistics (thread-safe)
     */
    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Drain pool - close all idle connections, refuse further acquires
     */
    virtual void drain() = 0;

    /**
     * @brief Get database name this pool serves
     */
    [[nodiscard]] virtual const std::string& name() const = 0;
};

/**
 * @brief Returns the current session, or nullptr when storage is unavailable
 *
 * Looked up on every call so consumers follow reconnects.
 */
using SessionProvider = std::function<std::shared_ptr<IConnectionPool>()>;

} // namespace ledgerstore
