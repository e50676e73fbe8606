#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace ledgerstore {

/**
 * @brief Bounded pool of store sessions sharing one address/credentials/database
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore (C++20)
 * - Lazy growth: connections created on demand up to max; warm_up() opens
 *   min_connections eagerly and reports the first failure
 * - Idle validation: sessions idle longer than idle_timeout are pinged
 *   before being handed out
 * - RAII: PooledConnection auto-returns on destruction. The return path
 *   holds a weak reference, so a pool replaced during reconnect can be
 *   released while leases are still out; those sessions are closed.
 *
 * Must be owned by std::shared_ptr (use create()).
 */
class GenericConnectionPool : public IConnectionPool,
                              public std::enable_shared_from_this<GenericConnectionPool> {
public:
    static std::shared_ptr<GenericConnectionPool> create(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    /**
     * @brief Open min_connections sessions (at least one)
     * @return First connect error, if any
     */
    [[nodiscard]] VoidResult warm_up(const Context& ctx);

    Result<std::unique_ptr<PooledConnection>> acquire(const Context& ctx) override;

    PoolStats get_stats() const override;

    void drain() override;

    const std::string& name() const override { return db_name_; }

private:
    GenericConnectionPool(
        std::string db_name,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    struct ConnTimes {
        std::chrono::steady_clock::time_point created;
        std::chrono::steady_clock::time_point last_used;
    };

    Result<std::unique_ptr<IDbConnection>> create_connection(const Context& ctx);

    /// Close and forget a connection that is leaving the pool for good
    void discard(std::unique_ptr<IDbConnection> conn);

    /**
     * @brief Return connection to pool (called by PooledConnection destructor)
     */
    void return_connection(std::unique_ptr<IDbConnection> conn);

    std::string db_name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    // Connection storage
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_map<IDbConnection*, ConnTimes> times_;
    mutable std::mutex mutex_;

    // Semaphore for bounded pool (C++20)
    std::counting_semaphore<> semaphore_;

    // Statistics (atomic for lock-free reads)
    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> total_releases_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    // Shutdown flag
    std::atomic<bool> shutdown_{false};
};

} // namespace ledgerstore
