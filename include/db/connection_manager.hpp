#pragma once

#include "config/config_types.hpp"
#include "core/context.hpp"
#include "core/error.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "health/dependency_health.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace ledgerstore {

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    DEGRADED        // transient, only inside check_health() while reconnecting
};

[[nodiscard]] std::string_view connection_state_to_string(ConnectionState state);

struct ConnectionStats {
    size_t active_connections = 0;
    size_t idle_connections = 0;
    size_t total_connections = 0;
    size_t max_connections = 0;
    int64_t error_count = 0;
    int64_t verified_tx_count = 0;
    std::string last_error;
    std::optional<std::chrono::system_clock::time_point> last_error_time;
};

/**
 * @brief Owns the session to the append-only store
 *
 * The session is a pool of authenticated connections. connect() builds a
 * fresh pool with exponential backoff and swaps it in only once it holds a
 * working connection; the previous pool is drained afterwards. Consumers
 * fetch the current pool through session() on every call, so a reconnect
 * is transparent to them.
 *
 * Thread-safety: readers (health, stats, session) take the shared lock;
 * pool swaps take it exclusively. Connects are serialized separately so a
 * slow handshake never blocks readers. The reconnect inside check_health()
 * waits for that serialization only until its own deadline.
 */
class ConnectionManager {
public:
    ConnectionManager(StoreConfig config, std::shared_ptr<IConnectionFactory> factory);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Open the session, retrying with exponential backoff
     * @return UNAVAILABLE after max_connect_attempts failures, or the
     *         context error when ctx finishes first
     */
    [[nodiscard]] VoidResult connect(const Context& ctx);

    /**
     * @brief Close the session if open (idempotent)
     */
    VoidResult disconnect(const Context& ctx);

    /**
     * @brief Liveness probe with one transparent reconnect on session loss
     */
    [[nodiscard]] DependencyHealth check_health(const Context& ctx);

    [[nodiscard]] ConnectionStats get_stats() const;

    /// Count one write confirmed by read-back; reported in the health message
    void record_verified_transaction();

    /**
     * @brief Current session; nullptr while disconnected
     */
    [[nodiscard]] std::shared_ptr<IConnectionPool> session() const;

    [[nodiscard]] ConnectionState state() const;

    /// Result of the most recent health check (true right after connect)
    [[nodiscard]] bool is_healthy() const;

    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> connected_at() const;
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> last_health_check() const;

    [[nodiscard]] const StoreConfig& config() const { return config_; }

    static constexpr const char* kDependencyName = "immudb-primary";

private:
    Result<std::shared_ptr<GenericConnectionPool>> open_pool(const Context& ctx);

    /// Swap a new pool in; the replaced pool (if any) is returned for draining
    std::shared_ptr<GenericConnectionPool> install(std::shared_ptr<GenericConnectionPool> pool);

    /**
     * @brief Single reconnect attempt used by check_health()
     * @param failed The pool whose session was found dead
     */
    VoidResult reconnect(const Context& ctx, const std::shared_ptr<GenericConnectionPool>& failed);

    /// Acquire + ping; empty string on success
    std::string ping(const std::shared_ptr<GenericConnectionPool>& pool, const Context& ctx);

    void record_error(const std::string& message);

    DependencyHealth base_report() const;

    StoreConfig config_;
    std::string conninfo_;
    std::shared_ptr<IConnectionFactory> factory_;

    mutable std::shared_mutex mutex_;
    std::timed_mutex connect_mutex_;

    std::shared_ptr<GenericConnectionPool> pool_;
    ConnectionState state_ = ConnectionState::DISCONNECTED;
    bool session_lost_ = false;   // dropped by a failed reconnect, not by disconnect()
    bool healthy_ = false;
    std::optional<std::chrono::system_clock::time_point> connect_time_;
    std::optional<std::chrono::system_clock::time_point> last_health_check_;
    std::optional<std::chrono::system_clock::time_point> last_success_;

    std::atomic<int64_t> error_count_{0};
    std::atomic<int64_t> verified_tx_count_{0};
    std::string last_error_;
    std::optional<std::chrono::system_clock::time_point> last_error_time_;
};

} // namespace ledgerstore
