#include "db/connection_manager.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "db/store_error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace ledgerstore {

std::string_view connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING:   return "CONNECTING";
        case ConnectionState::CONNECTED:    return "CONNECTED";
        case ConnectionState::DEGRADED:     return "DEGRADED";
    }
    return "DISCONNECTED";
}

ConnectionManager::ConnectionManager(StoreConfig config, std::shared_ptr<IConnectionFactory> factory)
    : config_(std::move(config)),
      conninfo_(PgConnectionFactory::build_conninfo(config_)),
      factory_(std::move(factory)) {}

ConnectionManager::~ConnectionManager() {
    std::shared_ptr<GenericConnectionPool> old;
    {
        std::unique_lock lock(mutex_);
        old = std::move(pool_);
    }
    if (old) old->drain();
}

// ============================================================================
// connect / disconnect
// ============================================================================

VoidResult ConnectionManager::connect(const Context& ctx) {
    std::lock_guard connect_lock(connect_mutex_);

    ConnectionState prior_state;
    {
        std::unique_lock lock(mutex_);
        prior_state = state_;
        state_ = ConnectionState::CONNECTING;
    }

    auto restore_state = [this, prior_state] {
        std::unique_lock lock(mutex_);
        state_ = pool_ ? prior_state : ConnectionState::DISCONNECTED;
    };

    const int max_attempts = std::max(config_.max_connect_attempts, 1);
    std::string last_error;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (attempt > 1) {
            const auto delay = config_.backoff_base * (int64_t{1} << (attempt - 2));
            utils::log::info(std::format("Retrying ImmuDB connection in {}ms (attempt {}/{})",
                delay.count(), attempt, max_attempts));
            if (!ctx.sleep_for(delay)) {
                restore_state();
                return ctx.err();
            }
        }

        auto pool = open_pool(ctx);
        if (pool.is_ok()) {
            auto old = install(std::move(pool.value()));
            if (old) old->drain();
            utils::log::info(std::format("Successfully connected to ImmuDB at {}:{}/{}",
                config_.host, config_.port, config_.database));
            return VoidResult::ok();
        }

        last_error = pool.error_message();
        error_count_.fetch_add(1, std::memory_order_relaxed);
        record_error(last_error);
        utils::log::warn(std::format("Failed to connect to ImmuDB (attempt {}/{}): {}",
            attempt, max_attempts, last_error));

        if (ctx.done()) {
            restore_state();
            return ctx.err();
        }
    }

    restore_state();
    return VoidResult::error(ErrorCode::UNAVAILABLE,
        std::format("failed to connect to ImmuDB after {} attempts: {}", max_attempts, last_error));
}

VoidResult ConnectionManager::disconnect(const Context& /*ctx*/) {
    std::lock_guard connect_lock(connect_mutex_);

    std::shared_ptr<GenericConnectionPool> old;
    {
        std::unique_lock lock(mutex_);
        old = std::move(pool_);
        state_ = ConnectionState::DISCONNECTED;
        session_lost_ = false;
        healthy_ = false;
    }

    if (old) {
        old->drain();
        utils::log::info("Disconnected from ImmuDB");
    }
    return VoidResult::ok();
}

Result<std::shared_ptr<GenericConnectionPool>> ConnectionManager::open_pool(const Context& ctx) {
    PoolConfig pool_config;
    pool_config.connection_string = conninfo_;
    pool_config.min_connections = static_cast<size_t>(std::max<int64_t>(config_.min_connections, 0));
    pool_config.max_connections = static_cast<size_t>(std::max<int64_t>(config_.max_connections, 1));
    pool_config.acquire_timeout = config_.acquire_timeout;

    auto pool = GenericConnectionPool::create(config_.database, pool_config, factory_);
    if (auto warm = pool->warm_up(ctx); warm.is_error()) {
        pool->drain();
        return Result<std::shared_ptr<GenericConnectionPool>>::error(warm);
    }
    return Result<std::shared_ptr<GenericConnectionPool>>::ok(std::move(pool));
}

std::shared_ptr<GenericConnectionPool> ConnectionManager::install(std::shared_ptr<GenericConnectionPool> pool) {
    std::unique_lock lock(mutex_);
    auto old = std::move(pool_);
    pool_ = std::move(pool);
    state_ = ConnectionState::CONNECTED;
    session_lost_ = false;
    healthy_ = true;
    connect_time_ = utils::now();
    error_count_.store(0, std::memory_order_relaxed);
    return old;
}

VoidResult ConnectionManager::reconnect(const Context& ctx, const std::shared_ptr<GenericConnectionPool>& failed) {
    std::unique_lock connect_lock(connect_mutex_, std::defer_lock);
    if (ctx.deadline()) {
        connect_lock.try_lock_for(ctx.remaining());
    } else {
        connect_lock.lock();
    }
    if (!connect_lock.owns_lock() || ctx.is_cancelled()) {
        std::unique_lock lock(mutex_);
        if (state_ == ConnectionState::DEGRADED) state_ = ConnectionState::CONNECTED;
        return VoidResult::error(ErrorCode::UNAVAILABLE,
            "timed out waiting for an in-flight connect");
    }

    // Another caller may have replaced the session while we waited
    {
        std::shared_lock lock(mutex_);
        if (pool_ && pool_ != failed) {
            return VoidResult::ok();
        }
    }

    auto pool = open_pool(ctx);
    if (pool.is_ok()) {
        auto old = install(std::move(pool.value()));
        if (old) old->drain();
        utils::log::info(std::format("Reconnected to ImmuDB at {}:{}/{}",
            config_.host, config_.port, config_.database));
        return VoidResult::ok();
    }

    std::shared_ptr<GenericConnectionPool> dropped;
    {
        std::unique_lock lock(mutex_);
        if (pool_ == failed) {
            dropped = std::move(pool_);
            state_ = ConnectionState::DISCONNECTED;
            session_lost_ = true;
        }
    }
    if (dropped) dropped->drain();
    return VoidResult::error(pool);
}

// ============================================================================
// Health
// ============================================================================

std::string ConnectionManager::ping(const std::shared_ptr<GenericConnectionPool>& pool, const Context& ctx) {
    auto conn = pool->acquire(ctx);
    if (conn.is_error()) {
        return conn.error_message();
    }
    auto& lease = *conn.value();
    const auto rs = lease->ping(ctx);
    if (rs.success) {
        return "";
    }
    if (is_session_error(rs.error_message)) {
        lease.invalidate();
    }
    return rs.error_message.empty() ? "ping failed" : rs.error_message;
}

DependencyHealth ConnectionManager::base_report() const {
    DependencyHealth dep;
    dep.name = kDependencyName;
    dep.type = DependencyType::DATABASE;
    dep.is_critical = true;
    dep.config.hostname = config_.host;
    dep.config.port = config_.port;
    dep.config.protocol = "pgsql";
    dep.config.database_name = config_.database;
    return dep;
}

DependencyHealth ConnectionManager::check_health(const Context& ctx) {
    utils::Timer timer;
    DependencyHealth dep = base_report();

    std::shared_ptr<GenericConnectionPool> pool;
    bool lost = false;
    {
        std::shared_lock lock(mutex_);
        pool = pool_;
        lost = session_lost_;
    }

    if (!pool && !lost) {
        dep.status = HealthStatus::UNHEALTHY;
        dep.message = "ImmuDB not connected";
        dep.error = "Connection not established";
        dep.response_time_ms = timer.elapsed_ms().count();
        dep.last_check = utils::format_rfc3339(utils::now());
        std::shared_lock lock(mutex_);
        if (last_success_) dep.last_success = utils::format_rfc3339(*last_success_);
        return dep;
    }

    std::string error = pool ? ping(pool, ctx.with_timeout(config_.ping_timeout))
                             : std::string("session lost");

    if (!error.empty() && (!pool || is_session_error(error))) {
        {
            std::unique_lock lock(mutex_);
            if (pool_ == pool && state_ == ConnectionState::CONNECTED) state_ = ConnectionState::DEGRADED;
        }
        utils::log::warn(std::format("ImmuDB session lost ({}), attempting to reconnect...", error));

        auto reconnected = reconnect(ctx.with_timeout(config_.reconnect_timeout), pool);
        if (reconnected.is_ok()) {
            std::shared_ptr<GenericConnectionPool> current;
            {
                std::shared_lock lock(mutex_);
                current = pool_;
            }
            error = current ? ping(current, ctx.with_timeout(config_.ping_timeout))
                            : std::string("session lost");
        } else {
            error = std::format("reconnection failed: {}", reconnected.error_message());
        }
    }

    const auto now = utils::now();

    if (!error.empty()) {
        dep.status = HealthStatus::UNHEALTHY;
        dep.message = "ImmuDB health check failed";
        dep.error = error;
        error_count_.fetch_add(1, std::memory_order_relaxed);
        record_error(error);
        utils::log::warn(std::format("ImmuDB health check failed: {}", error));
    } else {
        dep.status = HealthStatus::HEALTHY;
        dep.message = std::format("ImmuDB healthy, verified txs: {}",
            verified_tx_count_.load(std::memory_order_relaxed));
        const auto stats = get_stats();
        dep.config.pool_info = ConnectionPoolInfo{
            stats.max_connections, stats.active_connections, stats.idle_connections, 0};
    }

    {
        std::unique_lock lock(mutex_);
        last_health_check_ = now;
        healthy_ = error.empty();
        if (healthy_) last_success_ = now;
        if (last_success_) dep.last_success = utils::format_rfc3339(*last_success_);
    }

    dep.response_time_ms = timer.elapsed_ms().count();
    dep.last_check = utils::format_rfc3339(now);
    return dep;
}

// ============================================================================
// Accessors
// ============================================================================

void ConnectionManager::record_error(const std::string& message) {
    std::unique_lock lock(mutex_);
    last_error_ = message;
    last_error_time_ = utils::now();
}

void ConnectionManager::record_verified_transaction() {
    verified_tx_count_.fetch_add(1, std::memory_order_relaxed);
}

ConnectionStats ConnectionManager::get_stats() const {
    std::shared_lock lock(mutex_);

    ConnectionStats stats;
    stats.max_connections = static_cast<size_t>(std::max<int64_t>(config_.max_connections, 0));
    if (pool_) {
        const auto pool_stats = pool_->get_stats();
        stats.active_connections = pool_stats.active_connections;
        stats.idle_connections = pool_stats.idle_connections;
        stats.total_connections = pool_stats.total_connections;
    }
    stats.error_count = error_count_.load(std::memory_order_relaxed);
    stats.verified_tx_count = verified_tx_count_.load(std::memory_order_relaxed);
    stats.last_error = last_error_;
    stats.last_error_time = last_error_time_;
    return stats;
}

std::shared_ptr<IConnectionPool> ConnectionManager::session() const {
    std::shared_lock lock(mutex_);
    return pool_;
}

ConnectionState ConnectionManager::state() const {
    std::shared_lock lock(mutex_);
    return state_;
}

bool ConnectionManager::is_healthy() const {
    std::shared_lock lock(mutex_);
    return healthy_;
}

std::optional<std::chrono::system_clock::time_point> ConnectionManager::connected_at() const {
    std::shared_lock lock(mutex_);
    return connect_time_;
}

std::optional<std::chrono::system_clock::time_point> ConnectionManager::last_health_check() const {
    std::shared_lock lock(mutex_);
    return last_health_check_;
}

} // namespace ledgerstore
