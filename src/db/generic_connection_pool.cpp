#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>

namespace ledgerstore {

std::shared_ptr<GenericConnectionPool> GenericConnectionPool::create(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory) {
    return std::shared_ptr<GenericConnectionPool>(
        new GenericConnectionPool(std::move(db_name), config, std::move(factory)));
}

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(std::max<size_t>(config.max_connections, 1))) {}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

VoidResult GenericConnectionPool::warm_up(const Context& ctx) {
    const size_t target = std::clamp<size_t>(config_.min_connections, 1,
        std::max<size_t>(config_.max_connections, 1));

    for (size_t i = 0; i < target; ++i) {
        auto conn = create_connection(ctx);
        if (conn.is_error()) {
            return VoidResult::error(conn);
        }
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard lock(mutex_);
        times_[conn.value().get()] = ConnTimes{now, now};
        idle_connections_.emplace_back(std::move(conn.value()));
    }

    utils::log::debug(std::format("ConnectionPool warmed for database '{}': {} connections (max={})",
        db_name_, total_connections_.load(), config_.max_connections));
    return VoidResult::ok();
}

Result<std::unique_ptr<PooledConnection>> GenericConnectionPool::acquire(const Context& ctx) {
    using R = Result<std::unique_ptr<PooledConnection>>;

    if (shutdown_.load(std::memory_order_acquire)) {
        return R::error(ErrorCode::UNAVAILABLE, "connection pool is shut down");
    }
    if (const auto err = ctx.err(); err.is_error()) {
        return R::error(err);
    }

    // Acquire semaphore slot (blocks if pool full)
    const auto wait = std::min(ctx.remaining(config_.acquire_timeout), config_.acquire_timeout);
    if (!semaphore_.try_acquire_for(wait)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return R::error(ErrorCode::UNAVAILABLE,
            std::format("timed out waiting for a connection to '{}'", db_name_));
    }

    // Re-check shutdown after acquiring semaphore (TOCTOU: shutdown may have
    // been set between the initial check and semaphore acquisition)
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return R::error(ErrorCode::UNAVAILABLE, "connection pool is shut down");
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    ConnTimes times{};

    // Try to get connection from idle pool (single lock)
    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            if (const auto it = times_.find(conn.get()); it != times_.end()) {
                times = it->second;
            }
        }
    }

    const auto now = std::chrono::steady_clock::now();

    // Recycle if too old, validate if idle too long
    if (conn) {
        bool replace = false;
        if (config_.max_lifetime.count() > 0 && now - times.created > config_.max_lifetime) {
            connections_recycled_.fetch_add(1, std::memory_order_relaxed);
            replace = true;
        } else if (now - times.last_used > config_.idle_timeout) {
            if (!conn->ping(ctx).success) {
                health_check_failures_.fetch_add(1, std::memory_order_relaxed);
                replace = true;
            }
        } else if (!conn->is_connected()) {
            replace = true;
        }
        if (replace) {
            discard(std::move(conn));
        }
    }

    // If no usable idle connection, create a new one
    if (!conn) {
        auto created = create_connection(ctx);
        if (created.is_error()) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return R::error(created);
        }
        conn = std::move(created.value());
        std::lock_guard lock(mutex_);
        times_[conn.get()] = ConnTimes{now, now};
    }

    // Create RAII handle with return callback
    std::weak_ptr<GenericConnectionPool> weak = weak_from_this();
    auto return_fn = [weak](std::unique_ptr<IDbConnection> c) {
        if (auto pool = weak.lock()) {
            pool->return_connection(std::move(c));
        } else if (c) {
            c->close();
        }
    };

    return R::ok(std::make_unique<PooledConnection>(std::move(conn), std::move(return_fn)));
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.max_connections = config_.max_connections;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections > stats.idle_connections
        ? stats.total_connections - stats.idle_connections : 0;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    idle_connections_.clear();
    times_.clear();

    utils::log::debug(std::format("ConnectionPool drained for database '{}'", db_name_));
}

Result<std::unique_ptr<IDbConnection>> GenericConnectionPool::create_connection(const Context& ctx) {
    auto conn = factory_->create(config_.connection_string, ctx);
    if (conn.is_ok() && conn.value()) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    } else if (conn.is_ok()) {
        return Result<std::unique_ptr<IDbConnection>>::error(
            ErrorCode::UNAVAILABLE, "connection factory returned no connection");
    }
    return conn;
}

void GenericConnectionPool::discard(std::unique_ptr<IDbConnection> conn) {
    if (!conn) return;
    {
        std::lock_guard lock(mutex_);
        times_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    // Broken or shut down: close instead of keeping it
    if (shutdown_.load(std::memory_order_acquire) || !conn->is_connected()) {
        discard(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (auto it = times_.find(conn.get()); it != times_.end()) {
            it->second.last_used = std::chrono::steady_clock::now();
        }
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace ledgerstore
