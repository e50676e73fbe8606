#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace ledgerstore {

/**
 * @brief RAII wrapper for database connection
 *
 * Automatically returns connection to pool on destruction.
 * Move-only to prevent accidental copying.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    /**
     * @brief Construct pooled connection with return callback
     * @param conn Database connection
     * @param return_fn Function to call on destruction (returns to pool)
     */
    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    /**
     * @brief Destructor - automatically returns connection to pool
     */
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    /**
     * @brief Mark the underlying session as broken; it is closed instead
     * of being returned to the idle list
     */
    void invalidate() { broken_ = true; }
    bool is_broken() const { return broken_; }

private:
    void release();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool broken_ = false;
};

} // namespace ledgerstore
