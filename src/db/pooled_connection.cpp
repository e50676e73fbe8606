#include "db/pooled_connection.hpp"

namespace ledgerstore {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn)
    : conn_(std::move(conn)), return_fn_(std::move(return_fn)) {}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(std::move(other.conn_)),
      return_fn_(std::move(other.return_fn_)),
      broken_(other.broken_) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        // Return current connection before taking new one
        release();
        conn_ = std::move(other.conn_);
        return_fn_ = std::move(other.return_fn_);
        broken_ = other.broken_;
    }
    return *this;
}

void PooledConnection::release() {
    if (!conn_) return;
    if (broken_) {
        conn_->close();
    }
    if (return_fn_) {
        return_fn_(std::move(conn_));
    }
    conn_.reset();
}

} // namespace ledgerstore
