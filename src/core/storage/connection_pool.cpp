#include <gelfbridge/core/storage/connection_pool.hpp>
#include <gelfbridge/core/errors.hpp>

#include <spdlog/spdlog.h>

namespace GelfBridge {

// ============================================================================
// PooledConnection
// ============================================================================

PooledConnection::PooledConnection(ConnectionPool* pool, ConnectionPtr conn)
    : pool_(pool), conn_(std::move(conn)) {}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)), invalid_(other.invalid_) {
    other.pool_ = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        conn_ = std::move(other.conn_);
        invalid_ = other.invalid_;
        other.pool_ = nullptr;
    }
    return *this;
}

void PooledConnection::release() {
    if (pool_ && conn_) {
        bool discard = invalid_ || !conn_->isHealthy();
        pool_->giveBack(std::move(conn_), discard);
    }
    pool_ = nullptr;
}

// ============================================================================
// ConnectionPool
// ============================================================================

ConnectionPool::ConnectionPool(ConnectionFactory factory, size_t maxConnections)
    : factory_(std::move(factory)), maxConnections_(maxConnections == 0 ? 1 : maxConnections) {
    spdlog::info("[ConnectionPool] Initialized (max connections: {})", maxConnections_);
}

ConnectionPool::~ConnectionPool() noexcept {
    spdlog::info("[DESTRUCTOR] ConnectionPool being destroyed...");
    shutdown();
}

PooledConnection ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);

    bool ready = available_.wait_for(lock, timeout, [this] {
        return shutdown_ || !idle_.empty() || open_ < maxConnections_;
    });
    if (shutdown_) {
        throw StorageError("Connection pool is shut down", false);
    }
    if (!ready) {
        throw StorageError("Timed out after " + std::to_string(timeout.count()) +
                           "ms waiting for a database connection (" +
                           std::to_string(open_) + " open)", true);
    }

    if (!idle_.empty()) {
        ConnectionPtr conn = std::move(idle_.back());
        idle_.pop_back();
        return PooledConnection(this, std::move(conn));
    }

    // Reserve the slot, then open outside the lock
    ++open_;
    lock.unlock();

    ConnectionPtr conn;
    try {
        conn = factory_();
    } catch (...) {
        {
            std::lock_guard<std::mutex> relock(mtx_);
            --open_;
        }
        available_.notify_one();
        throw;
    }

    spdlog::debug("[ConnectionPool] Opened {} connection", conn->backendName());
    return PooledConnection(this, std::move(conn));
}

void ConnectionPool::giveBack(ConnectionPtr conn, bool discard) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (discard || shutdown_) {
            if (discard) {
                spdlog::warn("[ConnectionPool] Discarding unhealthy {} connection", conn->backendName());
            }
            conn.reset();
            --open_;
        } else {
            idle_.push_back(std::move(conn));
        }
    }
    available_.notify_one();
}

size_t ConnectionPool::openCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return open_;
}

size_t ConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return idle_.size();
}

void ConnectionPool::shutdown() {
    std::vector<ConnectionPtr> closing;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (shutdown_) return;
        shutdown_ = true;
        closing.swap(idle_);
        open_ -= closing.size();
    }
    available_.notify_all();
    spdlog::info("[ConnectionPool] Shut down, closed {} idle connections", closing.size());
}

} // namespace GelfBridge
