#pragma once

#include <gelfbridge/core/storage/connection.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <vector>

namespace GelfBridge {

class ConnectionPool;

/**
 * @class PooledConnection
 * @brief RAII lease on one pool connection.
 *
 * Returns the connection to the pool when destroyed. A lease marked with
 * invalidate() (or whose connection reports !isHealthy()) is closed instead
 * of being reused, freeing its slot for a fresh connection.
 */
class PooledConnection {
public:
    PooledConnection(ConnectionPool* pool, ConnectionPtr conn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    Connection& operator*() const { return *conn_; }
    Connection* operator->() const { return conn_.get(); }

    void invalidate() { invalid_ = true; }

private:
    void release();

    ConnectionPool* pool_ = nullptr;
    ConnectionPtr conn_;
    bool invalid_ = false;
};

/**
 * @class ConnectionPool
 * @brief At most maxConnections open sessions, opened lazily on demand.
 *
 * Thread-safe. Idle connections are reused LIFO.
 */
class ConnectionPool {
public:
    ConnectionPool(ConnectionFactory factory, size_t maxConnections);
    ~ConnectionPool() noexcept;

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Lease a connection, opening one if below the limit
     * @param timeout How long to wait when every connection is leased
     * @throws StorageError (transient) on timeout or if the factory fails
     */
    PooledConnection acquire(std::chrono::milliseconds timeout);

    size_t openCount() const;
    size_t idleCount() const;

    // Close idle connections; leased ones are closed when returned
    void shutdown();

private:
    friend class PooledConnection;
    void giveBack(ConnectionPtr conn, bool discard);

    ConnectionFactory factory_;
    const size_t maxConnections_;

    mutable std::mutex mtx_;
    std::condition_variable available_;
    std::vector<ConnectionPtr> idle_;
    size_t open_ = 0;
    bool shutdown_ = false;
};

} // namespace GelfBridge
