/**
 * @file db_connection_pool.h
 * @brief PostgreSQL connection pool
 *
 * Thread-safe pool with min/max sizing, acquire timeout and a health
 * check on every hand-out and return. Connections are handed out as
 * move-only RAII handles that go back to the pool on destruction.
 *
 * @date 2026-10-18
 */

#pragma once

#include <libpq-fe.h>
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <atomic>

namespace nisab::common {

class DbConnectionPool;

/**
 * @brief RAII handle to one pooled PostgreSQL connection
 */
class DbConnection {
public:
    DbConnection(PGconn* conn, DbConnectionPool* pool)
        : conn_(conn), pool_(pool) {}

    ~DbConnection();

    DbConnection(const DbConnection&) = delete;
    DbConnection& operator=(const DbConnection&) = delete;

    DbConnection(DbConnection&& other) noexcept
        : conn_(other.conn_), pool_(other.pool_) {
        other.conn_ = nullptr;
    }

    DbConnection& operator=(DbConnection&& other) noexcept {
        if (this != &other) {
            release();
            conn_ = other.conn_;
            pool_ = other.pool_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    PGconn* get() const { return conn_; }

    bool isValid() const { return conn_ != nullptr; }

    /**
     * @brief Run a statement without parameters (BEGIN, COMMIT, ROLLBACK...)
     * @return true on PGRES_COMMAND_OK / PGRES_TUPLES_OK
     */
    bool execute(const std::string& sql);

    /**
     * @brief Return the connection to the pool early
     */
    void release();

private:
    PGconn* conn_;
    DbConnectionPool* pool_;  // Non-owning
};

/**
 * @brief PostgreSQL Connection Pool
 */
class DbConnectionPool {
public:
    struct Stats {
        size_t availableConnections;
        size_t totalConnections;
        size_t maxConnections;
    };

    /**
     * @param connString libpq connection string
     * @param minSize Connections opened by initialize()
     * @param maxSize Hard upper bound on open connections
     * @param acquireTimeoutSec Wait limit in acquire()
     */
    explicit DbConnectionPool(
        const std::string& connString,
        size_t minSize = 2,
        size_t maxSize = 10,
        int acquireTimeoutSec = 5
    );

    ~DbConnectionPool();

    DbConnectionPool(const DbConnectionPool&) = delete;
    DbConnectionPool& operator=(const DbConnectionPool&) = delete;

    /**
     * @brief Open the minimum number of connections
     * @return false if any of them could not be opened
     */
    bool initialize();

    /**
     * @brief Borrow a connection
     * @throws DatabaseException on shutdown or connect failure
     * @throws PoolExhaustedException on timeout
     */
    DbConnection acquire();

    Stats getStats() const;

    void shutdown();

private:
    friend class DbConnection;

    PGconn* createConnection();
    bool isConnectionHealthy(PGconn* conn);
    void releaseConnection(PGconn* conn);

    std::string connString_;
    size_t minSize_;
    size_t maxSize_;
    std::chrono::seconds acquireTimeout_;

    std::queue<PGconn*> availableConnections_;
    std::atomic<size_t> totalConnections_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutdown_;
};

} // namespace nisab::common
