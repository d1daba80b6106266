/**
 * @file db_connection_pool.cpp
 * @brief Implementation of PostgreSQL Connection Pool
 */

#include "db_connection_pool.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace nisab::common {

// =============================================================================
// DbConnection
// =============================================================================

DbConnection::~DbConnection() {
    release();
}

bool DbConnection::execute(const std::string& sql) {
    if (!isValid()) {
        return false;
    }

    PGresult* res = PQexec(conn_, sql.c_str());
    if (!res) {
        return false;
    }

    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        spdlog::error("[DbConnection] '{}' failed: {}", sql, PQerrorMessage(conn_));
    }
    PQclear(res);

    return (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);
}

void DbConnection::release() {
    if (!conn_) {
        return;
    }

    if (pool_) {
        pool_->releaseConnection(conn_);
    } else {
        PQfinish(conn_);
    }
    conn_ = nullptr;
}

// =============================================================================
// DbConnectionPool
// =============================================================================

DbConnectionPool::DbConnectionPool(
    const std::string& connString,
    size_t minSize,
    size_t maxSize,
    int acquireTimeoutSec)
    : connString_(connString)
    , minSize_(minSize)
    , maxSize_(maxSize)
    , acquireTimeout_(acquireTimeoutSec)
    , totalConnections_(0)
    , shutdown_(false)
{
    if (minSize > maxSize) {
        throw std::invalid_argument("DbConnectionPool: minSize cannot exceed maxSize");
    }

    spdlog::info("[DbConnectionPool] Created: minSize={}, maxSize={}, timeout={}s",
                 minSize_, maxSize_, acquireTimeoutSec);
}

DbConnectionPool::~DbConnectionPool() {
    shutdown();
}

bool DbConnectionPool::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (size_t i = 0; i < minSize_; i++) {
        PGconn* conn = createConnection();
        if (!conn) {
            spdlog::error("[DbConnectionPool] Failed to open connection {}/{}", i + 1, minSize_);
            return false;
        }

        availableConnections_.push(conn);
        totalConnections_++;
    }

    spdlog::info("[DbConnectionPool] Initialized with {} connections", totalConnections_.load());
    return true;
}

DbConnection DbConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() + acquireTimeout_;

    while (true) {
        if (shutdown_) {
            throw DatabaseException("connection pool is shut down");
        }

        if (!availableConnections_.empty()) {
            PGconn* conn = availableConnections_.front();
            availableConnections_.pop();

            if (isConnectionHealthy(conn)) {
                return DbConnection(conn, this);
            }

            spdlog::warn("[DbConnectionPool] Pooled connection is unhealthy, discarding");
            PQfinish(conn);
            totalConnections_--;
            continue;
        }

        if (totalConnections_ < maxSize_) {
            // Reserve the slot before dropping the lock so concurrent callers
            // cannot overshoot maxSize_.
            totalConnections_++;
            lock.unlock();
            PGconn* conn = createConnection();
            lock.lock();

            if (!conn) {
                totalConnections_--;
                throw DatabaseException("failed to open PostgreSQL connection");
            }
            spdlog::debug("[DbConnectionPool] Opened new connection (total: {})", totalConnections_.load());
            return DbConnection(conn, this);
        }

        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            spdlog::warn("[DbConnectionPool] Timeout waiting for connection ({}s)", acquireTimeout_.count());
            throw PoolExhaustedException("PostgreSQL");
        }
    }
}

DbConnectionPool::Stats DbConnectionPool::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{availableConnections_.size(), totalConnections_.load(), maxSize_};
}

void DbConnectionPool::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        return;
    }
    shutdown_ = true;

    while (!availableConnections_.empty()) {
        PQfinish(availableConnections_.front());
        availableConnections_.pop();
    }
    totalConnections_ = 0;

    cv_.notify_all();
    spdlog::info("[DbConnectionPool] Shut down");
}

PGconn* DbConnectionPool::createConnection() {
    PGconn* conn = PQconnectdb(connString_.c_str());

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::error("[DbConnectionPool] Connection failed: {}", PQerrorMessage(conn));
        PQfinish(conn);
        return nullptr;
    }
    return conn;
}

bool DbConnectionPool::isConnectionHealthy(PGconn* conn) {
    if (!conn || PQstatus(conn) != CONNECTION_OK) {
        return false;
    }

    // A connection left inside a transaction must not be reused.
    if (PQtransactionStatus(conn) != PQTRANS_IDLE) {
        return false;
    }

    PGresult* res = PQexec(conn, "SELECT 1");
    bool ok = res && PQresultStatus(res) == PGRES_TUPLES_OK;
    if (res) {
        PQclear(res);
    }
    return ok;
}

void DbConnectionPool::releaseConnection(PGconn* conn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (shutdown_) {
        PQfinish(conn);
        return;
    }

    if (isConnectionHealthy(conn)) {
        availableConnections_.push(conn);
    } else {
        spdlog::warn("[DbConnectionPool] Returned connection is unhealthy, closing");
        PQfinish(conn);
        totalConnections_--;
    }

    cv_.notify_one();
}

} // namespace nisab::common
