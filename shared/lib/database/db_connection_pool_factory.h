/**
 * @file db_connection_pool_factory.h
 * @brief Connection pool construction from configuration
 *
 * @date 2026-10-18
 */

#pragma once

#include <string>
#include <memory>

namespace nisab::common {

class DbConnectionPool;

/**
 * @brief Connection pool configuration
 */
struct DbPoolConfig {
    size_t minSize = 2;
    size_t maxSize = 10;
    int acquireTimeoutSec = 5;

    std::string host = "localhost";
    int port = 5432;
    std::string database = "nisab";
    std::string user = "nisab";
    std::string password;

    /**
     * @brief Build a libpq keyword/value connection string
     */
    std::string buildConnString() const;

    /**
     * @brief Read DB_HOST, DB_PORT, DB_NAME, DB_USER, DB_PASSWORD,
     *        DB_POOL_MIN, DB_POOL_MAX, DB_POOL_TIMEOUT through ConfigManager
     */
    static DbPoolConfig fromEnvironment();
};

class DbConnectionPoolFactory {
public:
    /**
     * @brief Create (but do not initialize) a pool
     * @throws ConfigException on inconsistent sizing
     */
    static std::shared_ptr<DbConnectionPool> create(const DbPoolConfig& config);

    static std::shared_ptr<DbConnectionPool> createFromEnv();
};

} // namespace nisab::common
