/**
 * @file db_connection_pool_factory.cpp
 * @brief Database Connection Pool Factory Implementation
 */

#include "db_connection_pool_factory.h"
#include "db_connection_pool.h"
#include "config_manager.h"
#include "exceptions.h"
#include <sstream>

namespace nisab::common {

namespace {

// libpq keyword/value strings need quoting when a value has spaces or quotes
std::string quoteConnValue(const std::string& value) {
    if (!value.empty() && value.find_first_of(" '\\") == std::string::npos) {
        return value;
    }
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += "'";
    return quoted;
}

} // anonymous namespace

std::string DbPoolConfig::buildConnString() const {
    std::ostringstream oss;
    oss << "host=" << quoteConnValue(host)
        << " port=" << port
        << " dbname=" << quoteConnValue(database)
        << " user=" << quoteConnValue(user)
        << " password=" << quoteConnValue(password)
        << " application_name=nisab-hawl"
        << " options='-c TimeZone=UTC'";
    return oss.str();
}

DbPoolConfig DbPoolConfig::fromEnvironment() {
    auto& cfg = ConfigManager::getInstance();

    DbPoolConfig config;
    config.host = cfg.getString(ConfigManager::DB_HOST, config.host);
    config.port = cfg.getInt(ConfigManager::DB_PORT, config.port);
    config.database = cfg.getString(ConfigManager::DB_NAME, config.database);
    config.user = cfg.getString(ConfigManager::DB_USER, config.user);
    config.password = cfg.getString(ConfigManager::DB_PASSWORD);
    config.minSize = static_cast<size_t>(cfg.getInt(ConfigManager::DB_POOL_MIN, 2));
    config.maxSize = static_cast<size_t>(cfg.getInt(ConfigManager::DB_POOL_MAX, 10));
    config.acquireTimeoutSec = cfg.getInt(ConfigManager::DB_POOL_TIMEOUT, 5);
    return config;
}

std::shared_ptr<DbConnectionPool> DbConnectionPoolFactory::create(const DbPoolConfig& config) {
    if (config.maxSize == 0 || config.minSize > config.maxSize) {
        throw ConfigException("invalid DB pool sizing (min=" + std::to_string(config.minSize) +
                              ", max=" + std::to_string(config.maxSize) + ")");
    }
    return std::make_shared<DbConnectionPool>(
        config.buildConnString(),
        config.minSize,
        config.maxSize,
        config.acquireTimeoutSec
    );
}

std::shared_ptr<DbConnectionPool> DbConnectionPoolFactory::createFromEnv() {
    return create(DbPoolConfig::fromEnvironment());
}

} // namespace nisab::common
