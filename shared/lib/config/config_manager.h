/**
 * @file config_manager.h
 * @brief Process-wide configuration lookup
 *
 * Values set explicitly (or captured from the environment at startup)
 * take precedence over the live environment.
 *
 * @date 2026-10-18
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace nisab::common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Returned when the key is neither set nor in the environment
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value (unparseable -> default, with a warning)
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value (true/1/yes/on, false/0/no/off)
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    bool has(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /**
     * @brief Capture every known key present in the environment
     */
    void loadFromEnvironment();

    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @name Predefined Configuration Keys

    // Database
    static constexpr const char* DB_HOST = "DB_HOST";
    static constexpr const char* DB_PORT = "DB_PORT";
    static constexpr const char* DB_NAME = "DB_NAME";
    static constexpr const char* DB_USER = "DB_USER";
    static constexpr const char* DB_PASSWORD = "DB_PASSWORD";
    static constexpr const char* DB_POOL_MIN = "DB_POOL_MIN";
    static constexpr const char* DB_POOL_MAX = "DB_POOL_MAX";
    static constexpr const char* DB_POOL_TIMEOUT = "DB_POOL_TIMEOUT";

    // Price feed
    static constexpr const char* METALS_API_URL = "METALS_API_URL";
    static constexpr const char* METALS_API_KEY = "METALS_API_KEY";
    static constexpr const char* METALS_API_TIMEOUT_SEC = "METALS_API_TIMEOUT_SEC";
    static constexpr const char* PRICE_CACHE_TTL_HOURS = "PRICE_CACHE_TTL_HOURS";
    static constexpr const char* PRICE_FEED_RETRY_SEC = "PRICE_FEED_RETRY_SEC";

    // Domain
    static constexpr const char* NISAB_ENCRYPTION_KEY = "NISAB_ENCRYPTION_KEY";
    static constexpr const char* REPORTING_CURRENCY = "REPORTING_CURRENCY";
    static constexpr const char* DEFAULT_NISAB_BASIS = "DEFAULT_NISAB_BASIS";

    // Detection job
    static constexpr const char* HAWL_DETECTION_ENABLED = "HAWL_DETECTION_ENABLED";
    static constexpr const char* HAWL_DETECTION_INTERVAL_MIN = "HAWL_DETECTION_INTERVAL_MIN";
    static constexpr const char* HAWL_DETECTION_CONCURRENCY = "HAWL_DETECTION_CONCURRENCY";
    static constexpr const char* HAWL_DETECTION_DEADLINE_SEC = "HAWL_DETECTION_DEADLINE_SEC";
    static constexpr const char* HAWL_DETECTION_INITIAL_DELAY_SEC = "HAWL_DETECTION_INITIAL_DELAY_SEC";

    // Service
    static constexpr const char* SERVER_PORT = "SERVER_PORT";
    static constexpr const char* SERVICE_THREADS = "SERVICE_THREADS";
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace nisab::common
