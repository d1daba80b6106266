/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "config_manager.h"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace nisab::common {

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
    spdlog::debug("ConfigManager initialized ({} keys from environment)", config_.size());
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = config_.find(key);
        if (it != config_.end()) {
            return it->second;
        }
    }

    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    try {
        return std::stoi(value);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse integer config '{}': {} (using default: {})",
                     key, e.what(), defaultValue);
        return defaultValue;
    }
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    std::transform(value.begin(), value.end(), value.begin(), ::tolower);

    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean config '{}': {} (using default: {})", key, value, defaultValue);
    return defaultValue;
}

bool ConfigManager::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.count(key) > 0 || std::getenv(key.c_str()) != nullptr;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
}

void ConfigManager::loadFromEnvironment() {
    static const char* const kKnownKeys[] = {
        DB_HOST, DB_PORT, DB_NAME, DB_USER, DB_PASSWORD,
        DB_POOL_MIN, DB_POOL_MAX, DB_POOL_TIMEOUT,
        METALS_API_URL, METALS_API_KEY, METALS_API_TIMEOUT_SEC, PRICE_CACHE_TTL_HOURS, PRICE_FEED_RETRY_SEC,
        NISAB_ENCRYPTION_KEY, REPORTING_CURRENCY, DEFAULT_NISAB_BASIS,
        HAWL_DETECTION_ENABLED, HAWL_DETECTION_INTERVAL_MIN, HAWL_DETECTION_CONCURRENCY,
        HAWL_DETECTION_DEADLINE_SEC, HAWL_DETECTION_INITIAL_DELAY_SEC,
        SERVER_PORT, SERVICE_THREADS, LOG_LEVEL, LOG_FILE,
    };

    for (const char* key : kKnownKeys) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
        }
    }
}

std::string ConfigManager::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

} // namespace nisab::common
