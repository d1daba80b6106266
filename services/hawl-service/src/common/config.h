#pragma once

#include "config_manager.h"
#include "exceptions.h"
#include "field_cipher.h"
#include <string>

namespace nisab {
namespace hawl {

// =============================================================================
// Service Configuration
// =============================================================================
struct Config {
    // Server
    int serverPort = 8090;
    int serviceThreads = 4;
    std::string logLevel = "info";
    std::string logFile;

    // Database
    std::string dbPassword;  // Must be set via environment variable

    // Encryption (64 hex chars = AES-256 key)
    std::string encryptionKey;  // Must be set via environment variable

    // Price feed
    std::string metalsApiUrl = "https://www.goldapi.io/api";
    std::string metalsApiKey;
    int metalsApiTimeoutSec = 5;
    int priceCacheTtlHours = 24;
    int priceFeedRetrySec = 60;  // after a failed fetch, serve the stale row until this passes

    // Defaults for users without preferences
    std::string reportingCurrency = "USD";
    std::string defaultNisabBasis = "gold";

    // Hawl detection job
    bool detectionEnabled = true;
    int detectionIntervalMin = 60;
    int detectionConcurrency = 8;
    int detectionDeadlineSec = 50;
    int detectionInitialDelaySec = 10;

    void loadFromEnv() {
        using common::ConfigManager;
        auto& cfg = ConfigManager::getInstance();
        cfg.loadFromEnvironment();

        serverPort = cfg.getInt(ConfigManager::SERVER_PORT, serverPort);
        serviceThreads = cfg.getInt(ConfigManager::SERVICE_THREADS, serviceThreads);
        logLevel = cfg.getString(ConfigManager::LOG_LEVEL, logLevel);
        logFile = cfg.getString(ConfigManager::LOG_FILE, logFile);

        dbPassword = cfg.getString(ConfigManager::DB_PASSWORD);
        encryptionKey = cfg.getString(ConfigManager::NISAB_ENCRYPTION_KEY);

        metalsApiUrl = cfg.getString(ConfigManager::METALS_API_URL, metalsApiUrl);
        metalsApiKey = cfg.getString(ConfigManager::METALS_API_KEY, metalsApiKey);
        metalsApiTimeoutSec = cfg.getInt(ConfigManager::METALS_API_TIMEOUT_SEC, metalsApiTimeoutSec);
        priceCacheTtlHours = cfg.getInt(ConfigManager::PRICE_CACHE_TTL_HOURS, priceCacheTtlHours);
        priceFeedRetrySec = cfg.getInt(ConfigManager::PRICE_FEED_RETRY_SEC, priceFeedRetrySec);

        reportingCurrency = cfg.getString(ConfigManager::REPORTING_CURRENCY, reportingCurrency);
        defaultNisabBasis = cfg.getString(ConfigManager::DEFAULT_NISAB_BASIS, defaultNisabBasis);

        detectionEnabled = cfg.getBool(ConfigManager::HAWL_DETECTION_ENABLED, detectionEnabled);
        detectionIntervalMin = cfg.getInt(ConfigManager::HAWL_DETECTION_INTERVAL_MIN, detectionIntervalMin);
        detectionConcurrency = cfg.getInt(ConfigManager::HAWL_DETECTION_CONCURRENCY, detectionConcurrency);
        detectionDeadlineSec = cfg.getInt(ConfigManager::HAWL_DETECTION_DEADLINE_SEC, detectionDeadlineSec);
        detectionInitialDelaySec = cfg.getInt(ConfigManager::HAWL_DETECTION_INITIAL_DELAY_SEC,
                                              detectionInitialDelaySec);
    }

    // Validate required credentials are set
    void validateRequiredCredentials() const {
        if (dbPassword.empty()) {
            throw common::ConfigException("DB_PASSWORD environment variable not set");
        }
        if (encryptionKey.empty()) {
            throw common::ConfigException("NISAB_ENCRYPTION_KEY environment variable not set");
        }
        if (!common::AesGcmFieldCipher::isValidHexKey(encryptionKey)) {
            throw common::ConfigException("NISAB_ENCRYPTION_KEY must be 64 hex characters");
        }
    }
};

} // namespace hawl
} // namespace nisab
