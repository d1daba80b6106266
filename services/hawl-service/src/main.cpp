/**
 * @file main.cpp
 * @brief Nisab/Hawl service - Zakat threshold tracking and Nisab year records
 *
 * REST API over the record lifecycle, threshold lookup and the periodic
 * Hawl detection job.
 *
 * @date 2026-10-18
 */

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>

#include "common/config.h"
#include "logger.h"
#include "db_connection_pool.h"
#include "i_query_executor.h"
#include "nisab/utils/time_utils.h"

#include "infrastructure/service_container.h"
#include "infrastructure/hawl_detection_scheduler.h"
#include "services/price_oracle_cache.h"
#include "services/wealth_aggregator.h"

#include "handlers/nisab_record_handler.h"
#include "handlers/threshold_handler.h"
#include "handlers/health_handler.h"
#include "handlers/detection_handler.h"

namespace {

nisab::hawl::Config g_config;
std::unique_ptr<nisab::hawl::infrastructure::ServiceContainer> g_services;

/**
 * @brief Database round trip plus pool statistics
 */
Json::Value checkDatabase() {
    Json::Value result;
    result["name"] = "database";

    auto start = std::chrono::steady_clock::now();
    try {
        g_services->queryExecutor()->executeScalar("SELECT 1");
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        result["status"] = "UP";
        result["responseTimeMs"] = static_cast<int>(elapsed.count());
    } catch (const std::exception& e) {
        spdlog::warn("Database health check failed: {}", e.what());
        result["status"] = "DOWN";
        result["error"] = "Database unreachable";
    }

    auto stats = g_services->dbPool()->getStats();
    Json::Value pool;
    pool["available"] = static_cast<Json::UInt64>(stats.availableConnections);
    pool["total"] = static_cast<Json::UInt64>(stats.totalConnections);
    pool["max"] = static_cast<Json::UInt64>(stats.maxConnections);
    result["pool"] = pool;
    return result;
}

} // anonymous namespace

int main() {
    using namespace nisab::hawl;

    // Load configuration from environment
    g_config.loadFromEnv();

    // Setup logging
    nisab::common::Logger::initialize("nisab-hawl", g_config.logLevel,
                                      !g_config.logFile.empty(), g_config.logFile);

    // Validate required credentials
    try {
        g_config.validateRequiredCredentials();
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    spdlog::info("=================================================");
    spdlog::info("  Nisab/Hawl Service");
    spdlog::info("=================================================");
    spdlog::info("Server port: {}", g_config.serverPort);
    spdlog::info("Reporting currency: {}, default basis: {}",
                 g_config.reportingCurrency, g_config.defaultNisabBasis);
    spdlog::info("Hawl detection: {} (every {} min, {} workers, {} s deadline)",
                 g_config.detectionEnabled ? "enabled" : "manual only",
                 g_config.detectionIntervalMin, g_config.detectionConcurrency,
                 g_config.detectionDeadlineSec);

    g_services = std::make_unique<infrastructure::ServiceContainer>();
    if (!g_services->initialize(g_config)) {
        spdlog::critical("Service initialization failed");
        return 1;
    }

    int exitCode = 0;
    try {
        auto& app = drogon::app();

        app.setLogLevel(trantor::Logger::kWarn)
           .addListener("0.0.0.0", g_config.serverPort)
           .setThreadNum(g_config.serviceThreads)
           .setClientMaxBodySize(1024 * 1024);

        // Enable CORS
        app.registerPreSendingAdvice([](const drogon::HttpRequestPtr& /* req */,
                                         const drogon::HttpResponsePtr& resp) {
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type, Authorization, X-User-Id");
        });

        // Handle OPTIONS requests for CORS preflight
        app.registerHandler(
            "/{path}",
            [](const drogon::HttpRequestPtr& /* req */,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback,
               const std::string& /* path */) {
                auto resp = drogon::HttpResponse::newHttpResponse();
                resp->setStatusCode(drogon::k204NoContent);
                callback(resp);
            },
            {drogon::Options}
        );

        handlers::NisabRecordHandler recordHandler(
            g_services->recordLifecycle(), g_services->hawlTracker(), g_services->auditLedger(),
            g_services->priceOracleCache(), g_services->wealthAggregator(),
            g_services->userRepository(), g_services->fieldCipher());
        handlers::ThresholdHandler thresholdHandler(
            g_services->priceOracleCache(), g_services->userRepository(), g_config.reportingCurrency);
        handlers::HealthHandler healthHandler(
            &checkDatabase,
            []() { return nisab::utils::formatIso8601(nisab::utils::now()); });
        handlers::DetectionHandler detectionHandler(
            g_services->detectionJob(), g_services->detectionScheduler());

        recordHandler.registerRoutes(app);
        thresholdHandler.registerRoutes(app);
        healthHandler.registerRoutes(app);
        detectionHandler.registerRoutes(app);

        // Start scheduler
        g_services->detectionScheduler()->start();

        spdlog::info("Starting HTTP server on port {}...", g_config.serverPort);
        app.run();

    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        exitCode = 1;
    }

    // Cleanup
    g_services->shutdown();
    g_services.reset();

    spdlog::info("Server stopped");
    return exitCode;
}
