#pragma once

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>

namespace nisab::hawl::handlers {

/**
 * @brief Health check endpoint
 *
 * - GET /api/hawl/health - Service status with database pool statistics
 *
 * The database check is injected so the handler has no pool dependency.
 */
class HealthHandler {
public:
    /**
     * @param checkDatabase Returns {"status": "UP"|"DOWN", ...}
     * @param getCurrentTimestamp Returns the current ISO 8601 timestamp
     */
    HealthHandler(std::function<Json::Value()> checkDatabase,
                  std::function<std::string()> getCurrentTimestamp);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    std::function<Json::Value()> checkDatabase_;
    std::function<std::string()> getCurrentTimestamp_;

    /**
     * @brief GET /api/hawl/health
     *
     * Response:
     * {
     *   "service": "hawl-service",
     *   "status": "UP",
     *   "timestamp": "2026-10-18T10:00:00Z",
     *   "database": {"status": "UP", "responseTimeMs": 2, "pool": {...}}
     * }
     *
     * 503 when the database is down.
     */
    void handleHealth(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);
};

} // namespace nisab::hawl::handlers
