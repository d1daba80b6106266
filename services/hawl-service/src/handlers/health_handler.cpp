/** @file health_handler.cpp
 *  @brief HealthHandler implementation
 */

#include "health_handler.h"
#include <spdlog/spdlog.h>

namespace nisab::hawl::handlers {

HealthHandler::HealthHandler(
    std::function<Json::Value()> checkDatabase,
    std::function<std::string()> getCurrentTimestamp)
    : checkDatabase_(std::move(checkDatabase)),
      getCurrentTimestamp_(std::move(getCurrentTimestamp)) {

    if (!checkDatabase_ || !getCurrentTimestamp_) {
        throw std::invalid_argument("HealthHandler: health check functions cannot be nullptr");
    }

    spdlog::info("[HealthHandler] Initialized");
}

void HealthHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /api/hawl/health
    app.registerHandler(
        "/api/hawl/health",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleHealth(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[HealthHandler] Routes registered");
}

void HealthHandler::handleHealth(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value database = checkDatabase_();
    bool up = database["status"].asString() == "UP";

    Json::Value result;
    result["service"] = "hawl-service";
    result["status"] = up ? "UP" : "DEGRADED";
    result["timestamp"] = getCurrentTimestamp_();
    result["database"] = database;

    auto resp = drogon::HttpResponse::newHttpJsonResponse(result);
    if (!up) {
        resp->setStatusCode(drogon::k503ServiceUnavailable);
    }
    callback(resp);
}

} // namespace nisab::hawl::handlers
