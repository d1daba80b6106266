/** @file detection_handler.cpp
 *  @brief DetectionHandler implementation
 */

#include "detection_handler.h"
#include "handler_utils.h"
#include "../infrastructure/hawl_detection_job.h"
#include "../infrastructure/hawl_detection_scheduler.h"

#include <spdlog/spdlog.h>

namespace nisab::hawl::handlers {

DetectionHandler::DetectionHandler(infrastructure::HawlDetectionJob* job,
                                   infrastructure::HawlDetectionScheduler* scheduler)
    : job_(job), scheduler_(scheduler) {

    if (!job_ || !scheduler_) {
        throw std::invalid_argument("DetectionHandler: job/scheduler pointers cannot be nullptr");
    }

    spdlog::info("[DetectionHandler] Initialized");
}

void DetectionHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // POST /api/hawl/detection/trigger
    app.registerHandler(
        "/api/hawl/detection/trigger",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleTrigger(req, std::move(callback));
        },
        {drogon::Post}
    );

    // GET /api/hawl/detection/status
    app.registerHandler(
        "/api/hawl/detection/status",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleStatus(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[DetectionHandler] Routes registered");
}

void DetectionHandler::handleTrigger(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    if (!scheduler_->isRunning()) {
        callback(common::handler::errorResponse(drogon::k503ServiceUnavailable,
                                                "Detection scheduler is not running",
                                                "SCHEDULER_STOPPED"));
        return;
    }

    spdlog::info("Manual Hawl detection triggered via API");
    scheduler_->triggerNow();

    Json::Value response;
    response["success"] = true;
    response["message"] = "Hawl detection triggered";

    auto resp = drogon::HttpResponse::newHttpJsonResponse(response);
    resp->setStatusCode(drogon::k202Accepted);
    callback(resp);
}

void DetectionHandler::handleStatus(
    const drogon::HttpRequestPtr& /* req */,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    Json::Value data;
    data["schedulerRunning"] = scheduler_->isRunning();

    auto last = job_->lastResult();
    data["lastResult"] = last ? last->toJson() : Json::Value(Json::nullValue);

    callback(common::handler::ok(data));
}

} // namespace nisab::hawl::handlers
