#pragma once

#include <string>
#include <algorithm>
#include <json/json.h>
#include <drogon/HttpResponse.h>
#include <spdlog/spdlog.h>

/**
 * @file handler_utils.h
 * @brief Response helpers shared by the HTTP handlers
 *
 * Every error body has the shape {"success": false, "error": "..."}.
 * Internal errors are logged with their detail and answered with a
 * generic message.
 *
 * @date 2026-10-18
 */

namespace nisab::common::handler {

/**
 * Integer parsing with bounds clamping. Returns defaultValue on empty/invalid input.
 */
inline int safeStoi(const std::string& str, int defaultValue,
                    int minVal = 0, int maxVal = 100000) {
    if (str.empty()) return defaultValue;
    try {
        return std::clamp(std::stoi(str), minVal, maxVal);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

inline drogon::HttpResponsePtr errorResponse(drogon::HttpStatusCode status,
                                             const std::string& publicMessage,
                                             const std::string& code = "") {
    Json::Value body;
    body["success"] = false;
    body["error"] = publicMessage;
    if (!code.empty()) {
        body["code"] = code;
    }
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(status);
    return resp;
}

inline drogon::HttpResponsePtr internalError(
    const std::string& logContext, const std::exception& e) {
    spdlog::error("[{}] {}", logContext, e.what());
    return errorResponse(drogon::k500InternalServerError, "Internal server error");
}

inline drogon::HttpResponsePtr badRequest(const std::string& publicMessage) {
    return errorResponse(drogon::k400BadRequest, publicMessage);
}

inline drogon::HttpResponsePtr unauthorized() {
    return errorResponse(drogon::k401Unauthorized, "Missing user identity");
}

inline drogon::HttpResponsePtr ok(Json::Value data) {
    Json::Value body;
    body["success"] = true;
    body["data"] = std::move(data);
    return drogon::HttpResponse::newHttpJsonResponse(body);
}

} // namespace nisab::common::handler
