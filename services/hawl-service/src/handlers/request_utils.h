#pragma once

/**
 * @file request_utils.h
 * @brief Caller identity, request metadata and lifecycle error responses
 */

#include "handler_utils.h"
#include "../domain/models/lifecycle_result.h"
#include "../services/audit_ledger.h"
#include <drogon/HttpRequest.h>
#include <optional>
#include <regex>
#include <string>

namespace nisab::hawl::handlers {

inline bool isUuid(const std::string& value) {
    static const std::regex uuidRegex(
        "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");
    return std::regex_match(value, uuidRegex);
}

/**
 * @brief X-User-Id header (set by the authenticating proxy), if it is a UUID
 */
inline std::optional<std::string> callerId(const drogon::HttpRequestPtr& req) {
    std::string userId = req->getHeader("X-User-Id");
    if (userId.empty() || !isUuid(userId)) {
        return std::nullopt;
    }
    return userId;
}

inline services::AuditContext auditContext(const drogon::HttpRequestPtr& req) {
    services::AuditContext context;
    std::string ip = req->getHeader("X-Forwarded-For");
    if (ip.empty()) {
        ip = req->getPeerAddr().toIp();
    } else if (auto comma = ip.find(','); comma != std::string::npos) {
        ip = ip.substr(0, comma);
    }
    context.ipAddress = services::normalizeClientIp(ip);

    std::string userAgent = req->getHeader("User-Agent");
    if (!userAgent.empty()) context.userAgent = userAgent;
    return context;
}

inline drogon::HttpResponsePtr lifecycleError(const domain::LifecycleError& error) {
    drogon::HttpStatusCode status = drogon::k400BadRequest;
    switch (error.code) {
        case domain::LifecycleErrorCode::RecordNotFound:
            status = drogon::k404NotFound;
            break;
        case domain::LifecycleErrorCode::InvalidTransition:
        case domain::LifecycleErrorCode::DuplicateOpenWindow:
            status = drogon::k409Conflict;
            break;
        case domain::LifecycleErrorCode::InsufficientJustification:
        case domain::LifecycleErrorCode::InvalidInput:
            status = drogon::k400BadRequest;
            break;
    }
    return common::handler::errorResponse(status, error.message, domain::toString(error.code));
}

inline drogon::HttpResponsePtr priceUnavailable(const std::exception& e) {
    spdlog::warn("[Handler] {}", e.what());
    return common::handler::errorResponse(drogon::k503ServiceUnavailable,
                                          "Metal price is currently unavailable", "PRICE_UNAVAILABLE");
}

} // namespace nisab::hawl::handlers
