/** @file nisab_record_handler.cpp
 *  @brief NisabRecordHandler implementation
 */

#include "nisab_record_handler.h"
#include "request_utils.h"

#include "../services/record_lifecycle.h"
#include "../services/hawl_tracker.h"
#include "../services/audit_ledger.h"
#include "../domain/ports/i_threshold_provider.h"
#include "../domain/ports/i_wealth_source.h"
#include "../domain/repositories/i_user_repository.h"
#include "exceptions.h"
#include "field_cipher.h"
#include "nisab/utils/string_utils.h"
#include "nisab/utils/time_utils.h"

#include <spdlog/spdlog.h>
#include <cmath>

namespace nisab::hawl::handlers {

using common::handler::badRequest;
using common::handler::internalError;
using common::handler::ok;
using common::handler::unauthorized;

namespace {

drogon::HttpResponsePtr invalidRecordId() {
    return common::handler::errorResponse(drogon::k404NotFound, "Nisab year record not found",
                                          domain::toString(domain::LifecycleErrorCode::RecordNotFound));
}

std::optional<double> readAmount(const Json::Value& body, const char* field, std::string& error) {
    if (!body.isMember(field) || body[field].isNull()) {
        return std::nullopt;
    }
    if (!body[field].isNumeric()) {
        error = std::string(field) + " must be a number";
        return std::nullopt;
    }
    double value = body[field].asDouble();
    if (!std::isfinite(value) || value < 0.0) {
        error = std::string(field) + " must be a non-negative number";
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

NisabRecordHandler::NisabRecordHandler(services::RecordLifecycle* lifecycle,
                                       services::HawlTracker* tracker,
                                       services::AuditLedger* ledger,
                                       domain::IThresholdProvider* thresholds,
                                       domain::IWealthSource* wealth,
                                       domain::IUserRepository* users,
                                       const common::IFieldCipher* cipher)
    : lifecycle_(lifecycle), tracker_(tracker), ledger_(ledger),
      thresholds_(thresholds), wealth_(wealth), users_(users), cipher_(cipher) {

    if (!lifecycle_ || !tracker_ || !ledger_ || !thresholds_ || !wealth_ || !users_ || !cipher_) {
        throw std::invalid_argument("NisabRecordHandler: service/repository pointers cannot be nullptr");
    }

    spdlog::info("[NisabRecordHandler] Initialized");
}

// --- Route Registration ---

void NisabRecordHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET|POST /api/nisab-year-records
    app.registerHandler(
        "/api/nisab-year-records",
        [this](const drogon::HttpRequestPtr& req, Callback&& callback) {
            if (req->method() == drogon::Post) {
                handleCreate(req, std::move(callback));
            } else {
                handleList(req, std::move(callback));
            }
        },
        {drogon::Get, drogon::Post}
    );

    // GET|PUT|DELETE /api/nisab-year-records/{id}
    app.registerHandler(
        "/api/nisab-year-records/{id}",
        [this](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            switch (req->method()) {
                case drogon::Put:
                    handleEdit(req, std::move(callback), id);
                    break;
                case drogon::Delete:
                    handleDelete(req, std::move(callback), id);
                    break;
                default:
                    handleGet(req, std::move(callback), id);
                    break;
            }
        },
        {drogon::Get, drogon::Put, drogon::Delete}
    );

    // POST /api/nisab-year-records/{id}/finalize
    app.registerHandler(
        "/api/nisab-year-records/{id}/finalize",
        [this](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            handleFinalize(req, std::move(callback), id);
        },
        {drogon::Post}
    );

    // POST /api/nisab-year-records/{id}/unlock
    app.registerHandler(
        "/api/nisab-year-records/{id}/unlock",
        [this](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            handleUnlock(req, std::move(callback), id);
        },
        {drogon::Post}
    );

    // GET /api/nisab-year-records/{id}/audit
    app.registerHandler(
        "/api/nisab-year-records/{id}/audit",
        [this](const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id) {
            handleAudit(req, std::move(callback), id);
        },
        {drogon::Get}
    );

    spdlog::info("[NisabRecordHandler] Routes registered");
}

// --- Handlers ---

void NisabRecordHandler::handleList(const drogon::HttpRequestPtr& req, Callback&& callback) {
    auto userId = callerId(req);
    if (!userId) { callback(unauthorized()); return; }

    try {
        std::optional<domain::RecordStatus> status;
        std::string statusParam = req->getParameter("status");
        if (!statusParam.empty()) {
            status = domain::parseRecordStatus(utils::toLower(statusParam));
            if (!status) {
                callback(badRequest("status must be one of draft, finalized, unlocked"));
                return;
            }
        }
        int limit = common::handler::safeStoi(req->getParameter("limit"), 20, 1, 100);
        int offset = common::handler::safeStoi(req->getParameter("offset"), 0, 0, 1000000);

        Json::Value records(Json::arrayValue);
        for (const auto& record : lifecycle_->list(*userId, status, limit, offset)) {
            records.append(recordJson(record));
        }

        Json::Value data;
        data["records"] = records;
        data["total"] = lifecycle_->count(*userId, status);
        data["limit"] = limit;
        data["offset"] = offset;
        callback(ok(data));

    } catch (const std::exception& e) {
        callback(internalError("NisabRecordHandler::handleList", e));
    }
}

void NisabRecordHandler::handleCreate(const drogon::HttpRequestPtr& req, Callback&& callback) {
    auto userId = callerId(req);
    if (!userId) { callback(unauthorized()); return; }

    try {
        auto user = users_->findById(*userId);
        if (!user) {
            callback(common::handler::errorResponse(drogon::k404NotFound, "User not found", "USER_NOT_FOUND"));
            return;
        }

        auto json = req->getJsonObject();
        Json::Value body = json ? *json : Json::Value(Json::objectValue);

        domain::NisabBasis basis = user->preferredBasis;
        if (body.isMember("basis")) {
            auto parsed = domain::parseNisabBasis(body["basis"].asString());
            if (!parsed) {
                callback(badRequest("basis must be gold or silver"));
                return;
            }
            basis = *parsed;
        }

        auto today = utils::toCivilDate(utils::now());
        utils::CivilDate startDate = today;
        if (body.isMember("startDate")) {
            auto parsed = utils::parseDate(body["startDate"].asString());
            if (!parsed) {
                callback(badRequest("startDate must be YYYY-MM-DD"));
                return;
            }
            if (*parsed > today) {
                callback(badRequest("startDate cannot be in the future"));
                return;
            }
            startDate = *parsed;
        }

        auto threshold = thresholds_->getNisabThreshold(user->currency, basis);

        auto result = lifecycle_->create(*userId, startDate, basis, threshold.thresholdValue,
                                         user->currency, auditContext(req));
        if (!result) {
            callback(lifecycleError(result.error()));
            return;
        }

        auto resp = ok(recordJson(result.record()));
        resp->setStatusCode(drogon::k201Created);
        callback(resp);

    } catch (const common::PriceUnavailableException& e) {
        callback(priceUnavailable(e));
    } catch (const std::exception& e) {
        callback(internalError("NisabRecordHandler::handleCreate", e));
    }
}

void NisabRecordHandler::handleGet(const drogon::HttpRequestPtr& req, Callback&& callback,
                                   const std::string& id) {
    auto userId = callerId(req);
    if (!userId) { callback(unauthorized()); return; }
    if (!isUuid(id)) { callback(invalidRecordId()); return; }

    try {
        auto result = lifecycle_->get(*userId, id);
        if (!result) {
            callback(lifecycleError(result.error()));
            return;
        }
        const auto& record = result.record();

        Json::Value data = recordJson(record);
        data["auditTrail"] = auditJson(record.id);

        if (record.isDraft()) {
            try {
                data["live"] = tracker_->liveProgress(record).toJson();
            } catch (const std::exception& e) {
                spdlog::warn("[NisabRecordHandler] Live progress unavailable for {}: {}", record.id, e.what());
                data["live"] = Json::Value(Json::nullValue);
            }
        }

        callback(ok(data));

    } catch (const std::exception& e) {
        callback(internalError("NisabRecordHandler::handleGet", e));
    }
}

void NisabRecordHandler::handleEdit(const drogon::HttpRequestPtr& req, Callback&& callback,
                                    const std::string& id) {
    auto userId = callerId(req);
    if (!userId) { callback(unauthorized()); return; }
    if (!isUuid(id)) { callback(invalidRecordId()); return; }

    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        callback(badRequest("Request body must be a JSON object"));
        return;
    }

    try {
        const Json::Value& body = *json;
        services::RecordEdit changes;
        std::string error;

        changes.totalWealth = readAmount(body, "totalWealth", error);
        if (error.empty()) changes.thresholdValue = readAmount(body, "thresholdValue", error);
        if (!error.empty()) {
            callback(badRequest(error));
            return;
        }
        if (body.isMember("breakdown") && !body["breakdown"].isNull()) {
            try {
                changes.breakdown = domain::breakdownFromJson(body["breakdown"]);
            } catch (const common::ParsingException& e) {
                callback(badRequest(e.what()));
                return;
            }
        }
        if (body.isMember("notes")) {
            if (!body["notes"].isString()) {
                callback(badRequest("notes must be a string"));
                return;
            }
            changes.notes = body["notes"].asString();
        }
        if (changes.empty()) {
            callback(badRequest("No editable fields in request"));
            return;
        }

        auto result = lifecycle_->edit(*userId, id, changes, auditContext(req));
        if (!result) {
            callback(lifecycleError(result.error()));
            return;
        }
        callback(ok(recordJson(result.record())));

    } catch (const std::exception& e) {
        callback(internalError("NisabRecordHandler::handleEdit", e));
    }
}

void NisabRecordHandler::handleDelete(const drogon::HttpRequestPtr& req, Callback&& callback,
                                      const std::string& id) {
    auto userId = callerId(req);
    if (!userId) { callback(unauthorized()); return; }
    if (!isUuid(id)) { callback(invalidRecordId()); return; }

    try {
        auto result = lifecycle_->remove(*userId, id);
        if (!result) {
            callback(lifecycleError(result.error()));
            return;
        }

        Json::Value data;
        data["id"] = id;
        data["deleted"] = true;
        callback(ok(data));

    } catch (const std::exception& e) {
        callback(internalError("NisabRecordHandler::handleDelete", e));
    }
}

void NisabRecordHandler::handleFinalize(const drogon::HttpRequestPtr& req, Callback&& callback,
                                        const std::string& id) {
    auto userId = callerId(req);
    if (!userId) { callback(unauthorized()); return; }
    if (!isUuid(id)) { callback(invalidRecordId()); return; }

    try {
        auto json = req->getJsonObject();
        Json::Value body = json ? *json : Json::Value(Json::objectValue);

        std::string error;
        auto finalWealth = readAmount(body, "finalWealth", error);
        if (!error.empty()) {
            callback(badRequest(error));
            return;
        }

        auto current = lifecycle_->get(*userId, id);
        if (!current) {
            callback(lifecycleError(current.error()));
            return;
        }
        const auto& record = current.record();

        std::optional<domain::WealthSnapshot> snapshot;
        if (record.isPendingRefinalization()) {
            if (finalWealth) {
                domain::WealthSnapshot edited;
                edited.userId = *userId;
                edited.total = domain::roundMoney(*finalWealth);
                edited.breakdown = record.breakdown.value_or(domain::WealthBreakdown{});
                edited.calculatedAt = utils::now();
                snapshot = edited;
            }
        } else {
            snapshot = wealth_->aggregateZakatableWealth(*userId);
            if (finalWealth) {
                snapshot->total = domain::roundMoney(*finalWealth);
            }
        }

        auto result = lifecycle_->finalize(*userId, id, snapshot, auditContext(req));
        if (!result) {
            callback(lifecycleError(result.error()));
            return;
        }
        callback(ok(recordJson(result.record())));

    } catch (const std::exception& e) {
        callback(internalError("NisabRecordHandler::handleFinalize", e));
    }
}

void NisabRecordHandler::handleUnlock(const drogon::HttpRequestPtr& req, Callback&& callback,
                                      const std::string& id) {
    auto userId = callerId(req);
    if (!userId) { callback(unauthorized()); return; }
    if (!isUuid(id)) { callback(invalidRecordId()); return; }

    auto json = req->getJsonObject();
    std::string reason;
    if (json && json->isMember("reason") && (*json)["reason"].isString()) {
        reason = (*json)["reason"].asString();
    }

    try {
        auto result = lifecycle_->unlock(*userId, id, reason, auditContext(req));
        if (!result) {
            callback(lifecycleError(result.error()));
            return;
        }
        callback(ok(recordJson(result.record())));

    } catch (const std::exception& e) {
        callback(internalError("NisabRecordHandler::handleUnlock", e));
    }
}

void NisabRecordHandler::handleAudit(const drogon::HttpRequestPtr& req, Callback&& callback,
                                     const std::string& id) {
    auto userId = callerId(req);
    if (!userId) { callback(unauthorized()); return; }
    if (!isUuid(id)) { callback(invalidRecordId()); return; }

    try {
        auto owned = lifecycle_->get(*userId, id);
        if (!owned) {
            callback(lifecycleError(owned.error()));
            return;
        }

        Json::Value data;
        data["recordId"] = id;
        data["entries"] = auditJson(id);
        data["integrity"] = ledger_->verifyIntegrity(id).toJson();
        callback(ok(data));

    } catch (const std::exception& e) {
        callback(internalError("NisabRecordHandler::handleAudit", e));
    }
}

// --- JSON views ---

Json::Value NisabRecordHandler::recordJson(const domain::NisabYearRecord& record) const {
    Json::Value json = record.toJson();
    json["unlockReason"] = record.unlockReasonEncrypted
        ? Json::Value(cipher_->decrypt(*record.unlockReasonEncrypted))
        : Json::Value(Json::nullValue);
    return json;
}

Json::Value NisabRecordHandler::auditJson(const std::string& recordId) const {
    Json::Value entries(Json::arrayValue);
    for (const auto& entry : ledger_->listForRecord(recordId)) {
        Json::Value json = entry.toJson();
        if (const auto* unlock = std::get_if<domain::UnlockChange>(&entry.change)) {
            json["changes"]["reason"] = cipher_->decrypt(unlock->reasonEncrypted);
            json["changes"].removeMember("reasonEncrypted");
        }
        entries.append(json);
    }
    return entries;
}

} // namespace nisab::hawl::handlers
