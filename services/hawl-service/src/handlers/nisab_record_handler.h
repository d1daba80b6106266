#pragma once

#include <drogon/HttpAppFramework.h>
#include <json/json.h>
#include <functional>
#include <string>

namespace nisab::common { class IFieldCipher; }

namespace nisab::hawl::domain {
    class IThresholdProvider;
    class IWealthSource;
    class IUserRepository;
    struct NisabYearRecord;
}

namespace nisab::hawl::services {
    class RecordLifecycle;
    class HawlTracker;
    class AuditLedger;
}

namespace nisab::hawl::handlers {

/**
 * @brief Nisab year record endpoints
 *
 * - GET    /api/nisab-year-records                 - List the caller's records
 * - POST   /api/nisab-year-records                 - Open a Hawl window
 * - GET    /api/nisab-year-records/{id}            - Record with audit trail
 * - PUT    /api/nisab-year-records/{id}            - Edit an unlocked record
 * - DELETE /api/nisab-year-records/{id}            - Delete a draft
 * - POST   /api/nisab-year-records/{id}/finalize   - Finalize or re-finalize
 * - POST   /api/nisab-year-records/{id}/unlock     - Unlock with a reason
 * - GET    /api/nisab-year-records/{id}/audit      - Audit trail and integrity check
 *
 * Every route requires the X-User-Id header; records of other users
 * are reported as not found.
 */
class NisabRecordHandler {
public:
    NisabRecordHandler(services::RecordLifecycle* lifecycle,
                       services::HawlTracker* tracker,
                       services::AuditLedger* ledger,
                       domain::IThresholdProvider* thresholds,
                       domain::IWealthSource* wealth,
                       domain::IUserRepository* users,
                       const common::IFieldCipher* cipher);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

    /**
     * @brief GET /api/nisab-year-records?status=draft&limit=20&offset=0
     *
     * Response: {"success": true, "data": {"records": [...], "total": 3, "limit": 20, "offset": 0}}
     */
    void handleList(const drogon::HttpRequestPtr& req, Callback&& callback);

    /**
     * @brief POST /api/nisab-year-records
     *
     * Request: {"basis": "gold", "startDate": "2026-01-15"} (both optional)
     * Basis defaults to the user's preference, start date to today.
     * The current threshold for the user's currency is locked on the record.
     */
    void handleCreate(const drogon::HttpRequestPtr& req, Callback&& callback);

    /**
     * @brief GET /api/nisab-year-records/{id}
     *
     * Drafts also carry "live" progress computed from current wealth.
     */
    void handleGet(const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id);

    /**
     * @brief PUT /api/nisab-year-records/{id}
     *
     * Request: any of {"totalWealth", "thresholdValue", "breakdown", "notes"}
     */
    void handleEdit(const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id);

    void handleDelete(const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id);

    /**
     * @brief POST /api/nisab-year-records/{id}/finalize
     *
     * Request: {"finalWealth": 12500.00} (optional)
     * Without finalWealth a draft is finalized with the aggregated wealth
     * and an unlocked record keeps its edited values.
     */
    void handleFinalize(const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id);

    /**
     * @brief POST /api/nisab-year-records/{id}/unlock
     *
     * Request: {"reason": "Gold holdings were counted twice"}
     */
    void handleUnlock(const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id);

    void handleAudit(const drogon::HttpRequestPtr& req, Callback&& callback, const std::string& id);

    /** @brief Record JSON with the decrypted unlock reason */
    Json::Value recordJson(const domain::NisabYearRecord& record) const;

    /** @brief Audit entries with unlock reasons decrypted */
    Json::Value auditJson(const std::string& recordId) const;

    services::RecordLifecycle* lifecycle_;
    services::HawlTracker* tracker_;
    services::AuditLedger* ledger_;
    domain::IThresholdProvider* thresholds_;
    domain::IWealthSource* wealth_;
    domain::IUserRepository* users_;
    const common::IFieldCipher* cipher_;
};

} // namespace nisab::hawl::handlers
