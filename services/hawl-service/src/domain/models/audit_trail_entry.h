#pragma once

/**
 * @file audit_trail_entry.h
 * @brief Immutable lifecycle fact about one record
 *
 * The change summary is a closed set of shapes, one per event type.
 * Entries refer to their record by id only.
 *
 * @date 2026-10-18
 */

#include "nisab_year_record.h"
#include <json/json.h>
#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nisab::hawl::domain {

enum class AuditEventType {
    Created,
    Finalized,
    Unlocked,
    Edited,
    Refinalized
};

std::string toString(AuditEventType type);

std::optional<AuditEventType> parseAuditEventType(const std::string& text);

/**
 * @brief Financial fields of a record at one point in time
 */
struct FinancialState {
    RecordStatus status = RecordStatus::Draft;
    double thresholdValue = 0.0;
    std::optional<double> totalWealth;
    std::optional<double> zakatAmount;

    static FinancialState of(const NisabYearRecord& record);
};

/** @brief created */
struct CreatedChange {
    NisabBasis basis = NisabBasis::Gold;
    double thresholdValue = 0.0;
    std::string currency;
    utils::CivilDate hawlStartDate;
    utils::CivilDate expectedCompletionDate;
};

/** @brief finalized / refinalized */
struct FinalizationChange {
    FinancialState before;
    FinancialState after;
};

/** @brief unlocked */
struct UnlockChange {
    FinancialState lockedState;
    std::string reasonEncrypted;
};

struct FieldChange {
    std::string field;
    std::string before;
    std::string after;
};

/** @brief edited */
struct EditChange {
    std::vector<FieldChange> fields;
};

using AuditChange = std::variant<CreatedChange, FinalizationChange, UnlockChange, EditChange>;

/**
 * @brief True when the change shape is the one defined for the event type
 */
bool changeMatchesEvent(AuditEventType type, const AuditChange& change);

Json::Value changeToJson(const AuditChange& change);

/**
 * @throws common::ParsingException if the JSON does not fit the event's shape
 */
AuditChange changeFromJson(AuditEventType type, const Json::Value& json);

struct AuditTrailEntry {
    std::string id;
    std::string recordId;
    std::string userId;
    int sequence = 0;                  ///< 1-based, contiguous per record
    AuditEventType eventType = AuditEventType::Created;
    std::chrono::system_clock::time_point timestamp;
    AuditChange change;
    std::optional<std::string> ipAddress;
    std::optional<std::string> userAgent;

    /** @brief JSON view; the unlock reason stays encrypted */
    Json::Value toJson() const;
};

} // namespace nisab::hawl::domain
