#pragma once

/**
 * @file nisab_year_record.h
 * @brief One Hawl observation window for one user
 *
 * Status flow: draft -> finalized -> unlocked -> finalized (refinalize).
 * The threshold basis and value are locked at creation. The wealth
 * snapshot and obligation are locked at finalization and only change
 * while the record is unlocked.
 *
 * @date 2026-10-18
 */

#include "metal_price.h"
#include "wealth_snapshot.h"
#include "nisab/utils/time_utils.h"
#include "nisab/utils/hijri_calendar.h"
#include <json/json.h>
#include <chrono>
#include <optional>
#include <string>

namespace nisab::hawl::domain {

enum class RecordStatus {
    Draft,
    Finalized,
    Unlocked
};

std::string toString(RecordStatus status);

std::optional<RecordStatus> parseRecordStatus(const std::string& text);

struct NisabYearRecord {
    std::string id;
    std::string userId;
    RecordStatus status = RecordStatus::Draft;
    std::string currency;

    // Temporal (fixed at creation)
    utils::CivilDate hawlStartDate;
    utils::hijri::HijriDate hawlStartDateHijri;
    utils::CivilDate expectedCompletionDate;
    utils::hijri::HijriDate expectedCompletionDateHijri;

    // Threshold (locked at creation)
    NisabBasis basis = NisabBasis::Gold;
    double thresholdValue = 0.0;

    // Financial snapshot (locked at finalization, encrypted at rest)
    std::optional<double> totalWealth;
    std::optional<double> zakatAmount;
    std::optional<WealthBreakdown> breakdown;

    std::string notes;

    // Most recent unlock justification, encrypted with the field cipher
    std::optional<std::string> unlockReasonEncrypted;

    std::optional<std::chrono::system_clock::time_point> finalizedAt;
    std::optional<std::chrono::system_clock::time_point> unlockedAt;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;

    bool isDraft() const { return status == RecordStatus::Draft; }

    /** @brief Unlocked records carry values that still need re-finalization */
    bool isPendingRefinalization() const { return status == RecordStatus::Unlocked; }

    Json::Value toJson() const;
};

/**
 * @brief 2.5% of wealth above the locked threshold, never negative, 2 decimals
 */
double computeObligation(double wealth, double lockedThreshold);

} // namespace nisab::hawl::domain
