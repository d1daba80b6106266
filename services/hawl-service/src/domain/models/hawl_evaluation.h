#pragma once

#include "metal_price.h"
#include <json/json.h>
#include <optional>
#include <string>

namespace nisab::hawl::domain {

/**
 * @brief Outcome of one HawlTracker evaluation for one user
 */
enum class HawlOutcome {
    NoChange,
    ThresholdFirstCrossed,
    WindowCompleted,
    WindowInterrupted
};

std::string toString(HawlOutcome outcome);

struct HawlEvaluation {
    std::string userId;
    HawlOutcome outcome = HawlOutcome::NoChange;
    std::optional<std::string> recordId;
    double wealth = 0.0;
    double thresholdValue = 0.0;
    NisabBasis basis = NisabBasis::Gold;
    bool usedLockedThreshold = false;   ///< current price was unavailable

    Json::Value toJson() const;
};

/**
 * @brief Progress of an open (draft) window, computed on read and never stored
 */
struct LiveHawlProgress {
    int daysElapsed = 0;
    int daysRemaining = 0;
    double progressPercent = 0.0;
    double currentWealth = 0.0;
    double currentThreshold = 0.0;
    bool aboveNisab = false;
    double percentageOfNisab = 0.0;
    bool canFinalize = false;
    double estimatedObligation = 0.0;

    Json::Value toJson() const;
};

} // namespace nisab::hawl::domain
