#include "hawl_evaluation.h"

namespace nisab::hawl::domain {

std::string toString(HawlOutcome outcome) {
    switch (outcome) {
        case HawlOutcome::NoChange: return "no_change";
        case HawlOutcome::ThresholdFirstCrossed: return "threshold_first_crossed";
        case HawlOutcome::WindowCompleted: return "window_completed";
        case HawlOutcome::WindowInterrupted: return "window_interrupted";
    }
    return "no_change";
}

Json::Value HawlEvaluation::toJson() const {
    Json::Value json;
    json["userId"] = userId;
    json["outcome"] = toString(outcome);
    json["recordId"] = recordId ? Json::Value(*recordId) : Json::Value(Json::nullValue);
    json["wealth"] = wealth;
    json["thresholdValue"] = thresholdValue;
    json["basis"] = toString(basis);
    json["usedLockedThreshold"] = usedLockedThreshold;
    return json;
}

Json::Value LiveHawlProgress::toJson() const {
    Json::Value json;
    json["daysElapsed"] = daysElapsed;
    json["daysRemaining"] = daysRemaining;
    json["progressPercent"] = progressPercent;
    json["currentWealth"] = currentWealth;
    json["currentThreshold"] = currentThreshold;
    json["wealthStatus"] = aboveNisab ? "ABOVE_NISAB" : "BELOW_NISAB";
    json["percentageOfNisab"] = percentageOfNisab;
    json["canFinalize"] = canFinalize;
    json["estimatedZakat"] = estimatedObligation;
    return json;
}

} // namespace nisab::hawl::domain
