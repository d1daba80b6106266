#include "nisab_year_record.h"
#include "nisab_constants.h"
#include "threshold_result.h"
#include <algorithm>

namespace nisab::hawl::domain {

std::string toString(RecordStatus status) {
    switch (status) {
        case RecordStatus::Draft: return "draft";
        case RecordStatus::Finalized: return "finalized";
        case RecordStatus::Unlocked: return "unlocked";
    }
    return "draft";
}

std::optional<RecordStatus> parseRecordStatus(const std::string& text) {
    if (text == "draft") return RecordStatus::Draft;
    if (text == "finalized") return RecordStatus::Finalized;
    if (text == "unlocked") return RecordStatus::Unlocked;
    return std::nullopt;
}

double computeObligation(double wealth, double lockedThreshold) {
    return roundMoney(std::max(0.0, ZAKAT_RATE * (wealth - lockedThreshold)));
}

Json::Value NisabYearRecord::toJson() const {
    Json::Value json;
    json["id"] = id;
    json["userId"] = userId;
    json["status"] = toString(status);
    json["currency"] = currency;
    json["hawlStartDate"] = hawlStartDate.toString();
    json["hawlStartDateHijri"] = hawlStartDateHijri.toString();
    json["expectedCompletionDate"] = expectedCompletionDate.toString();
    json["expectedCompletionDateHijri"] = expectedCompletionDateHijri.toString();
    json["nisabBasis"] = toString(basis);
    json["thresholdValue"] = thresholdValue;
    json["totalWealth"] = totalWealth ? Json::Value(*totalWealth) : Json::Value(Json::nullValue);
    json["zakatAmount"] = zakatAmount ? Json::Value(*zakatAmount) : Json::Value(Json::nullValue);
    json["breakdown"] = breakdown ? breakdownToJson(*breakdown) : Json::Value(Json::nullValue);
    json["notes"] = notes;
    json["pendingRefinalization"] = isPendingRefinalization();
    json["finalizedAt"] = finalizedAt ? Json::Value(utils::formatIso8601(*finalizedAt)) : Json::Value(Json::nullValue);
    json["unlockedAt"] = unlockedAt ? Json::Value(utils::formatIso8601(*unlockedAt)) : Json::Value(Json::nullValue);
    json["createdAt"] = utils::formatIso8601(createdAt);
    json["updatedAt"] = utils::formatIso8601(updatedAt);
    return json;
}

} // namespace nisab::hawl::domain
