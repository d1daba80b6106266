#include "threshold_result.h"
#include "nisab/utils/time_utils.h"
#include <cmath>

namespace nisab::hawl::domain {

double roundMoney(double amount) {
    return std::round(amount * 100.0) / 100.0;
}

double roundPrice(double amount) {
    return std::round(amount * 10000.0) / 10000.0;
}

Json::Value ThresholdResult::toJson() const {
    Json::Value json;
    json["basis"] = toString(basis);
    json["currency"] = currency;
    json["pricePerGram"] = pricePerGram;
    json["grams"] = grams;
    json["thresholdValue"] = thresholdValue;
    json["fetchedAt"] = utils::formatIso8601(fetchedAt);
    json["source"] = toString(source);
    return json;
}

} // namespace nisab::hawl::domain
