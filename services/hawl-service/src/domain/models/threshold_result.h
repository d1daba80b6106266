#pragma once

#include "metal_price.h"
#include <json/json.h>
#include <chrono>
#include <string>

namespace nisab::hawl::domain {

/**
 * @brief Where a threshold's price came from
 */
enum class PriceSource {
    Fresh,        ///< fetched from the feed during this call
    Cache,        ///< non-expired cache row
    StaleCache    ///< expired cache row used because the feed failed
};

inline std::string toString(PriceSource source) {
    switch (source) {
        case PriceSource::Fresh: return "fresh";
        case PriceSource::Cache: return "cache";
        case PriceSource::StaleCache: return "stale_cache";
    }
    return "unknown";
}

/**
 * @brief Nisab threshold in the reporting currency
 */
struct ThresholdResult {
    NisabBasis basis = NisabBasis::Gold;
    std::string currency;
    double pricePerGram = 0.0;
    double grams = 0.0;
    double thresholdValue = 0.0;
    std::chrono::system_clock::time_point fetchedAt;
    PriceSource source = PriceSource::Fresh;

    Json::Value toJson() const;
};

/** @brief Round half away from zero to 2 decimals */
double roundMoney(double amount);

/** @brief Round half away from zero to 4 decimals (stored price precision) */
double roundPrice(double amount);

} // namespace nisab::hawl::domain
