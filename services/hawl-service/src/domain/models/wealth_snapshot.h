#pragma once

#include "asset.h"
#include <json/json.h>
#include <chrono>
#include <map>
#include <string>

namespace nisab::hawl::domain {

using WealthBreakdown = std::map<AssetCategory, double>;

Json::Value breakdownToJson(const WealthBreakdown& breakdown);

/**
 * @throws common::ParsingException on unknown categories or non-numeric values
 */
WealthBreakdown breakdownFromJson(const Json::Value& json);

/**
 * @brief A user's zakatable wealth at one instant
 */
struct WealthSnapshot {
    std::string userId;
    double total = 0.0;
    WealthBreakdown breakdown;
    int assetCount = 0;
    std::chrono::system_clock::time_point calculatedAt;

    Json::Value toJson() const;
};

} // namespace nisab::hawl::domain
