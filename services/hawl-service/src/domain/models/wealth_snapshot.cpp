#include "wealth_snapshot.h"
#include "exceptions.h"
#include "nisab/utils/time_utils.h"

namespace nisab::hawl::domain {

const std::vector<AssetCategory>& allAssetCategories() {
    static const std::vector<AssetCategory> kCategories = {
        AssetCategory::Cash, AssetCategory::Gold, AssetCategory::Silver,
        AssetCategory::Business, AssetCategory::Crypto, AssetCategory::Investments,
        AssetCategory::Receivables, AssetCategory::Other
    };
    return kCategories;
}

std::string toString(AssetCategory category) {
    switch (category) {
        case AssetCategory::Cash: return "cash";
        case AssetCategory::Gold: return "gold";
        case AssetCategory::Silver: return "silver";
        case AssetCategory::Business: return "business";
        case AssetCategory::Crypto: return "crypto";
        case AssetCategory::Investments: return "investments";
        case AssetCategory::Receivables: return "receivables";
        case AssetCategory::Other: return "other";
    }
    return "other";
}

std::optional<AssetCategory> parseAssetCategory(const std::string& text) {
    for (AssetCategory category : allAssetCategories()) {
        if (toString(category) == text) {
            return category;
        }
    }
    return std::nullopt;
}

Json::Value breakdownToJson(const WealthBreakdown& breakdown) {
    Json::Value json(Json::objectValue);
    for (const auto& [category, amount] : breakdown) {
        json[toString(category)] = amount;
    }
    return json;
}

WealthBreakdown breakdownFromJson(const Json::Value& json) {
    if (!json.isObject()) {
        throw common::ParsingException("breakdown must be a JSON object");
    }

    WealthBreakdown breakdown;
    for (const auto& name : json.getMemberNames()) {
        auto category = parseAssetCategory(name);
        if (!category) {
            throw common::ParsingException("unknown asset category '" + name + "'");
        }
        if (!json[name].isNumeric()) {
            throw common::ParsingException("breakdown value for '" + name + "' is not numeric");
        }
        breakdown[*category] = json[name].asDouble();
    }
    return breakdown;
}

Json::Value WealthSnapshot::toJson() const {
    Json::Value json;
    json["userId"] = userId;
    json["total"] = total;
    json["breakdown"] = breakdownToJson(breakdown);
    json["assetCount"] = assetCount;
    json["calculatedAt"] = utils::formatIso8601(calculatedAt);
    return json;
}

} // namespace nisab::hawl::domain
