#pragma once

/**
 * @file asset.h
 * @brief Read-only view of the external asset store
 *
 * @date 2026-10-18
 */

#include <optional>
#include <string>
#include <vector>

namespace nisab::hawl::domain {

enum class AssetCategory {
    Cash,
    Gold,
    Silver,
    Business,
    Crypto,
    Investments,
    Receivables,
    Other
};

const std::vector<AssetCategory>& allAssetCategories();

std::string toString(AssetCategory category);

/** @brief Unknown category names map to std::nullopt */
std::optional<AssetCategory> parseAssetCategory(const std::string& text);

/**
 * @brief Asset row as stored: the monetary value is still encrypted
 */
struct ZakatableAsset {
    std::string id;
    std::string userId;
    AssetCategory category = AssetCategory::Other;
    std::string encryptedValue;
    double calculationModifier = 1.0;   ///< e.g. 0.7 for penalised retirement accounts
    bool zakatEligible = true;
};

} // namespace nisab::hawl::domain
