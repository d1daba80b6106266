/**
 * @file asset_repository.cpp
 * @brief Asset repository implementation
 */
#include "asset_repository.h"
#include "query_helpers.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

using nisab::common::db::getBool;
using nisab::common::db::getDouble;
using nisab::common::db::getString;

namespace nisab::hawl::repositories {

AssetRepository::AssetRepository(common::IQueryExecutor* executor)
    : queryExecutor_(executor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("AssetRepository: queryExecutor cannot be nullptr");
    }
}

std::vector<domain::ZakatableAsset> AssetRepository::findByUser(const std::string& userId) {
    Json::Value rows = queryExecutor_->executeQuery(
        "SELECT id::text AS id, user_id::text AS user_id, category, value, "
        "calculation_modifier, zakat_eligible "
        "FROM asset WHERE user_id = $1::uuid AND is_active = TRUE",
        {userId});

    std::vector<domain::ZakatableAsset> assets;
    assets.reserve(rows.size());
    for (const auto& row : rows) {
        domain::ZakatableAsset asset;
        asset.id = getString(row, "id");
        asset.userId = getString(row, "user_id");
        asset.encryptedValue = getString(row, "value");
        asset.calculationModifier = getDouble(row, "calculation_modifier", 1.0);
        asset.zakatEligible = getBool(row, "zakat_eligible", true);

        auto category = domain::parseAssetCategory(getString(row, "category"));
        if (!category) {
            spdlog::debug("[AssetRepository] Asset {} has unknown category '{}', counted as other",
                          asset.id, getString(row, "category"));
        }
        asset.category = category.value_or(domain::AssetCategory::Other);
        assets.push_back(std::move(asset));
    }
    return assets;
}

} // namespace nisab::hawl::repositories
