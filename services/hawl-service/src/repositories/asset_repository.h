#pragma once

#include "../domain/repositories/i_asset_repository.h"
#include "i_query_executor.h"

namespace nisab::hawl::repositories {

/**
 * @brief Read access to the asset table of the external asset store
 */
class AssetRepository : public domain::IAssetRepository {
public:
    explicit AssetRepository(common::IQueryExecutor* executor);

    /** @brief Active assets of the user; values stay encrypted */
    std::vector<domain::ZakatableAsset> findByUser(const std::string& userId) override;

private:
    common::IQueryExecutor* queryExecutor_;
};

} // namespace nisab::hawl::repositories
