#pragma once

#include "../models/asset.h"
#include <string>
#include <vector>

namespace nisab::hawl::domain {

/**
 * @brief Read-only view of the external asset store
 */
class IAssetRepository {
public:
    virtual ~IAssetRepository() = default;

    /**
     * @brief All of the user's assets in one query (values still encrypted)
     */
    virtual std::vector<ZakatableAsset> findByUser(const std::string& userId) = 0;
};

} // namespace nisab::hawl::domain
