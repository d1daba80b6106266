#pragma once

#include "../models/metal_price.h"
#include <optional>
#include <string>

namespace nisab::hawl::domain {

/**
 * @brief precious_metal_price_cache access
 *
 * Only PriceOracleCache writes through this interface.
 */
class IPriceCacheRepository {
public:
    virtual ~IPriceCacheRepository() = default;

    /**
     * @brief Most recently fetched row for the pair, expired or not
     */
    virtual std::optional<PriceCacheEntry> findLatest(NisabBasis metal, const std::string& currency) = 0;

    /** @brief Sets entry.id */
    virtual void insert(PriceCacheEntry& entry) = 0;
};

} // namespace nisab::hawl::domain
