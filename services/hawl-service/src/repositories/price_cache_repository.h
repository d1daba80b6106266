#pragma once

#include "../domain/repositories/i_price_cache_repository.h"
#include "i_query_executor.h"

namespace nisab::hawl::repositories {

/**
 * @brief precious_metal_price_cache table operations
 */
class PriceCacheRepository : public domain::IPriceCacheRepository {
public:
    explicit PriceCacheRepository(common::IQueryExecutor* executor);

    std::optional<domain::PriceCacheEntry> findLatest(domain::NisabBasis metal, const std::string& currency) override;
    void insert(domain::PriceCacheEntry& entry) override;

private:
    common::IQueryExecutor* queryExecutor_;
};

} // namespace nisab::hawl::repositories
