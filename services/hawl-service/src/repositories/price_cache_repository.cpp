/**
 * @file price_cache_repository.cpp
 * @brief Price cache repository implementation
 */
#include "price_cache_repository.h"
#include "row_helpers.h"
#include "query_helpers.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <cstdio>
#include <stdexcept>

using nisab::common::db::getDouble;
using nisab::common::db::getString;

namespace nisab::hawl::repositories {

PriceCacheRepository::PriceCacheRepository(common::IQueryExecutor* executor)
    : queryExecutor_(executor)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("PriceCacheRepository: queryExecutor cannot be nullptr");
    }
}

std::optional<domain::PriceCacheEntry> PriceCacheRepository::findLatest(domain::NisabBasis metal,
                                                                        const std::string& currency) {
    Json::Value result = queryExecutor_->executeQuery(
        "SELECT id::text AS id, metal, currency, price_per_gram, fetched_at, expires_at "
        "FROM precious_metal_price_cache "
        "WHERE metal = $1 AND currency = $2 "
        "ORDER BY fetched_at DESC LIMIT 1",
        {domain::toString(metal), currency});

    if (result.empty()) {
        return std::nullopt;
    }

    const Json::Value& row = result[0];
    domain::PriceCacheEntry entry;
    entry.id = getString(row, "id");
    entry.metal = metal;
    entry.currency = getString(row, "currency");
    entry.pricePerGram = getDouble(row, "price_per_gram");
    entry.fetchedAt = rows::requireTimestamp(row, "fetched_at");
    entry.expiresAt = rows::requireTimestamp(row, "expires_at");
    return entry;
}

void PriceCacheRepository::insert(domain::PriceCacheEntry& entry) {
    char price[64];
    std::snprintf(price, sizeof(price), "%.4f", entry.pricePerGram);

    Json::Value result = queryExecutor_->executeQuery(
        "INSERT INTO precious_metal_price_cache (metal, currency, price_per_gram, fetched_at, expires_at) "
        "VALUES ($1, $2, $3::numeric, $4::timestamptz, $5::timestamptz) "
        "RETURNING id::text AS id",
        {domain::toString(entry.metal), entry.currency, price,
         rows::timestampParam(entry.fetchedAt), rows::timestampParam(entry.expiresAt)});

    if (result.empty()) {
        throw common::DatabaseException("Insert into precious_metal_price_cache returned no id");
    }
    entry.id = result[0]["id"].asString();

    spdlog::debug("[PriceCacheRepository] Cached {}/{} = {} (id {})",
                  domain::toString(entry.metal), entry.currency, price, entry.id);
}

} // namespace nisab::hawl::repositories
