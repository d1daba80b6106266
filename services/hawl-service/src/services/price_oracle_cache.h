#pragma once

/**
 * @file price_oracle_cache.h
 * @brief Nisab threshold from cached or freshly fetched metal prices
 *
 * Lookup order for a (metal, currency) pair:
 *   1. newest cache row that has not expired
 *   2. price feed; the reading is stored as a new cache row
 *   3. newest cache row regardless of expiry (degraded mode, logged)
 *   4. PriceUnavailableException
 *
 * Concurrent lookups of the same pair are serialized so only one of
 * them goes to the feed. Different pairs never wait on each other.
 * After a failed fetch the pair skips step 2 until the retry interval
 * has passed, so an outage costs one feed timeout per interval.
 *
 * The per-gram price is kept at 4 decimals; only the threshold is
 * rounded to 2.
 *
 * @date 2026-10-18
 */

#include "../domain/ports/i_threshold_provider.h"
#include "../domain/ports/i_price_feed.h"
#include "../domain/ports/i_clock.h"
#include "../domain/repositories/i_price_cache_repository.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace nisab::hawl::services {

/**
 * @brief Gold and silver thresholds for one currency
 */
struct NisabThresholds {
    domain::ThresholdResult gold;
    domain::ThresholdResult silver;

    Json::Value toJson() const;
};

class PriceOracleCache : public domain::IThresholdProvider {
public:
    /**
     * @param cacheRepo precious_metal_price_cache access
     * @param feed External price source
     * @param clock Time source for expiry decisions
     * @param ttl Lifetime of a new cache row
     * @param retryAfterFailure Time a pair stays off the feed after a failed fetch
     */
    PriceOracleCache(domain::IPriceCacheRepository* cacheRepo,
                     domain::IPriceFeed* feed,
                     domain::IClock* clock,
                     std::chrono::seconds ttl = std::chrono::hours(24),
                     std::chrono::seconds retryAfterFailure = std::chrono::seconds(60));

    PriceOracleCache(const PriceOracleCache&) = delete;
    PriceOracleCache& operator=(const PriceOracleCache&) = delete;

    /**
     * @brief Threshold = price per gram x basis grams, rounded to 2 decimals
     * @param currency ISO 4217 code (case-insensitive)
     * @param basis Gold or silver
     * @throws common::PriceUnavailableException if neither the feed nor the cache has a price
     */
    domain::ThresholdResult getNisabThreshold(const std::string& currency, domain::NisabBasis basis) override;

    NisabThresholds getBothThresholds(const std::string& currency);

private:
    struct KeyState {
        std::mutex mutex;
        std::optional<std::chrono::system_clock::time_point> lastFailure;  // guarded by mutex
    };

    KeyState& keyState(domain::NisabBasis basis, const std::string& currency);

    static domain::ThresholdResult toThreshold(const domain::PriceCacheEntry& entry, domain::PriceSource source);

    domain::IPriceCacheRepository* cacheRepo_;
    domain::IPriceFeed* feed_;
    domain::IClock* clock_;
    std::chrono::seconds ttl_;
    std::chrono::seconds retryAfterFailure_;

    std::mutex keysMutex_;
    std::map<std::string, std::unique_ptr<KeyState>> keyStates_;
};

} // namespace nisab::hawl::services
