/**
 * @file price_oracle_cache.cpp
 * @brief PriceOracleCache implementation
 */
#include "price_oracle_cache.h"
#include "exceptions.h"
#include "nisab/utils/string_utils.h"
#include "nisab/utils/time_utils.h"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace nisab::hawl::services {

using domain::NisabBasis;
using domain::PriceCacheEntry;
using domain::PriceSource;
using domain::ThresholdResult;

Json::Value NisabThresholds::toJson() const {
    Json::Value json;
    json["gold"] = gold.toJson();
    json["silver"] = silver.toJson();
    return json;
}

PriceOracleCache::PriceOracleCache(domain::IPriceCacheRepository* cacheRepo,
                                   domain::IPriceFeed* feed,
                                   domain::IClock* clock,
                                   std::chrono::seconds ttl,
                                   std::chrono::seconds retryAfterFailure)
    : cacheRepo_(cacheRepo), feed_(feed), clock_(clock), ttl_(ttl),
      retryAfterFailure_(retryAfterFailure)
{
    if (!cacheRepo_ || !feed_ || !clock_) {
        throw std::invalid_argument("PriceOracleCache: dependencies cannot be nullptr");
    }
}

ThresholdResult PriceOracleCache::getNisabThreshold(const std::string& currency, NisabBasis basis) {
    const std::string cur = utils::toUpper(utils::trim(currency));
    if (cur.empty()) {
        throw std::invalid_argument("PriceOracleCache: currency cannot be empty");
    }

    KeyState& state = keyState(basis, cur);
    std::lock_guard<std::mutex> lock(state.mutex);

    auto now = clock_->now();
    auto cached = cacheRepo_->findLatest(basis, cur);
    if (cached && !cached->isExpired(now)) {
        spdlog::debug("[PriceOracleCache] Cache hit {}/{}: {:.4f}/g",
                      domain::metalSymbol(basis), cur, cached->pricePerGram);
        return toThreshold(*cached, PriceSource::Cache);
    }

    bool backingOff = state.lastFailure && now < *state.lastFailure + retryAfterFailure_;
    if (!backingOff) {
        auto price = feed_->fetchPricePerGram(basis, cur);
        if (price && std::isfinite(*price) && *price > 0.0) {
            state.lastFailure.reset();

            PriceCacheEntry entry;
            entry.metal = basis;
            entry.currency = cur;
            entry.pricePerGram = domain::roundPrice(*price);
            entry.fetchedAt = now;
            entry.expiresAt = now + ttl_;

            try {
                cacheRepo_->insert(entry);
            } catch (const std::exception& e) {
                // Reading is still good for this call; next call fetches again
                spdlog::warn("[PriceOracleCache] Failed to store {}/{} price: {}",
                             domain::metalSymbol(basis), cur, e.what());
            }

            spdlog::info("[PriceOracleCache] Fetched {}/{}: {:.4f}/g",
                         domain::metalSymbol(basis), cur, entry.pricePerGram);
            return toThreshold(entry, PriceSource::Fresh);
        }
        state.lastFailure = now;
    } else {
        spdlog::debug("[PriceOracleCache] Feed for {}/{} failed recently, not retrying yet",
                      domain::metalSymbol(basis), cur);
    }

    if (cached) {
        spdlog::warn("[PriceOracleCache] Price feed unavailable for {}/{}, "
                     "using stale cache from {} (degraded mode)",
                     domain::metalSymbol(basis), cur, utils::formatIso8601(cached->fetchedAt));
        return toThreshold(*cached, PriceSource::StaleCache);
    }

    spdlog::error("[PriceOracleCache] No price available for {}/{}: feed failed and cache is empty",
                  domain::metalSymbol(basis), cur);
    throw common::PriceUnavailableException(domain::toString(basis), cur);
}

NisabThresholds PriceOracleCache::getBothThresholds(const std::string& currency) {
    NisabThresholds result;
    result.gold = getNisabThreshold(currency, NisabBasis::Gold);
    result.silver = getNisabThreshold(currency, NisabBasis::Silver);
    return result;
}

PriceOracleCache::KeyState& PriceOracleCache::keyState(NisabBasis basis, const std::string& currency) {
    std::lock_guard<std::mutex> lock(keysMutex_);
    auto& slot = keyStates_[domain::metalSymbol(basis) + "/" + currency];
    if (!slot) {
        slot = std::make_unique<KeyState>();
    }
    return *slot;
}

ThresholdResult PriceOracleCache::toThreshold(const PriceCacheEntry& entry, PriceSource source) {
    ThresholdResult result;
    result.basis = entry.metal;
    result.currency = entry.currency;
    result.pricePerGram = entry.pricePerGram;
    result.grams = domain::nisabGrams(entry.metal);
    result.thresholdValue = domain::roundMoney(entry.pricePerGram * result.grams);
    result.fetchedAt = entry.fetchedAt;
    result.source = source;
    return result;
}

} // namespace nisab::hawl::services
