/**
 * @file price_oracle_cache_test.cpp
 * @brief Unit tests for PriceOracleCache
 *
 * Cache hit, fetch-and-store, stale fallback and the unavailable case.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include <vector>

#include "services/price_oracle_cache.h"
#include "exceptions.h"
#include "fakes/fake_clock.h"
#include "fakes/fake_prices.h"

using namespace nisab::hawl;
using domain::NisabBasis;
using domain::PriceSource;

namespace {

class PriceOracleCacheTest : public ::testing::Test {
protected:
    fakes::FakeClock clock_{{2026, 3, 1}};
    fakes::FakePriceFeed feed_;
    fakes::InMemoryPriceCache cache_;
    std::unique_ptr<services::PriceOracleCache> oracle_;

    void SetUp() override {
        oracle_ = std::make_unique<services::PriceOracleCache>(&cache_, &feed_, &clock_, std::chrono::hours(24));
    }

    void seedCache(NisabBasis metal, const std::string& currency, double pricePerGram,
                   std::chrono::system_clock::time_point fetchedAt) {
        domain::PriceCacheEntry entry;
        entry.metal = metal;
        entry.currency = currency;
        entry.pricePerGram = pricePerGram;
        entry.fetchedAt = fetchedAt;
        entry.expiresAt = fetchedAt + std::chrono::hours(24);
        cache_.insert(entry);
    }
};

// --- Fresh fetch ---

TEST_F(PriceOracleCacheTest, FetchesAndStoresWhenCacheIsEmpty) {
    // Arrange
    feed_.setPrice(NisabBasis::Gold, 65.00);

    // Act
    auto result = oracle_->getNisabThreshold("usd", NisabBasis::Gold);

    // Assert
    EXPECT_EQ(result.source, PriceSource::Fresh);
    EXPECT_EQ(result.currency, "USD");
    EXPECT_DOUBLE_EQ(result.grams, 87.48);
    EXPECT_DOUBLE_EQ(result.thresholdValue, 5686.20);
    ASSERT_EQ(cache_.rows.size(), 1u);
    EXPECT_EQ(cache_.rows[0].currency, "USD");
    EXPECT_EQ(cache_.rows[0].expiresAt - cache_.rows[0].fetchedAt, std::chrono::hours(24));
    EXPECT_EQ(feed_.lastCurrency, "USD");
}

TEST_F(PriceOracleCacheTest, SilverThresholdUsesSilverGrams) {
    feed_.setPrice(NisabBasis::Silver, 0.80);

    auto result = oracle_->getNisabThreshold("USD", NisabBasis::Silver);

    EXPECT_DOUBLE_EQ(result.grams, 612.36);
    EXPECT_DOUBLE_EQ(result.thresholdValue, 489.89);
}

TEST_F(PriceOracleCacheTest, PricePerGramIsNotRoundedToCents) {
    // Arrange
    feed_.setPrice(NisabBasis::Silver, 0.954);

    // Act
    auto result = oracle_->getNisabThreshold("USD", NisabBasis::Silver);

    // Assert
    EXPECT_DOUBLE_EQ(result.pricePerGram, 0.954);
    EXPECT_DOUBLE_EQ(result.thresholdValue, 584.19);
    ASSERT_EQ(cache_.rows.size(), 1u);
    EXPECT_DOUBLE_EQ(cache_.rows[0].pricePerGram, 0.954);
}

TEST_F(PriceOracleCacheTest, PricePerGramKeepsFourDecimals) {
    feed_.setPrice(NisabBasis::Gold, 68.123456);

    auto result = oracle_->getNisabThreshold("USD", NisabBasis::Gold);

    EXPECT_DOUBLE_EQ(result.pricePerGram, 68.1235);
    EXPECT_DOUBLE_EQ(result.thresholdValue, 5959.44);
}

TEST_F(PriceOracleCacheTest, StoreFailureStillReturnsFreshReading) {
    feed_.setPrice(NisabBasis::Gold, 65.00);
    cache_.failInsert = true;

    auto result = oracle_->getNisabThreshold("USD", NisabBasis::Gold);

    EXPECT_EQ(result.source, PriceSource::Fresh);
    EXPECT_DOUBLE_EQ(result.thresholdValue, 5686.20);
    EXPECT_TRUE(cache_.rows.empty());
}

// --- Cache hit ---

TEST_F(PriceOracleCacheTest, FreshCacheRowIsUsedWithoutCallingFeed) {
    seedCache(NisabBasis::Gold, "USD", 70.00, clock_.now() - std::chrono::hours(2));
    feed_.setPrice(NisabBasis::Gold, 99.00);

    auto result = oracle_->getNisabThreshold("USD", NisabBasis::Gold);

    EXPECT_EQ(result.source, PriceSource::Cache);
    EXPECT_DOUBLE_EQ(result.thresholdValue, 6123.60);
    EXPECT_EQ(feed_.calls.load(), 0);
}

TEST_F(PriceOracleCacheTest, ExpiredRowTriggersRefetch) {
    seedCache(NisabBasis::Gold, "USD", 70.00, clock_.now() - std::chrono::hours(25));
    feed_.setPrice(NisabBasis::Gold, 72.00);

    auto result = oracle_->getNisabThreshold("USD", NisabBasis::Gold);

    EXPECT_EQ(result.source, PriceSource::Fresh);
    EXPECT_DOUBLE_EQ(result.pricePerGram, 72.00);
    EXPECT_EQ(cache_.rows.size(), 2u);
}

TEST_F(PriceOracleCacheTest, CachedValueIsStableAcrossCalls) {
    feed_.setPrice(NisabBasis::Gold, 65.00);
    auto first = oracle_->getNisabThreshold("USD", NisabBasis::Gold);

    feed_.setPrice(NisabBasis::Gold, 80.00);
    clock_.advance(std::chrono::hours(23));
    auto second = oracle_->getNisabThreshold("USD", NisabBasis::Gold);

    EXPECT_EQ(second.source, PriceSource::Cache);
    EXPECT_DOUBLE_EQ(second.thresholdValue, first.thresholdValue);
    EXPECT_EQ(feed_.calls.load(), 1);
}

// --- Degraded mode ---

TEST_F(PriceOracleCacheTest, FeedOutageFallsBackToExactStaleValue) {
    // Arrange
    seedCache(NisabBasis::Gold, "USD", 68.59, clock_.now() - std::chrono::hours(72));
    feed_.fail();

    // Act
    auto result = oracle_->getNisabThreshold("USD", NisabBasis::Gold);

    // Assert
    EXPECT_EQ(result.source, PriceSource::StaleCache);
    EXPECT_DOUBLE_EQ(result.pricePerGram, 68.59);
    EXPECT_DOUBLE_EQ(result.thresholdValue, 6000.25);
    EXPECT_EQ(feed_.calls.load(), 1);
}

TEST_F(PriceOracleCacheTest, NewestStaleRowWins) {
    seedCache(NisabBasis::Gold, "USD", 60.00, clock_.now() - std::chrono::hours(96));
    seedCache(NisabBasis::Gold, "USD", 62.00, clock_.now() - std::chrono::hours(48));
    feed_.fail();

    auto result = oracle_->getNisabThreshold("USD", NisabBasis::Gold);

    EXPECT_DOUBLE_EQ(result.pricePerGram, 62.00);
}

TEST_F(PriceOracleCacheTest, FailedFetchIsNotRetriedUntilIntervalPasses) {
    // Arrange
    seedCache(NisabBasis::Gold, "USD", 68.59, clock_.now() - std::chrono::hours(72));
    feed_.fail();
    oracle_->getNisabThreshold("USD", NisabBasis::Gold);
    feed_.setPrice(NisabBasis::Gold, 70.00);

    // Act
    clock_.advance(std::chrono::seconds(30));
    auto duringBackoff = oracle_->getNisabThreshold("USD", NisabBasis::Gold);
    clock_.advance(std::chrono::seconds(31));
    auto afterBackoff = oracle_->getNisabThreshold("USD", NisabBasis::Gold);

    // Assert
    EXPECT_EQ(duringBackoff.source, PriceSource::StaleCache);
    EXPECT_DOUBLE_EQ(duringBackoff.pricePerGram, 68.59);
    EXPECT_EQ(afterBackoff.source, PriceSource::Fresh);
    EXPECT_DOUBLE_EQ(afterBackoff.pricePerGram, 70.00);
    EXPECT_EQ(feed_.calls.load(), 2);
}

TEST_F(PriceOracleCacheTest, BackoffIsPerPair) {
    seedCache(NisabBasis::Gold, "USD", 68.59, clock_.now() - std::chrono::hours(72));
    feed_.fail();
    oracle_->getNisabThreshold("USD", NisabBasis::Gold);
    feed_.setPrice(NisabBasis::Silver, 0.80);

    auto silver = oracle_->getNisabThreshold("USD", NisabBasis::Silver);

    EXPECT_EQ(silver.source, PriceSource::Fresh);
    EXPECT_EQ(feed_.calls.load(), 2);
}

TEST_F(PriceOracleCacheTest, BackoffWithoutCacheThrowsWithoutCallingFeed) {
    feed_.fail();
    EXPECT_THROW(oracle_->getNisabThreshold("USD", NisabBasis::Gold),
                 nisab::common::PriceUnavailableException);

    EXPECT_THROW(oracle_->getNisabThreshold("USD", NisabBasis::Gold),
                 nisab::common::PriceUnavailableException);
    EXPECT_EQ(feed_.calls.load(), 1);
}

TEST_F(PriceOracleCacheTest, NoFeedAndNoCacheThrowsPriceUnavailable) {
    feed_.fail();

    EXPECT_THROW(oracle_->getNisabThreshold("EUR", NisabBasis::Silver),
                 nisab::common::PriceUnavailableException);
}

TEST_F(PriceOracleCacheTest, CacheIsKeyedByCurrency) {
    seedCache(NisabBasis::Gold, "EUR", 60.00, clock_.now());
    feed_.fail();

    EXPECT_THROW(oracle_->getNisabThreshold("USD", NisabBasis::Gold),
                 nisab::common::PriceUnavailableException);
}

TEST_F(PriceOracleCacheTest, EmptyCurrencyIsRejected) {
    EXPECT_THROW(oracle_->getNisabThreshold("  ", NisabBasis::Gold), std::invalid_argument);
}

// --- Both thresholds / concurrency ---

TEST_F(PriceOracleCacheTest, BothThresholdsReturnsGoldAndSilver) {
    feed_.setPrice(NisabBasis::Gold, 65.00);
    feed_.setPrice(NisabBasis::Silver, 0.80);

    auto both = oracle_->getBothThresholds("USD");

    EXPECT_EQ(both.gold.basis, NisabBasis::Gold);
    EXPECT_EQ(both.silver.basis, NisabBasis::Silver);
    EXPECT_DOUBLE_EQ(both.gold.thresholdValue, 5686.20);
    EXPECT_DOUBLE_EQ(both.silver.thresholdValue, 489.89);
}

TEST_F(PriceOracleCacheTest, ConcurrentLookupsOfOnePairFetchOnce) {
    feed_.setPrice(NisabBasis::Gold, 65.00);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this]() { oracle_->getNisabThreshold("USD", NisabBasis::Gold); });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(feed_.calls.load(), 1);
    EXPECT_EQ(cache_.rows.size(), 1u);
}

TEST_F(PriceOracleCacheTest, ConcurrentLookupsDuringOutageServeStaleAfterOneFetch) {
    // Arrange
    seedCache(NisabBasis::Gold, "USD", 68.59, clock_.now() - std::chrono::hours(72));
    feed_.fail();
    feed_.delay = std::chrono::milliseconds(300);

    // Act
    std::vector<PriceSource> sources(8);
    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, &sources, i]() {
            sources[i] = oracle_->getNisabThreshold("USD", NisabBasis::Gold).source;
        });
    }
    for (auto& t : threads) t.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Assert
    EXPECT_EQ(feed_.calls.load(), 1);
    for (auto source : sources) {
        EXPECT_EQ(source, PriceSource::StaleCache);
    }
    EXPECT_LT(elapsed, std::chrono::milliseconds(1500));
}

TEST(PriceOracleCacheConstructionTest, NullDependenciesThrow) {
    fakes::FakePriceFeed feed;
    fakes::FakeClock clock;
    EXPECT_THROW(services::PriceOracleCache(nullptr, &feed, &clock), std::invalid_argument);
}

} // namespace
