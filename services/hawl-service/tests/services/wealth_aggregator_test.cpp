/**
 * @file wealth_aggregator_test.cpp
 * @brief Unit tests for WealthAggregator
 */

#include <gtest/gtest.h>

#include "services/wealth_aggregator.h"
#include "exceptions.h"
#include "fakes/fake_cipher.h"
#include "fakes/fake_clock.h"
#include "fakes/fake_wealth.h"

using namespace nisab::hawl;
using domain::AssetCategory;

namespace {

class WealthAggregatorTest : public ::testing::Test {
protected:
    fakes::FakeClock clock_;
    fakes::FakeCipher cipher_;
    fakes::InMemoryAssets assets_;
    std::unique_ptr<services::WealthAggregator> aggregator_;

    void SetUp() override {
        aggregator_ = std::make_unique<services::WealthAggregator>(&assets_, &cipher_, &clock_);
    }
};

TEST_F(WealthAggregatorTest, UserWithoutAssetsHasZeroWealth) {
    auto snapshot = aggregator_->aggregateZakatableWealth("user-1");

    EXPECT_DOUBLE_EQ(snapshot.total, 0.0);
    EXPECT_EQ(snapshot.assetCount, 0);
    // Every category is present, even when empty
    EXPECT_EQ(snapshot.breakdown.size(), domain::allAssetCategories().size());
    EXPECT_DOUBLE_EQ(snapshot.breakdown.at(AssetCategory::Gold), 0.0);
}

TEST_F(WealthAggregatorTest, SumsEligibleAssetsByCategory) {
    // Arrange
    assets_.add("user-1", AssetCategory::Cash, "enc:4000.50");
    assets_.add("user-1", AssetCategory::Cash, "enc:1000");
    assets_.add("user-1", AssetCategory::Gold, "enc:5000");
    assets_.add("user-2", AssetCategory::Cash, "enc:99999");

    // Act
    auto snapshot = aggregator_->aggregateZakatableWealth("user-1");

    // Assert
    EXPECT_DOUBLE_EQ(snapshot.total, 10000.50);
    EXPECT_EQ(snapshot.assetCount, 3);
    EXPECT_DOUBLE_EQ(snapshot.breakdown.at(AssetCategory::Cash), 5000.50);
    EXPECT_DOUBLE_EQ(snapshot.breakdown.at(AssetCategory::Gold), 5000.00);
    EXPECT_EQ(snapshot.userId, "user-1");
    EXPECT_EQ(snapshot.calculatedAt, clock_.now());
}

TEST_F(WealthAggregatorTest, IneligibleAssetsAreSkipped) {
    assets_.add("user-1", AssetCategory::Cash, "enc:1000");
    assets_.add("user-1", AssetCategory::Other, "enc:500", 1.0, false);

    auto snapshot = aggregator_->aggregateZakatableWealth("user-1");

    EXPECT_DOUBLE_EQ(snapshot.total, 1000.0);
    EXPECT_EQ(snapshot.assetCount, 1);
}

TEST_F(WealthAggregatorTest, CalculationModifierIsApplied) {
    assets_.add("user-1", AssetCategory::Investments, "enc:10000", 0.7);

    auto snapshot = aggregator_->aggregateZakatableWealth("user-1");

    EXPECT_DOUBLE_EQ(snapshot.total, 7000.0);
    EXPECT_DOUBLE_EQ(snapshot.breakdown.at(AssetCategory::Investments), 7000.0);
}

TEST_F(WealthAggregatorTest, TotalIsRoundedToCents) {
    assets_.add("user-1", AssetCategory::Cash, "enc:0.105");
    assets_.add("user-1", AssetCategory::Cash, "enc:0.001");

    auto snapshot = aggregator_->aggregateZakatableWealth("user-1");

    EXPECT_DOUBLE_EQ(snapshot.total, 0.11);
}

TEST_F(WealthAggregatorTest, NonNumericValueThrowsParsingException) {
    assets_.add("user-1", AssetCategory::Cash, "enc:12abc");

    EXPECT_THROW(aggregator_->aggregateZakatableWealth("user-1"), nisab::common::ParsingException);
}

TEST_F(WealthAggregatorTest, UndecryptableValueThrowsCryptoException) {
    assets_.add("user-1", AssetCategory::Cash, "plaintext-1000");

    EXPECT_THROW(aggregator_->aggregateZakatableWealth("user-1"), nisab::common::CryptoException);
}

} // namespace
