/**
 * @file nisab_year_record_test.cpp
 * @brief Unit tests for the Nisab year record model and obligation math
 */

#include <gtest/gtest.h>

#include "domain/models/nisab_year_record.h"
#include "domain/models/threshold_result.h"
#include "exceptions.h"

using namespace nisab::hawl::domain;

namespace {

// --- Obligation Tests ---

TEST(ComputeObligationTest, TwoAndHalfPercentAboveThreshold) {
    EXPECT_DOUBLE_EQ(computeObligation(12000.0, 6000.0), 150.0);
    EXPECT_DOUBLE_EQ(computeObligation(6000.0, 6000.0), 0.0);
}

TEST(ComputeObligationTest, NeverNegative) {
    EXPECT_DOUBLE_EQ(computeObligation(100.0, 6000.0), 0.0);
    EXPECT_DOUBLE_EQ(computeObligation(0.0, 6000.0), 0.0);
}

TEST(ComputeObligationTest, RoundedToCents) {
    // 0.025 x 1234.57 = 30.86425
    EXPECT_DOUBLE_EQ(computeObligation(7234.57, 6000.0), 30.86);
}

TEST(RoundMoneyTest, HalfCentRoundsUp) {
    EXPECT_DOUBLE_EQ(roundMoney(5686.2), 5686.2);
    EXPECT_DOUBLE_EQ(roundMoney(489.888), 489.89);
    EXPECT_DOUBLE_EQ(roundMoney(0.125), 0.13);
}

// --- Status Tests ---

TEST(RecordStatusTest, ParsesKnownNames) {
    EXPECT_TRUE(parseRecordStatus("draft") == RecordStatus::Draft);
    EXPECT_TRUE(parseRecordStatus("finalized") == RecordStatus::Finalized);
    EXPECT_TRUE(parseRecordStatus("unlocked") == RecordStatus::Unlocked);
    EXPECT_FALSE(parseRecordStatus("DRAFT").has_value());
    EXPECT_FALSE(parseRecordStatus("").has_value());
}

TEST(RecordStatusTest, NamesRoundTrip) {
    for (auto status : {RecordStatus::Draft, RecordStatus::Finalized, RecordStatus::Unlocked}) {
        auto parsed = parseRecordStatus(toString(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, status);
    }
}

// --- JSON Tests ---

TEST(NisabYearRecordTest, DraftJsonHasNullFinancials) {
    // Arrange
    NisabYearRecord record;
    record.id = "rec-1";
    record.userId = "user-1";
    record.currency = "USD";
    record.hawlStartDate = {2026, 1, 1};
    record.expectedCompletionDate = {2026, 12, 21};
    record.basis = NisabBasis::Silver;
    record.thresholdValue = 489.89;

    // Act
    Json::Value json = record.toJson();

    // Assert
    EXPECT_EQ(json["status"].asString(), "draft");
    EXPECT_EQ(json["nisabBasis"].asString(), "silver");
    EXPECT_EQ(json["hawlStartDate"].asString(), "2026-01-01");
    EXPECT_EQ(json["expectedCompletionDate"].asString(), "2026-12-21");
    EXPECT_DOUBLE_EQ(json["thresholdValue"].asDouble(), 489.89);
    EXPECT_TRUE(json["totalWealth"].isNull());
    EXPECT_TRUE(json["zakatAmount"].isNull());
    EXPECT_TRUE(json["breakdown"].isNull());
    EXPECT_TRUE(json["finalizedAt"].isNull());
    EXPECT_FALSE(json["pendingRefinalization"].asBool());
    EXPECT_FALSE(json.isMember("unlockReasonEncrypted"));
}

TEST(NisabYearRecordTest, UnlockedRecordIsPendingRefinalization) {
    NisabYearRecord record;
    record.status = RecordStatus::Unlocked;
    record.totalWealth = 12000.0;
    record.zakatAmount = 150.0;
    record.breakdown = WealthBreakdown{{AssetCategory::Cash, 2000.0}, {AssetCategory::Gold, 10000.0}};

    Json::Value json = record.toJson();

    EXPECT_TRUE(record.isPendingRefinalization());
    EXPECT_FALSE(record.isDraft());
    EXPECT_TRUE(json["pendingRefinalization"].asBool());
    EXPECT_DOUBLE_EQ(json["zakatAmount"].asDouble(), 150.0);
    EXPECT_DOUBLE_EQ(json["breakdown"]["gold"].asDouble(), 10000.0);
}

// --- Breakdown Tests ---

TEST(WealthBreakdownTest, ParsesKnownCategories) {
    Json::Value json;
    json["cash"] = 100.5;
    json["crypto"] = 20;

    auto breakdown = breakdownFromJson(json);

    ASSERT_EQ(breakdown.size(), 2u);
    EXPECT_DOUBLE_EQ(breakdown[AssetCategory::Cash], 100.5);
    EXPECT_DOUBLE_EQ(breakdown[AssetCategory::Crypto], 20.0);
}

TEST(WealthBreakdownTest, RejectsUnknownCategoryAndNonNumbers) {
    Json::Value unknown;
    unknown["yachts"] = 1.0;
    EXPECT_THROW(breakdownFromJson(unknown), nisab::common::ParsingException);

    Json::Value text;
    text["cash"] = "lots";
    EXPECT_THROW(breakdownFromJson(text), nisab::common::ParsingException);

    EXPECT_THROW(breakdownFromJson(Json::Value(Json::arrayValue)), nisab::common::ParsingException);
}

} // namespace
