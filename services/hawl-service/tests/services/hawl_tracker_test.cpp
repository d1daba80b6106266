/**
 * @file hawl_tracker_test.cpp
 * @brief Unit tests for HawlTracker
 *
 * Unarmed/Armed transitions driven by wealth against the threshold,
 * plus live progress of an open window.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "infrastructure/hawl_detection_job.h"
#include "services/hawl_tracker.h"
#include "services/audit_ledger.h"
#include "services/record_lifecycle.h"
#include "exceptions.h"
#include "fakes/fake_cipher.h"
#include "fakes/fake_clock.h"
#include "fakes/fake_prices.h"
#include "fakes/fake_wealth.h"
#include "fakes/in_memory_records.h"

using namespace nisab::hawl;
using domain::HawlOutcome;
using domain::NisabBasis;
using domain::RecordStatus;

namespace {

const std::string kUser = "11111111-1111-4111-8111-111111111111";

class HawlTrackerTest : public ::testing::Test {
protected:
    fakes::FakeClock clock_{{2026, 1, 1}};
    fakes::FakeCipher cipher_;
    fakes::InMemoryStore store_;
    fakes::FakeThresholdProvider thresholds_;
    fakes::FakeWealthSource wealth_;
    fakes::InMemoryUsers users_;
    std::unique_ptr<services::AuditLedger> ledger_;
    std::unique_ptr<services::RecordLifecycle> lifecycle_;
    std::unique_ptr<services::HawlTracker> tracker_;

    void SetUp() override {
        users_.add(kUser, "USD", NisabBasis::Gold);
        thresholds_.set("USD", NisabBasis::Gold, 6000.0);

        ledger_ = std::make_unique<services::AuditLedger>(&store_.auditReader(), &clock_);
        lifecycle_ = std::make_unique<services::RecordLifecycle>(
            &store_, &store_.reader(), ledger_.get(), &cipher_, &clock_);
        tracker_ = std::make_unique<services::HawlTracker>(
            &thresholds_, &wealth_, lifecycle_.get(), &users_, &clock_);
    }

    /** @brief Cross the threshold today and return the opened record id */
    std::string arm(double wealth = 10000.0) {
        wealth_.set(kUser, wealth);
        auto eval = tracker_->evaluate(kUser);
        EXPECT_EQ(eval.outcome, HawlOutcome::ThresholdFirstCrossed);
        return eval.recordId.value_or("");
    }
};

// --- Unarmed ---

TEST_F(HawlTrackerTest, UserWithoutAssetsStaysUnarmed) {
    // Act
    auto eval = tracker_->evaluate(kUser);

    // Assert
    EXPECT_EQ(eval.outcome, HawlOutcome::NoChange);
    EXPECT_DOUBLE_EQ(eval.wealth, 0.0);
    EXPECT_FALSE(eval.recordId.has_value());
    EXPECT_FALSE(lifecycle_->findDraft(kUser).has_value());
    // No pricing needed when there is nothing to compare
    EXPECT_EQ(thresholds_.calls, 0);
}

TEST_F(HawlTrackerTest, WealthBelowThresholdCreatesNothing) {
    wealth_.set(kUser, 5999.99);

    auto eval = tracker_->evaluate(kUser);

    EXPECT_EQ(eval.outcome, HawlOutcome::NoChange);
    EXPECT_DOUBLE_EQ(eval.thresholdValue, 6000.0);
    EXPECT_FALSE(lifecycle_->findDraft(kUser).has_value());
}

TEST_F(HawlTrackerTest, CrossingThresholdOpensDraftWithLockedValue) {
    // Arrange
    wealth_.set(kUser, 10000.0);

    // Act
    auto eval = tracker_->evaluate(kUser);

    // Assert
    EXPECT_EQ(eval.outcome, HawlOutcome::ThresholdFirstCrossed);
    ASSERT_TRUE(eval.recordId.has_value());
    auto draft = lifecycle_->findDraft(kUser);
    ASSERT_TRUE(draft.has_value());
    EXPECT_EQ(draft->id, *eval.recordId);
    EXPECT_EQ(draft->status, RecordStatus::Draft);
    EXPECT_DOUBLE_EQ(draft->thresholdValue, 6000.0);
    EXPECT_EQ(draft->basis, NisabBasis::Gold);
    EXPECT_EQ(draft->hawlStartDate, clock_.today());
}

TEST_F(HawlTrackerTest, WealthExactlyAtThresholdCounts) {
    wealth_.set(kUser, 6000.0);

    EXPECT_EQ(tracker_->evaluate(kUser).outcome, HawlOutcome::ThresholdFirstCrossed);
}

TEST_F(HawlTrackerTest, PreferredBasisAndCurrencyAreUsed) {
    const std::string eurUser = "33333333-3333-4333-8333-333333333333";
    users_.add(eurUser, "EUR", NisabBasis::Silver);
    thresholds_.set("EUR", NisabBasis::Silver, 450.0);
    wealth_.set(eurUser, 500.0);

    auto eval = tracker_->evaluate(eurUser);

    EXPECT_EQ(eval.outcome, HawlOutcome::ThresholdFirstCrossed);
    auto draft = lifecycle_->findDraft(eurUser);
    ASSERT_TRUE(draft.has_value());
    EXPECT_EQ(draft->currency, "EUR");
    EXPECT_EQ(draft->basis, NisabBasis::Silver);
}

TEST_F(HawlTrackerTest, UnarmedWithoutPriceThrows) {
    thresholds_.clear();
    wealth_.set(kUser, 10000.0);

    EXPECT_THROW(tracker_->evaluate(kUser), nisab::common::PriceUnavailableException);
    EXPECT_FALSE(lifecycle_->findDraft(kUser).has_value());
}

TEST_F(HawlTrackerTest, UnknownUserThrows) {
    EXPECT_THROW(tracker_->evaluate("99999999-9999-4999-8999-999999999999"), nisab::common::NisabException);
}

// --- Armed ---

TEST_F(HawlTrackerTest, SecondEvaluationIsNoChange) {
    auto recordId = arm();

    auto eval = tracker_->evaluate(kUser);

    EXPECT_EQ(eval.outcome, HawlOutcome::NoChange);
    EXPECT_EQ(eval.recordId.value_or(""), recordId);
    EXPECT_EQ(lifecycle_->count(kUser, std::nullopt), 1);
}

TEST_F(HawlTrackerTest, RepeatedDetectionRunsLeaveArmedUserUnchanged) {
    // Arrange
    const std::string unarmedUser = "33333333-3333-4333-8333-333333333333";
    users_.add(unarmedUser, "USD", NisabBasis::Gold);
    wealth_.set(unarmedUser, 100.0);

    infrastructure::HawlDetectionJob::Options options;
    options.concurrency = 4;
    options.deadline = std::chrono::seconds(10);
    infrastructure::HawlDetectionJob job(
        [this]() { return users_.findActiveUsers(); },
        [this](const domain::UserProfile& user) { return tracker_->evaluate(user); },
        options);

    auto recordId = arm(10000.0);
    clock_.advanceDays(30);
    const size_t records = store_.data().records.size();
    const size_t auditEntries = store_.data().audit.size();

    // Act
    auto first = job.run("manual");
    auto second = job.run("manual");

    // Assert
    for (const auto& result : {first, second}) {
        EXPECT_EQ(result.usersProcessed, 2);
        EXPECT_EQ(result.nisabAchievements, 0);
        EXPECT_EQ(result.completions, 0);
        EXPECT_EQ(result.interruptions, 0);
        EXPECT_EQ(result.errors, 0);
    }
    EXPECT_EQ(store_.data().records.size(), records);
    EXPECT_EQ(store_.data().audit.size(), auditEntries);
    auto draft = lifecycle_->findDraft(kUser);
    ASSERT_TRUE(draft.has_value());
    EXPECT_EQ(draft->id, recordId);
    EXPECT_FALSE(lifecycle_->findDraft(unarmedUser).has_value());
}

TEST_F(HawlTrackerTest, DropBelowThresholdMidWindowInterrupts) {
    // Arrange
    auto recordId = arm(10000.0);
    clock_.advanceDays(100);
    wealth_.set(kUser, 5000.0);

    // Act
    auto eval = tracker_->evaluate(kUser);

    // Assert
    EXPECT_EQ(eval.outcome, HawlOutcome::WindowInterrupted);
    EXPECT_FALSE(lifecycle_->findDraft(kUser).has_value());
    EXPECT_TRUE(lifecycle_->get(kUser, recordId).failedWith(domain::LifecycleErrorCode::RecordNotFound));
    EXPECT_EQ(lifecycle_->count(kUser, RecordStatus::Finalized), 0);
}

TEST_F(HawlTrackerTest, InterruptedUserCanStartAgain) {
    arm(10000.0);
    clock_.advanceDays(100);
    wealth_.set(kUser, 5000.0);
    ASSERT_EQ(tracker_->evaluate(kUser).outcome, HawlOutcome::WindowInterrupted);

    clock_.advanceDays(10);
    wealth_.set(kUser, 7000.0);
    auto eval = tracker_->evaluate(kUser);

    EXPECT_EQ(eval.outcome, HawlOutcome::ThresholdFirstCrossed);
    EXPECT_EQ(lifecycle_->findDraft(kUser)->hawlStartDate, (nisab::utils::CivilDate{2026, 4, 21}));
}

TEST_F(HawlTrackerTest, WindowElapsedAboveThresholdIsCompletedNotFinalized) {
    auto recordId = arm(10000.0);
    clock_.advanceDays(354);
    wealth_.set(kUser, 12000.0);

    auto eval = tracker_->evaluate(kUser);

    EXPECT_EQ(eval.outcome, HawlOutcome::WindowCompleted);
    auto record = lifecycle_->get(kUser, recordId);
    ASSERT_TRUE(record.isSuccess());
    EXPECT_EQ(record.record().status, RecordStatus::Draft);
}

TEST_F(HawlTrackerTest, WindowElapsedBelowThresholdKeepsDraft) {
    arm(10000.0);
    clock_.advanceDays(360);
    wealth_.set(kUser, 1000.0);

    auto eval = tracker_->evaluate(kUser);

    EXPECT_EQ(eval.outcome, HawlOutcome::NoChange);
    EXPECT_TRUE(lifecycle_->findDraft(kUser).has_value());
}

TEST_F(HawlTrackerTest, MissingPriceFallsBackToLockedThreshold) {
    arm(10000.0);
    clock_.advanceDays(50);
    thresholds_.clear();
    wealth_.set(kUser, 6500.0);

    auto eval = tracker_->evaluate(kUser);

    EXPECT_EQ(eval.outcome, HawlOutcome::NoChange);
    EXPECT_TRUE(eval.usedLockedThreshold);
    EXPECT_DOUBLE_EQ(eval.thresholdValue, 6000.0);
}

TEST_F(HawlTrackerTest, RisingThresholdCanInterrupt) {
    arm(10000.0);
    clock_.advanceDays(30);
    thresholds_.set("USD", NisabBasis::Gold, 11000.0);

    auto eval = tracker_->evaluate(kUser);

    EXPECT_EQ(eval.outcome, HawlOutcome::WindowInterrupted);
    EXPECT_FALSE(eval.usedLockedThreshold);
}

TEST_F(HawlTrackerTest, WealthFailurePropagates) {
    wealth_.failFor(kUser);

    EXPECT_THROW(tracker_->evaluate(kUser), nisab::common::CryptoException);
}

// --- Live progress ---

TEST_F(HawlTrackerTest, LiveProgressOfOpenWindow) {
    // Arrange
    auto recordId = arm(10000.0);
    clock_.advanceDays(177);
    wealth_.set(kUser, 8000.0);
    thresholds_.set("USD", NisabBasis::Gold, 6400.0);
    auto draft = lifecycle_->get(kUser, recordId).record();

    // Act
    auto progress = tracker_->liveProgress(draft);

    // Assert
    EXPECT_EQ(progress.daysElapsed, 177);
    EXPECT_EQ(progress.daysRemaining, 177);
    EXPECT_DOUBLE_EQ(progress.progressPercent, 50.0);
    EXPECT_DOUBLE_EQ(progress.currentWealth, 8000.0);
    EXPECT_DOUBLE_EQ(progress.currentThreshold, 6400.0);
    EXPECT_TRUE(progress.aboveNisab);
    EXPECT_DOUBLE_EQ(progress.percentageOfNisab, 125.0);
    EXPECT_FALSE(progress.canFinalize);
    // Estimated against the locked 6,000
    EXPECT_DOUBLE_EQ(progress.estimatedObligation, 50.0);
}

TEST_F(HawlTrackerTest, LiveProgressIsCappedAtCompletion) {
    auto recordId = arm(10000.0);
    clock_.advanceDays(400);
    auto draft = lifecycle_->get(kUser, recordId).record();

    auto progress = tracker_->liveProgress(draft);

    EXPECT_EQ(progress.daysElapsed, 354);
    EXPECT_EQ(progress.daysRemaining, 0);
    EXPECT_DOUBLE_EQ(progress.progressPercent, 100.0);
    EXPECT_TRUE(progress.canFinalize);
}

TEST(HawlTrackerConstructionTest, NullDependenciesThrow) {
    EXPECT_THROW(services::HawlTracker(nullptr, nullptr, nullptr, nullptr, nullptr), std::invalid_argument);
}

} // namespace
