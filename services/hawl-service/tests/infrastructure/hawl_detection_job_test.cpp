/**
 * @file hawl_detection_job_test.cpp
 * @brief Unit tests for HawlDetectionJob
 *
 * Per-outcome counting, isolation of failing users and the run deadline.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>

#include "infrastructure/hawl_detection_job.h"

using namespace nisab::hawl;
using domain::HawlEvaluation;
using domain::HawlOutcome;
using domain::UserProfile;
using infrastructure::HawlDetectionJob;

namespace {

std::vector<UserProfile> makeUsers(int n) {
    std::vector<UserProfile> users;
    for (int i = 0; i < n; ++i) {
        users.push_back({"user-" + std::to_string(i), "USD", domain::NisabBasis::Gold});
    }
    return users;
}

HawlEvaluation outcome(const UserProfile& user, HawlOutcome o) {
    HawlEvaluation eval;
    eval.userId = user.id;
    eval.outcome = o;
    return eval;
}

class HawlDetectionJobTest : public ::testing::Test {
protected:
    HawlDetectionJob::Options options(int concurrency, std::chrono::milliseconds deadline = std::chrono::seconds(10)) {
        HawlDetectionJob::Options o;
        o.concurrency = concurrency;
        o.deadline = deadline;
        return o;
    }
};

// --- Counting Tests ---

TEST_F(HawlDetectionJobTest, CountsEachOutcome) {
    // Arrange
    std::map<std::string, HawlOutcome> outcomes = {
        {"user-0", HawlOutcome::ThresholdFirstCrossed},
        {"user-1", HawlOutcome::ThresholdFirstCrossed},
        {"user-2", HawlOutcome::WindowCompleted},
        {"user-3", HawlOutcome::WindowInterrupted},
        {"user-4", HawlOutcome::NoChange},
    };
    HawlDetectionJob job(
        []() { return makeUsers(5); },
        [&outcomes](const UserProfile& u) { return outcome(u, outcomes.at(u.id)); },
        options(3));

    // Act
    auto result = job.run("scheduled");

    // Assert
    EXPECT_EQ(result.trigger, "scheduled");
    EXPECT_EQ(result.usersTotal, 5);
    EXPECT_EQ(result.usersProcessed, 5);
    EXPECT_EQ(result.nisabAchievements, 2);
    EXPECT_EQ(result.completions, 1);
    EXPECT_EQ(result.interruptions, 1);
    EXPECT_EQ(result.errors, 0);
    EXPECT_EQ(result.abandoned, 0);
}

TEST_F(HawlDetectionJobTest, EveryUserIsEvaluatedOnce) {
    std::mutex mutex;
    std::multiset<std::string> seen;
    HawlDetectionJob job(
        []() { return makeUsers(50); },
        [&](const UserProfile& u) {
            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(u.id);
            return outcome(u, HawlOutcome::NoChange);
        },
        options(8));

    auto result = job.run("scheduled");

    EXPECT_EQ(result.usersProcessed, 50);
    EXPECT_EQ(seen.size(), 50u);
    for (const auto& id : seen) {
        EXPECT_EQ(seen.count(id), 1u);
    }
}

TEST_F(HawlDetectionJobTest, NoUsersIsAnEmptyRun) {
    HawlDetectionJob job(
        []() { return std::vector<UserProfile>{}; },
        [](const UserProfile& u) { return outcome(u, HawlOutcome::NoChange); },
        options(4));

    auto result = job.run("manual");

    EXPECT_EQ(result.usersTotal, 0);
    EXPECT_EQ(result.usersProcessed, 0);
    EXPECT_EQ(result.abandoned, 0);
}

// --- Failure Isolation Tests ---

TEST_F(HawlDetectionJobTest, FailingUserDoesNotStopOthers) {
    HawlDetectionJob job(
        []() { return makeUsers(4); },
        [](const UserProfile& u) {
            if (u.id == "user-1") {
                throw std::runtime_error("cannot decrypt assets");
            }
            return outcome(u, HawlOutcome::ThresholdFirstCrossed);
        },
        options(1));

    auto result = job.run("scheduled");

    EXPECT_EQ(result.usersProcessed, 4);
    EXPECT_EQ(result.errors, 1);
    EXPECT_EQ(result.nisabAchievements, 3);
}

TEST_F(HawlDetectionJobTest, UserListFailurePropagates) {
    HawlDetectionJob job(
        []() -> std::vector<UserProfile> { throw std::runtime_error("database down"); },
        [](const UserProfile& u) { return outcome(u, HawlOutcome::NoChange); },
        options(2));

    EXPECT_THROW(job.run("scheduled"), std::runtime_error);
    EXPECT_FALSE(job.lastResult().has_value());
}

// --- Deadline Tests ---

TEST_F(HawlDetectionJobTest, UnfinishedUsersAreAbandonedAtDeadline) {
    // Arrange: the second user blocks until released after the run returns
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<int> evaluated{0};
    auto job = std::make_unique<HawlDetectionJob>(
        []() { return makeUsers(3); },
        [&](const UserProfile& u) {
            ++evaluated;
            if (u.id == "user-1") {
                released.wait();
            }
            return outcome(u, HawlOutcome::NoChange);
        },
        options(1, std::chrono::milliseconds(100)));

    // Act
    auto result = job->run("scheduled");
    release.set_value();
    job.reset();

    // Assert
    EXPECT_EQ(result.usersProcessed, 1);
    EXPECT_EQ(result.abandoned, 2);
    EXPECT_GE(result.durationMs, 100);
    // The cancelled worker does not pick up the third user
    EXPECT_EQ(evaluated.load(), 2);
}

// --- Result Tests ---

TEST_F(HawlDetectionJobTest, LastResultIsKept) {
    HawlDetectionJob job(
        []() { return makeUsers(2); },
        [](const UserProfile& u) { return outcome(u, HawlOutcome::WindowCompleted); },
        options(2));
    EXPECT_FALSE(job.lastResult().has_value());

    job.run("scheduled");
    job.run("manual");

    auto last = job.lastResult();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->trigger, "manual");
    EXPECT_EQ(last->completions, 2);

    Json::Value json = last->toJson();
    EXPECT_EQ(json["trigger"].asString(), "manual");
}

TEST_F(HawlDetectionJobTest, EmptyCallbacksAreRejected) {
    EXPECT_THROW(HawlDetectionJob(nullptr, nullptr, options(1)), std::invalid_argument);
}

} // namespace
