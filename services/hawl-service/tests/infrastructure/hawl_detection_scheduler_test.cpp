/**
 * @file hawl_detection_scheduler_test.cpp
 * @brief Unit tests for HawlDetectionScheduler
 */

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "infrastructure/hawl_detection_scheduler.h"

using nisab::hawl::infrastructure::HawlDetectionScheduler;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Records triggers and lets the test wait for a number of runs
 */
class RunRecorder {
public:
    void record(const std::string& trigger) {
        std::lock_guard<std::mutex> lock(mutex_);
        triggers_.push_back(trigger);
        cv_.notify_all();
    }

    bool waitFor(size_t runs, std::chrono::milliseconds timeout = 5s) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return triggers_.size() >= runs; });
    }

    std::vector<std::string> triggers() {
        std::lock_guard<std::mutex> lock(mutex_);
        return triggers_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::string> triggers_;
};

class HawlDetectionSchedulerTest : public ::testing::Test {
protected:
    RunRecorder recorder_;
    HawlDetectionScheduler scheduler_;

    void SetUp() override {
        scheduler_.setRunFn([this](const std::string& trigger) { recorder_.record(trigger); });
    }

    void TearDown() override {
        scheduler_.stop();
    }
};

TEST_F(HawlDetectionSchedulerTest, FirstRunAfterInitialDelayIsScheduled) {
    scheduler_.configure(3600s, 0s);

    scheduler_.start();

    ASSERT_TRUE(recorder_.waitFor(1));
    EXPECT_EQ(recorder_.triggers()[0], "scheduled");
}

TEST_F(HawlDetectionSchedulerTest, TriggerNowRunsAsManual) {
    // Arrange: first periodic run is an hour away
    scheduler_.configure(3600s, 3600s);
    scheduler_.start();

    // Act
    scheduler_.triggerNow();

    // Assert
    ASSERT_TRUE(recorder_.waitFor(1));
    auto triggers = recorder_.triggers();
    ASSERT_EQ(triggers.size(), 1u);
    EXPECT_EQ(triggers[0], "manual");
}

TEST_F(HawlDetectionSchedulerTest, NonPeriodicSchedulerOnlyServesTriggers) {
    scheduler_.configure(1s, 0s, false);
    scheduler_.start();

    std::this_thread::sleep_for(200ms);
    EXPECT_TRUE(recorder_.triggers().empty());

    scheduler_.triggerNow();
    ASSERT_TRUE(recorder_.waitFor(1));
    EXPECT_EQ(recorder_.triggers()[0], "manual");
}

TEST_F(HawlDetectionSchedulerTest, FailingRunDoesNotStopScheduler) {
    int calls = 0;
    scheduler_.setRunFn([&](const std::string& trigger) {
        recorder_.record(trigger);
        if (++calls == 1) {
            throw std::runtime_error("user list unavailable");
        }
    });
    scheduler_.configure(3600s, 3600s);
    scheduler_.start();

    scheduler_.triggerNow();
    ASSERT_TRUE(recorder_.waitFor(1));
    scheduler_.triggerNow();
    ASSERT_TRUE(recorder_.waitFor(2));

    EXPECT_TRUE(scheduler_.isRunning());
}

TEST_F(HawlDetectionSchedulerTest, StopJoinsAndIsIdempotent) {
    scheduler_.configure(3600s, 3600s);
    scheduler_.start();
    scheduler_.start();
    EXPECT_TRUE(scheduler_.isRunning());

    scheduler_.stop();
    scheduler_.stop();

    EXPECT_FALSE(scheduler_.isRunning());
    EXPECT_TRUE(recorder_.triggers().empty());
}

} // namespace
