#pragma once

/**
 * @file hawl_detection_scheduler.h
 * @brief Fixed-interval scheduler for the Hawl detection job
 *
 * Runs once after a startup delay, then every interval until stopped.
 * With periodic runs disabled the thread only serves triggerNow().
 * The run callback is injected; the scheduler has no knowledge of
 * users or records.
 *
 * @date 2026-10-18
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace nisab::hawl::infrastructure {

class HawlDetectionScheduler {
public:
    /** @brief Called with "scheduled" or "manual" */
    using RunFn = std::function<void(const std::string& trigger)>;

    HawlDetectionScheduler();
    ~HawlDetectionScheduler();

    HawlDetectionScheduler(const HawlDetectionScheduler&) = delete;
    HawlDetectionScheduler& operator=(const HawlDetectionScheduler&) = delete;

    /**
     * @param interval Time between runs
     * @param initialDelay Time before the first run
     */
    void configure(std::chrono::seconds interval, std::chrono::seconds initialDelay,
                   bool periodic = true);

    void setRunFn(RunFn fn);

    /** @brief Start the scheduler thread (no-op if already running) */
    void start();

    /** @brief Stop and join; a run in progress is allowed to finish */
    void stop();

    /** @brief Run as soon as possible instead of waiting for the interval */
    void triggerNow();

    bool isRunning() const { return running_; }

private:
    void runOnce(const std::string& trigger);

    std::atomic<bool> running_;
    bool forceRun_ = false;
    bool periodic_ = true;

    std::chrono::seconds interval_{3600};
    std::chrono::seconds initialDelay_{10};

    RunFn runFn_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace nisab::hawl::infrastructure
