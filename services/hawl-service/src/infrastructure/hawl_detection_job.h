#pragma once

/**
 * @file hawl_detection_job.h
 * @brief One pass of Hawl detection over all active users
 *
 * Users are evaluated independently by a bounded pool of worker
 * threads. A failing user is logged and counted; it never stops the
 * pass. Users not finished when the deadline expires are counted as
 * abandoned and are picked up by the next run.
 *
 * @date 2026-10-18
 */

#include "../domain/models/detection_job_result.h"
#include "../domain/models/hawl_evaluation.h"
#include "../domain/models/user_profile.h"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace nisab::hawl::infrastructure {

class HawlDetectionJob {
public:
    using ListUsersFn = std::function<std::vector<domain::UserProfile>()>;
    using EvaluateUserFn = std::function<domain::HawlEvaluation(const domain::UserProfile&)>;

    struct Options {
        int concurrency = 8;
        std::chrono::milliseconds deadline{50000};
    };

    HawlDetectionJob(ListUsersFn listUsers, EvaluateUserFn evaluateUser, Options options);

    /**
     * @brief Waits for workers still running from an abandoned run
     */
    ~HawlDetectionJob();

    HawlDetectionJob(const HawlDetectionJob&) = delete;
    HawlDetectionJob& operator=(const HawlDetectionJob&) = delete;

    /**
     * @brief Evaluate every active user once
     *
     * Runs are serialized: a manual trigger during a scheduled run waits
     * for it to finish.
     *
     * @param trigger "scheduled" or "manual"
     * @throws std::exception if the user list cannot be loaded
     */
    domain::DetectionJobResult run(const std::string& trigger);

    /** @brief Result of the most recent completed run */
    std::optional<domain::DetectionJobResult> lastResult() const;

private:
    struct WorkerTracker {
        std::mutex mutex;
        std::condition_variable cv;
        int active = 0;
    };

    ListUsersFn listUsers_;
    EvaluateUserFn evaluateUser_;
    Options options_;

    std::shared_ptr<WorkerTracker> tracker_;

    std::mutex runMutex_;
    mutable std::mutex resultMutex_;
    std::optional<domain::DetectionJobResult> lastResult_;
};

} // namespace nisab::hawl::infrastructure
