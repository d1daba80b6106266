/**
 * @file hawl_detection_job.cpp
 * @brief HawlDetectionJob implementation
 */
#include "hawl_detection_job.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <thread>

namespace nisab::hawl::infrastructure {

namespace {

constexpr long long kSlowRunMs = 30000;

/**
 * @brief State of one run, shared with its workers
 *
 * Workers of an abandoned run keep it alive until they return.
 */
struct RunState {
    std::vector<domain::UserProfile> users;
    HawlDetectionJob::EvaluateUserFn evaluate;
    std::atomic<size_t> next{0};
    std::atomic<bool> cancelled{false};

    std::mutex mutex;
    std::condition_variable cv;
    int activeWorkers = 0;

    int processed = 0;
    int nisabAchievements = 0;
    int completions = 0;
    int interruptions = 0;
    int errors = 0;
};

void tally(RunState& state, domain::HawlOutcome outcome) {
    switch (outcome) {
        case domain::HawlOutcome::ThresholdFirstCrossed: ++state.nisabAchievements; break;
        case domain::HawlOutcome::WindowCompleted: ++state.completions; break;
        case domain::HawlOutcome::WindowInterrupted: ++state.interruptions; break;
        case domain::HawlOutcome::NoChange: break;
    }
}

void workerLoop(RunState& state) {
    while (!state.cancelled) {
        size_t index = state.next.fetch_add(1);
        if (index >= state.users.size()) break;

        const auto& user = state.users[index];
        try {
            domain::HawlEvaluation eval = state.evaluate(user);
            std::lock_guard<std::mutex> lock(state.mutex);
            ++state.processed;
            tally(state, eval.outcome);
        } catch (const std::exception& e) {
            spdlog::error("[HawlDetectionJob] User {} failed, skipped: {}", user.id, e.what());
            std::lock_guard<std::mutex> lock(state.mutex);
            ++state.processed;
            ++state.errors;
        }
    }
}

} // anonymous namespace

HawlDetectionJob::HawlDetectionJob(ListUsersFn listUsers, EvaluateUserFn evaluateUser, Options options)
    : listUsers_(std::move(listUsers)),
      evaluateUser_(std::move(evaluateUser)),
      options_(options),
      tracker_(std::make_shared<WorkerTracker>())
{
    if (!listUsers_ || !evaluateUser_) {
        throw std::invalid_argument("HawlDetectionJob: callbacks cannot be empty");
    }
    if (options_.concurrency < 1) {
        options_.concurrency = 1;
    }
}

HawlDetectionJob::~HawlDetectionJob() {
    std::unique_lock<std::mutex> lock(tracker_->mutex);
    if (tracker_->active > 0) {
        spdlog::info("[HawlDetectionJob] Waiting for {} worker(s) to finish", tracker_->active);
    }
    tracker_->cv.wait(lock, [this]() { return tracker_->active == 0; });
}

domain::DetectionJobResult HawlDetectionJob::run(const std::string& trigger) {
    std::lock_guard<std::mutex> runLock(runMutex_);

    domain::DetectionJobResult result;
    result.trigger = trigger;
    result.startedAt = std::chrono::system_clock::now();
    auto started = std::chrono::steady_clock::now();
    auto deadline = started + options_.deadline;

    auto state = std::make_shared<RunState>();
    state->users = listUsers_();
    state->evaluate = evaluateUser_;
    result.usersTotal = static_cast<int>(state->users.size());

    spdlog::info("[HawlDetectionJob] Starting {} run: {} user(s), concurrency {}",
                 trigger, result.usersTotal, options_.concurrency);

    int workers = std::min<int>(options_.concurrency, result.usersTotal);
    state->activeWorkers = workers;
    {
        std::lock_guard<std::mutex> lock(tracker_->mutex);
        tracker_->active += workers;
    }

    for (int i = 0; i < workers; ++i) {
        std::thread([state, tracker = tracker_]() {
            workerLoop(*state);
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                --state->activeWorkers;
            }
            state->cv.notify_all();

            std::lock_guard<std::mutex> lock(tracker->mutex);
            --tracker->active;
            tracker->cv.notify_all();
        }).detach();
    }

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        bool finished = state->cv.wait_until(lock, deadline, [&state]() {
            return state->activeWorkers == 0;
        });
        if (!finished) {
            state->cancelled = true;
        }

        result.usersProcessed = state->processed;
        result.nisabAchievements = state->nisabAchievements;
        result.completions = state->completions;
        result.interruptions = state->interruptions;
        result.errors = state->errors;
        result.abandoned = result.usersTotal - state->processed;
    }

    result.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (result.abandoned > 0) {
        spdlog::warn("[HawlDetectionJob] Deadline of {}ms reached, {} user(s) abandoned until next run",
                     options_.deadline.count(), result.abandoned);
    }
    spdlog::info("[HawlDetectionJob] {} run finished in {}ms: processed={}, achievements={}, "
                 "completions={}, interruptions={}, errors={}, abandoned={}",
                 trigger, result.durationMs, result.usersProcessed, result.nisabAchievements,
                 result.completions, result.interruptions, result.errors, result.abandoned);
    if (result.durationMs > kSlowRunMs) {
        spdlog::warn("[HawlDetectionJob] Run took {}ms (> {}ms)", result.durationMs, kSlowRunMs);
    }

    {
        std::lock_guard<std::mutex> lock(resultMutex_);
        lastResult_ = result;
    }
    return result;
}

std::optional<domain::DetectionJobResult> HawlDetectionJob::lastResult() const {
    std::lock_guard<std::mutex> lock(resultMutex_);
    return lastResult_;
}

} // namespace nisab::hawl::infrastructure
