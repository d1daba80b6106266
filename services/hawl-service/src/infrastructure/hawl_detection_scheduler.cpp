/**
 * @file hawl_detection_scheduler.cpp
 * @brief HawlDetectionScheduler implementation
 */

#include "hawl_detection_scheduler.h"
#include <spdlog/spdlog.h>
#include <exception>

namespace nisab::hawl::infrastructure {

HawlDetectionScheduler::HawlDetectionScheduler() : running_(false) {}

HawlDetectionScheduler::~HawlDetectionScheduler() {
    stop();
}

void HawlDetectionScheduler::configure(std::chrono::seconds interval, std::chrono::seconds initialDelay,
                                       bool periodic) {
    periodic_ = periodic;
    interval_ = interval.count() > 0 ? interval : std::chrono::seconds(60);
    initialDelay_ = initialDelay.count() >= 0 ? initialDelay : std::chrono::seconds(0);
}

void HawlDetectionScheduler::setRunFn(RunFn fn) {
    runFn_ = std::move(fn);
}

void HawlDetectionScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }

    thread_ = std::thread([this]() {
        if (periodic_) {
            spdlog::info("Hawl detection scheduler started (every {} min, first run in {} s)",
                         interval_.count() / 60, initialDelay_.count());
        } else {
            spdlog::info("Hawl detection scheduler started (manual triggers only)");
        }

        auto wait = initialDelay_;
        while (running_) {
            bool forced = false;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                auto ready = [this]() { return !running_ || forceRun_; };
                if (periodic_) {
                    cv_.wait_for(lock, wait, ready);
                } else {
                    cv_.wait(lock, ready);
                }
                if (!running_) break;
                forced = forceRun_;
                forceRun_ = false;
            }

            runOnce(forced ? "manual" : "scheduled");
            wait = interval_;
        }

        spdlog::info("Hawl detection scheduler stopped");
    });
}

void HawlDetectionScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
}

void HawlDetectionScheduler::triggerNow() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forceRun_ = true;
    }
    cv_.notify_all();
}

void HawlDetectionScheduler::runOnce(const std::string& trigger) {
    if (!runFn_) return;
    try {
        runFn_(trigger);
    } catch (const std::exception& e) {
        spdlog::error("Hawl detection run ({}) failed: {}", trigger, e.what());
    }
}

} // namespace nisab::hawl::infrastructure
