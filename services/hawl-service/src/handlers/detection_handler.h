#pragma once

#include <drogon/HttpAppFramework.h>
#include <functional>

namespace nisab::hawl::infrastructure {
    class HawlDetectionJob;
    class HawlDetectionScheduler;
}

namespace nisab::hawl::handlers {

/**
 * @brief Hawl detection job control
 *
 * - POST /api/hawl/detection/trigger - Queue a run on the scheduler thread
 * - GET  /api/hawl/detection/status  - Scheduler state and last run result
 */
class DetectionHandler {
public:
    DetectionHandler(infrastructure::HawlDetectionJob* job,
                     infrastructure::HawlDetectionScheduler* scheduler);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    /**
     * @brief POST /api/hawl/detection/trigger
     *
     * Returns 202 immediately; the result is read from the status endpoint.
     */
    void handleTrigger(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    void handleStatus(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    infrastructure::HawlDetectionJob* job_;
    infrastructure::HawlDetectionScheduler* scheduler_;
};

} // namespace nisab::hawl::handlers
