#pragma once

#include <json/json.h>
#include <chrono>
#include <string>

namespace nisab::hawl::domain {

/**
 * @brief Statistics of one detection job run
 */
struct DetectionJobResult {
    std::string trigger;          ///< "scheduled" or "manual"
    std::chrono::system_clock::time_point startedAt;
    int usersTotal = 0;
    int usersProcessed = 0;
    int nisabAchievements = 0;
    int completions = 0;
    int interruptions = 0;
    int errors = 0;
    int abandoned = 0;           ///< not finished before the run deadline
    long long durationMs = 0;

    Json::Value toJson() const;
};

} // namespace nisab::hawl::domain
