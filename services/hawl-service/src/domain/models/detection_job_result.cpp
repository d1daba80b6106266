#include "detection_job_result.h"
#include "nisab/utils/time_utils.h"

namespace nisab::hawl::domain {

Json::Value DetectionJobResult::toJson() const {
    Json::Value json;
    json["trigger"] = trigger;
    json["startedAt"] = utils::formatIso8601(startedAt);
    json["usersTotal"] = usersTotal;
    json["usersProcessed"] = usersProcessed;
    json["nisabAchievements"] = nisabAchievements;
    json["completions"] = completions;
    json["interruptions"] = interruptions;
    json["errors"] = errors;
    json["abandoned"] = abandoned;
    json["durationMs"] = static_cast<Json::Int64>(durationMs);
    return json;
}

} // namespace nisab::hawl::domain
