#pragma once

/**
 * @file hawl_tracker.h
 * @brief Per-user Hawl detection
 *
 * A user is Unarmed (no draft record) or Armed (one draft record).
 *
 * Unarmed: wealth >= current threshold opens a draft starting today
 *          (threshold_first_crossed).
 * Armed:   wealth is compared against the current threshold for the
 *          draft's basis and currency (the locked value when no price
 *          is available).
 *          - window elapsed, wealth >= threshold: window_completed
 *          - before the window elapsed, wealth < threshold: the draft
 *            is deleted (window_interrupted) and the user is Unarmed
 *          - otherwise: no_change
 *
 * Finalization is never automatic.
 *
 * @date 2026-10-18
 */

#include "record_lifecycle.h"
#include "../domain/models/hawl_evaluation.h"
#include "../domain/models/user_profile.h"
#include "../domain/ports/i_clock.h"
#include "../domain/ports/i_threshold_provider.h"
#include "../domain/ports/i_wealth_source.h"
#include "../domain/repositories/i_user_repository.h"
#include <string>

namespace nisab::hawl::services {

class HawlTracker {
public:
    HawlTracker(domain::IThresholdProvider* thresholds,
                domain::IWealthSource* wealth,
                RecordLifecycle* lifecycle,
                domain::IUserRepository* users,
                domain::IClock* clock);

    /**
     * @brief Evaluate a user by id
     * @throws common::NisabException if the user does not exist
     */
    domain::HawlEvaluation evaluate(const std::string& userId);

    /**
     * @throws common::PriceUnavailableException when an Unarmed user has
     *         wealth but no threshold can be priced
     */
    domain::HawlEvaluation evaluate(const domain::UserProfile& user);

    /**
     * @brief Progress of a draft window as of today, computed on read
     */
    domain::LiveHawlProgress liveProgress(const domain::NisabYearRecord& record);

private:
    domain::HawlEvaluation evaluateUnarmed(const domain::UserProfile& user);
    domain::HawlEvaluation evaluateArmed(const domain::UserProfile& user, const domain::NisabYearRecord& draft);

    /**
     * @brief Current threshold for the record's basis and currency, or
     *        its locked threshold when no price is available
     */
    double currentThreshold(const domain::NisabYearRecord& record, bool& usedLocked);

    domain::IThresholdProvider* thresholds_;
    domain::IWealthSource* wealth_;
    RecordLifecycle* lifecycle_;
    domain::IUserRepository* users_;
    domain::IClock* clock_;
};

} // namespace nisab::hawl::services
