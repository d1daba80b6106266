/**
 * @file hawl_tracker.cpp
 * @brief HawlTracker implementation
 */
#include "hawl_tracker.h"
#include "../domain/models/nisab_constants.h"
#include "../domain/models/threshold_result.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace nisab::hawl::services {

using domain::HawlEvaluation;
using domain::HawlOutcome;
using domain::LifecycleErrorCode;

HawlTracker::HawlTracker(domain::IThresholdProvider* thresholds,
                         domain::IWealthSource* wealth,
                         RecordLifecycle* lifecycle,
                         domain::IUserRepository* users,
                         domain::IClock* clock)
    : thresholds_(thresholds), wealth_(wealth), lifecycle_(lifecycle), users_(users), clock_(clock)
{
    if (!thresholds_ || !wealth_ || !lifecycle_ || !users_ || !clock_) {
        throw std::invalid_argument("HawlTracker: dependencies cannot be nullptr");
    }
}

HawlEvaluation HawlTracker::evaluate(const std::string& userId) {
    auto user = users_->findById(userId);
    if (!user) {
        throw common::NisabException("Unknown user: " + userId);
    }
    return evaluate(*user);
}

HawlEvaluation HawlTracker::evaluate(const domain::UserProfile& user) {
    auto draft = lifecycle_->findDraft(user.id);
    if (!draft) {
        return evaluateUnarmed(user);
    }
    return evaluateArmed(user, *draft);
}

HawlEvaluation HawlTracker::evaluateUnarmed(const domain::UserProfile& user) {
    HawlEvaluation eval;
    eval.userId = user.id;
    eval.basis = user.preferredBasis;

    domain::WealthSnapshot snapshot = wealth_->aggregateZakatableWealth(user.id);
    eval.wealth = snapshot.total;
    if (snapshot.total <= 0.0) {
        return eval;
    }

    domain::ThresholdResult threshold = thresholds_->getNisabThreshold(user.currency, user.preferredBasis);
    eval.thresholdValue = threshold.thresholdValue;
    if (snapshot.total < threshold.thresholdValue) {
        return eval;
    }

    auto result = lifecycle_->create(user.id, clock_->today(), threshold.basis,
                                     threshold.thresholdValue, threshold.currency);
    if (result) {
        eval.outcome = HawlOutcome::ThresholdFirstCrossed;
        eval.recordId = result.record().id;
        spdlog::info("[HawlTracker] User {} reached Nisab: wealth {:.2f} >= {:.2f} {} ({}), Hawl started",
                     user.id, snapshot.total, threshold.thresholdValue, threshold.currency,
                     domain::toString(threshold.basis));
        return eval;
    }

    // Another request opened the window between findDraft and create
    if (result.failedWith(LifecycleErrorCode::DuplicateOpenWindow)) {
        spdlog::debug("[HawlTracker] User {} already has an open window", user.id);
        return eval;
    }

    throw common::NisabException("Failed to open Hawl window for user " + user.id + ": " +
                                 result.error().message);
}

HawlEvaluation HawlTracker::evaluateArmed(const domain::UserProfile& user, const domain::NisabYearRecord& draft) {
    HawlEvaluation eval;
    eval.userId = user.id;
    eval.recordId = draft.id;
    eval.basis = draft.basis;

    domain::WealthSnapshot snapshot = wealth_->aggregateZakatableWealth(user.id);
    eval.wealth = snapshot.total;
    eval.thresholdValue = currentThreshold(draft, eval.usedLockedThreshold);

    const bool aboveNisab = eval.wealth >= eval.thresholdValue;

    if (clock_->today() >= draft.expectedCompletionDate) {
        if (aboveNisab) {
            eval.outcome = HawlOutcome::WindowCompleted;
            spdlog::info("[HawlTracker] Hawl complete for user {} (record {}), awaiting finalization",
                         user.id, draft.id);
        }
        return eval;
    }

    if (aboveNisab) {
        return eval;
    }

    auto result = lifecycle_->abandonInterrupted(user.id, draft.id);
    if (result) {
        eval.outcome = HawlOutcome::WindowInterrupted;
        spdlog::info("[HawlTracker] Hawl interrupted for user {}: wealth {:.2f} < {:.2f}, record {} closed",
                     user.id, eval.wealth, eval.thresholdValue, draft.id);
        return eval;
    }

    // Finalized or deleted by the user in the meantime
    if (result.failedWith(LifecycleErrorCode::InvalidTransition) ||
        result.failedWith(LifecycleErrorCode::RecordNotFound)) {
        spdlog::debug("[HawlTracker] Record {} is no longer an open draft", draft.id);
        return eval;
    }

    throw common::NisabException("Failed to close interrupted window " + draft.id + ": " +
                                 result.error().message);
}

domain::LiveHawlProgress HawlTracker::liveProgress(const domain::NisabYearRecord& record) {
    domain::LiveHawlProgress progress;
    auto today = clock_->today();

    int totalDays = std::max(1, utils::daysBetween(record.hawlStartDate, record.expectedCompletionDate));
    int elapsed = std::clamp(utils::daysBetween(record.hawlStartDate, today), 0, totalDays);
    progress.daysElapsed = elapsed;
    progress.daysRemaining = totalDays - elapsed;
    progress.progressPercent = domain::roundMoney(100.0 * elapsed / totalDays);

    bool usedLocked = false;
    progress.currentWealth = wealth_->aggregateZakatableWealth(record.userId).total;
    progress.currentThreshold = currentThreshold(record, usedLocked);
    progress.aboveNisab = progress.currentWealth >= progress.currentThreshold;
    progress.percentageOfNisab = progress.currentThreshold > 0.0
        ? domain::roundMoney(100.0 * progress.currentWealth / progress.currentThreshold)
        : 0.0;
    progress.canFinalize = record.isDraft() && today >= record.expectedCompletionDate;
    progress.estimatedObligation = domain::computeObligation(progress.currentWealth, record.thresholdValue);
    return progress;
}

double HawlTracker::currentThreshold(const domain::NisabYearRecord& record, bool& usedLocked) {
    try {
        usedLocked = false;
        return thresholds_->getNisabThreshold(record.currency, record.basis).thresholdValue;
    } catch (const common::PriceUnavailableException& e) {
        spdlog::warn("[HawlTracker] {}; using locked threshold {:.2f} of record {}",
                     e.what(), record.thresholdValue, record.id);
        usedLocked = true;
        return record.thresholdValue;
    }
}

} // namespace nisab::hawl::services
