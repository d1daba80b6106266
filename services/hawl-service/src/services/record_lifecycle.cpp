/**
 * @file record_lifecycle.cpp
 * @brief RecordLifecycle implementation
 */
#include "record_lifecycle.h"
#include "../domain/models/nisab_constants.h"
#include "../domain/models/threshold_result.h"
#include "exceptions.h"
#include "query_helpers.h"
#include "nisab/utils/hijri_calendar.h"
#include "nisab/utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace nisab::hawl::services {

using domain::AuditEventType;
using domain::FinancialState;
using domain::LifecycleErrorCode;
using domain::LifecycleResult;
using domain::NisabYearRecord;
using domain::RecordStatus;

namespace {

bool isValidCurrency(const std::string& currency) {
    if (currency.size() != 3) return false;
    for (char c : currency) {
        if (!std::isupper(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool isValidAmount(double value) {
    return std::isfinite(value) && value >= 0.0;
}

std::string amountText(const std::optional<double>& value) {
    return value ? common::db::formatAmount(*value) : "";
}

std::string breakdownText(const std::optional<domain::WealthBreakdown>& breakdown) {
    if (!breakdown) return "";
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, domain::breakdownToJson(*breakdown));
}

LifecycleResult notFound(const std::string& recordId) {
    return LifecycleResult::fail(LifecycleErrorCode::RecordNotFound, "Record not found: " + recordId);
}

} // anonymous namespace

RecordLifecycle::RecordLifecycle(domain::IUnitOfWorkFactory* uowFactory,
                                 domain::INisabYearRecordRepository* reader,
                                 AuditLedger* ledger,
                                 common::IFieldCipher* cipher,
                                 domain::IClock* clock)
    : uowFactory_(uowFactory), reader_(reader), ledger_(ledger), cipher_(cipher), clock_(clock)
{
    if (!uowFactory_ || !reader_ || !ledger_ || !cipher_ || !clock_) {
        throw std::invalid_argument("RecordLifecycle: dependencies cannot be nullptr");
    }
}

// --- Writes ---

LifecycleResult RecordLifecycle::create(const std::string& userId,
                                        const utils::CivilDate& startDate,
                                        domain::NisabBasis basis,
                                        double thresholdValue,
                                        const std::string& currency,
                                        const AuditContext& context) {
    if (userId.empty()) {
        return LifecycleResult::fail(LifecycleErrorCode::InvalidInput, "User id is required");
    }
    if (!utils::isValidCivilDate(startDate.year, startDate.month, startDate.day)) {
        return LifecycleResult::fail(LifecycleErrorCode::InvalidInput, "Invalid Hawl start date");
    }
    if (!std::isfinite(thresholdValue) || thresholdValue <= 0.0) {
        return LifecycleResult::fail(LifecycleErrorCode::InvalidInput, "Threshold value must be positive");
    }
    const std::string cur = utils::toUpper(utils::trim(currency));
    if (!isValidCurrency(cur)) {
        return LifecycleResult::fail(LifecycleErrorCode::InvalidInput, "Invalid currency: " + currency);
    }

    return inTransaction("create", [&](domain::IUnitOfWork& uow) {
        uow.records().lockUser(userId);

        auto open = uow.records().findDraftByUser(userId);
        if (open) {
            return LifecycleResult::fail(LifecycleErrorCode::DuplicateOpenWindow,
                                         "User already has an open Hawl window: " + open->id);
        }

        auto now = clock_->now();
        NisabYearRecord record;
        record.userId = userId;
        record.status = RecordStatus::Draft;
        record.currency = cur;
        record.hawlStartDate = startDate;
        record.hawlStartDateHijri = utils::hijri::fromGregorian(startDate);
        record.expectedCompletionDate = utils::addDays(startDate, domain::HAWL_DURATION_DAYS);
        record.expectedCompletionDateHijri = utils::hijri::fromGregorian(record.expectedCompletionDate);
        record.basis = basis;
        record.thresholdValue = domain::roundMoney(thresholdValue);
        record.createdAt = now;
        record.updatedAt = now;

        uow.records().insert(record);

        domain::CreatedChange change;
        change.basis = record.basis;
        change.thresholdValue = record.thresholdValue;
        change.currency = record.currency;
        change.hawlStartDate = record.hawlStartDate;
        change.expectedCompletionDate = record.expectedCompletionDate;
        ledger_->append(uow.audit(), record, AuditEventType::Created, change, context);

        spdlog::info("[RecordLifecycle] Created draft {} for user {} ({} threshold {:.2f} {}, start {}, expected {})",
                     record.id, userId, domain::toString(basis), record.thresholdValue, cur,
                     record.hawlStartDate.toString(), record.expectedCompletionDate.toString());
        return LifecycleResult::ok(record);
    });
}

LifecycleResult RecordLifecycle::finalize(const std::string& userId,
                                          const std::string& recordId,
                                          const std::optional<domain::WealthSnapshot>& snapshot,
                                          const AuditContext& context) {
    if (snapshot && !isValidAmount(snapshot->total)) {
        return LifecycleResult::fail(LifecycleErrorCode::InvalidInput, "Final wealth must be a non-negative number");
    }

    return inTransaction("finalize", [&](domain::IUnitOfWork& uow) {
        auto record = loadOwned(uow, userId, recordId);
        if (!record) return notFound(recordId);

        const bool refinalize = record->status == RecordStatus::Unlocked;
        if (record->status == RecordStatus::Finalized) {
            return LifecycleResult::fail(LifecycleErrorCode::InvalidTransition, "Record is already finalized");
        }

        if (!refinalize) {
            auto today = clock_->today();
            if (today < record->expectedCompletionDate) {
                return LifecycleResult::fail(
                    LifecycleErrorCode::InvalidTransition,
                    "Hawl window has not elapsed: " +
                        std::to_string(utils::daysBetween(today, record->expectedCompletionDate)) +
                        " day(s) remaining until " + record->expectedCompletionDate.toString());
            }
            if (!snapshot) {
                return LifecycleResult::fail(LifecycleErrorCode::InvalidInput,
                                             "Final wealth snapshot is required to finalize a draft");
            }
        }

        FinancialState before = FinancialState::of(*record);

        if (snapshot) {
            record->totalWealth = domain::roundMoney(snapshot->total);
            record->breakdown = snapshot->breakdown;
        }
        if (!record->totalWealth) {
            return LifecycleResult::fail(LifecycleErrorCode::InvalidInput, "Record has no wealth value to lock");
        }

        auto now = clock_->now();
        record->zakatAmount = domain::computeObligation(*record->totalWealth, record->thresholdValue);
        record->status = RecordStatus::Finalized;
        record->finalizedAt = now;
        record->updatedAt = now;

        uow.records().update(*record);

        domain::FinalizationChange change{before, FinancialState::of(*record)};
        ledger_->append(uow.audit(), *record,
                        refinalize ? AuditEventType::Refinalized : AuditEventType::Finalized,
                        change, context);

        spdlog::info("[RecordLifecycle] {} record {} for user {}: wealth {:.2f}, threshold {:.2f}, obligation {:.2f}",
                     refinalize ? "Re-finalized" : "Finalized", record->id, userId,
                     *record->totalWealth, record->thresholdValue, *record->zakatAmount);
        return LifecycleResult::ok(*record);
    });
}

LifecycleResult RecordLifecycle::unlock(const std::string& userId,
                                        const std::string& recordId,
                                        const std::string& reason,
                                        const AuditContext& context) {
    const std::string trimmed = utils::trim(reason);
    if (static_cast<int>(utils::utf8Length(trimmed)) < domain::MIN_UNLOCK_REASON_LENGTH) {
        return LifecycleResult::fail(
            LifecycleErrorCode::InsufficientJustification,
            "Unlock reason must be at least " + std::to_string(domain::MIN_UNLOCK_REASON_LENGTH) + " characters");
    }

    return inTransaction("unlock", [&](domain::IUnitOfWork& uow) {
        auto record = loadOwned(uow, userId, recordId);
        if (!record) return notFound(recordId);

        if (record->status != RecordStatus::Finalized) {
            return LifecycleResult::fail(LifecycleErrorCode::InvalidTransition,
                                         "Only finalized records can be unlocked (status: " +
                                             domain::toString(record->status) + ")");
        }

        FinancialState locked = FinancialState::of(*record);
        std::string encryptedReason = cipher_->encrypt(trimmed);

        auto now = clock_->now();
        record->status = RecordStatus::Unlocked;
        record->unlockReasonEncrypted = encryptedReason;
        record->unlockedAt = now;
        record->updatedAt = now;

        uow.records().update(*record);

        domain::UnlockChange change{locked, encryptedReason};
        ledger_->append(uow.audit(), *record, AuditEventType::Unlocked, change, context);

        spdlog::info("[RecordLifecycle] Unlocked record {} for user {}", record->id, userId);
        return LifecycleResult::ok(*record);
    });
}

LifecycleResult RecordLifecycle::edit(const std::string& userId,
                                      const std::string& recordId,
                                      const RecordEdit& changes,
                                      const AuditContext& context) {
    if (changes.empty()) {
        return LifecycleResult::fail(LifecycleErrorCode::InvalidInput, "No fields to update");
    }
    if (changes.totalWealth && !isValidAmount(*changes.totalWealth)) {
        return LifecycleResult::fail(LifecycleErrorCode::InvalidInput, "Total wealth must be a non-negative number");
    }
    if (changes.thresholdValue && (!std::isfinite(*changes.thresholdValue) || *changes.thresholdValue <= 0.0)) {
        return LifecycleResult::fail(LifecycleErrorCode::InvalidInput, "Threshold value must be positive");
    }

    return inTransaction("edit", [&](domain::IUnitOfWork& uow) {
        auto record = loadOwned(uow, userId, recordId);
        if (!record) return notFound(recordId);

        if (record->status != RecordStatus::Unlocked) {
            return LifecycleResult::fail(LifecycleErrorCode::InvalidTransition,
                                         "Only unlocked records can be edited (status: " +
                                             domain::toString(record->status) + ")");
        }

        domain::EditChange change;
        if (changes.totalWealth) {
            std::optional<double> after = domain::roundMoney(*changes.totalWealth);
            if (amountText(record->totalWealth) != amountText(after)) {
                change.fields.push_back({"totalWealth", amountText(record->totalWealth), amountText(after)});
                record->totalWealth = after;
            }
        }
        if (changes.thresholdValue) {
            double after = domain::roundMoney(*changes.thresholdValue);
            if (after != record->thresholdValue) {
                change.fields.push_back({"thresholdValue", common::db::formatAmount(record->thresholdValue),
                                         common::db::formatAmount(after)});
                record->thresholdValue = after;
            }
        }
        if (changes.breakdown) {
            std::string beforeText = breakdownText(record->breakdown);
            std::string afterText = breakdownText(changes.breakdown);
            if (beforeText != afterText) {
                change.fields.push_back({"breakdown", beforeText, afterText});
                record->breakdown = changes.breakdown;
            }
        }
        if (changes.notes && *changes.notes != record->notes) {
            change.fields.push_back({"notes", record->notes, *changes.notes});
            record->notes = *changes.notes;
        }

        if (change.fields.empty()) {
            return LifecycleResult::ok(*record);
        }

        record->updatedAt = clock_->now();
        uow.records().update(*record);
        ledger_->append(uow.audit(), *record, AuditEventType::Edited, change, context);

        spdlog::info("[RecordLifecycle] Edited record {} for user {} ({} field(s))",
                     record->id, userId, change.fields.size());
        return LifecycleResult::ok(*record);
    });
}

LifecycleResult RecordLifecycle::remove(const std::string& userId, const std::string& recordId) {
    return deleteDraft(userId, recordId, "delete");
}

LifecycleResult RecordLifecycle::abandonInterrupted(const std::string& userId, const std::string& recordId) {
    return deleteDraft(userId, recordId, "interrupt");
}

LifecycleResult RecordLifecycle::deleteDraft(const std::string& userId,
                                             const std::string& recordId,
                                             const char* operation) {
    return inTransaction(operation, [&](domain::IUnitOfWork& uow) {
        auto record = loadOwned(uow, userId, recordId);
        if (!record) return notFound(recordId);

        if (!record->isDraft()) {
            return LifecycleResult::fail(LifecycleErrorCode::InvalidTransition,
                                         "Only draft records can be deleted (status: " +
                                             domain::toString(record->status) + ")");
        }

        uow.records().remove(record->id);

        spdlog::info("[RecordLifecycle] Deleted draft {} for user {} ({})", record->id, userId, operation);
        return LifecycleResult::ok(*record);
    });
}

// --- Reads ---

LifecycleResult RecordLifecycle::get(const std::string& userId, const std::string& recordId) {
    auto record = reader_->findById(recordId);
    if (!record || record->userId != userId) return notFound(recordId);
    return LifecycleResult::ok(*record);
}

std::vector<NisabYearRecord> RecordLifecycle::list(const std::string& userId,
                                                   const std::optional<RecordStatus>& status,
                                                   int limit, int offset) {
    return reader_->findByUser(userId, status, limit, offset);
}

int RecordLifecycle::count(const std::string& userId, const std::optional<RecordStatus>& status) {
    return reader_->countByUser(userId, status);
}

std::optional<NisabYearRecord> RecordLifecycle::findDraft(const std::string& userId) {
    return reader_->findDraftByUser(userId);
}

// --- Helpers ---

LifecycleResult RecordLifecycle::inTransaction(const char* operation, const Operation& op) {
    auto uow = uowFactory_->begin();
    try {
        LifecycleResult result = op(*uow);
        if (result) {
            uow->commit();
        } else {
            spdlog::debug("[RecordLifecycle] {} rejected: {} ({})", operation,
                          result.error().message, domain::toString(result.error().code));
        }
        return result;
    } catch (const common::AuditWriteFailureException& e) {
        spdlog::error("[RecordLifecycle] {} rolled back: {}", operation, e.what());
        throw;
    }
}

std::optional<NisabYearRecord> RecordLifecycle::loadOwned(domain::IUnitOfWork& uow,
                                                          const std::string& userId,
                                                          const std::string& recordId) {
    auto record = uow.records().findByIdForUpdate(recordId);
    if (!record || record->userId != userId) {
        return std::nullopt;
    }
    return record;
}

} // namespace nisab::hawl::services
