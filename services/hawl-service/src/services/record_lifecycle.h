#pragma once

/**
 * @file record_lifecycle.h
 * @brief Nisab year record state machine
 *
 *   draft --finalize--> finalized --unlock--> unlocked --finalize--> finalized
 *                                                 |
 *                                                edit
 *
 * Every write runs in one unit of work together with its audit entry.
 * Validation failures come back as LifecycleResult errors; only
 * infrastructure failures (database, audit write) are thrown.
 * Every operation is scoped to the calling user: a record owned by
 * someone else is reported as RecordNotFound.
 *
 * @date 2026-10-18
 */

#include "audit_ledger.h"
#include "../domain/models/lifecycle_result.h"
#include "../domain/models/wealth_snapshot.h"
#include "../domain/ports/i_clock.h"
#include "../domain/ports/i_unit_of_work.h"
#include "../domain/repositories/i_nisab_year_record_repository.h"
#include "field_cipher.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace nisab::hawl::services {

/**
 * @brief Fields that may change while a record is unlocked
 */
struct RecordEdit {
    std::optional<double> totalWealth;
    std::optional<double> thresholdValue;
    std::optional<domain::WealthBreakdown> breakdown;
    std::optional<std::string> notes;

    bool empty() const {
        return !totalWealth && !thresholdValue && !breakdown && !notes;
    }
};

class RecordLifecycle {
public:
    /**
     * @param uowFactory Opens the transaction for each write
     * @param reader Repository for reads outside a transaction
     * @param ledger Audit ledger written inside each transaction
     * @param cipher Encrypts unlock reasons
     * @param clock Time source for dates and timestamps
     */
    RecordLifecycle(domain::IUnitOfWorkFactory* uowFactory,
                    domain::INisabYearRecordRepository* reader,
                    AuditLedger* ledger,
                    common::IFieldCipher* cipher,
                    domain::IClock* clock);

    RecordLifecycle(const RecordLifecycle&) = delete;
    RecordLifecycle& operator=(const RecordLifecycle&) = delete;

    /**
     * @brief Open a new observation window (draft)
     *
     * Expected completion = startDate + 354 days. Basis and threshold
     * value are locked for the life of the record.
     *
     * Fails with DuplicateOpenWindow if the user already has a draft.
     */
    domain::LifecycleResult create(const std::string& userId,
                                   const utils::CivilDate& startDate,
                                   domain::NisabBasis basis,
                                   double thresholdValue,
                                   const std::string& currency,
                                   const AuditContext& context = {});

    /**
     * @brief Lock the wealth snapshot and compute the obligation
     *
     * From draft: the Hawl window must have elapsed and a snapshot is required.
     * From unlocked: re-locks; without a snapshot the edited values are kept.
     * The obligation always uses the threshold locked on the record.
     */
    domain::LifecycleResult finalize(const std::string& userId,
                                     const std::string& recordId,
                                     const std::optional<domain::WealthSnapshot>& snapshot,
                                     const AuditContext& context = {});

    /**
     * @brief Reopen a finalized record for correction
     *
     * The reason is trimmed and must have at least 10 characters; it is
     * stored encrypted on the record and in the audit entry.
     */
    domain::LifecycleResult unlock(const std::string& userId,
                                   const std::string& recordId,
                                   const std::string& reason,
                                   const AuditContext& context = {});

    /** @brief Change values of an unlocked record; status is unchanged */
    domain::LifecycleResult edit(const std::string& userId,
                                 const std::string& recordId,
                                 const RecordEdit& changes,
                                 const AuditContext& context = {});

    /** @brief Delete a draft (and its audit entries) */
    domain::LifecycleResult remove(const std::string& userId, const std::string& recordId);

    /**
     * @brief Close an interrupted window: the draft is deleted and the
     *        user has no open window afterwards
     */
    domain::LifecycleResult abandonInterrupted(const std::string& userId, const std::string& recordId);

    domain::LifecycleResult get(const std::string& userId, const std::string& recordId);

    std::vector<domain::NisabYearRecord> list(const std::string& userId,
                                              const std::optional<domain::RecordStatus>& status,
                                              int limit, int offset);

    int count(const std::string& userId, const std::optional<domain::RecordStatus>& status);

    std::optional<domain::NisabYearRecord> findDraft(const std::string& userId);

private:
    using Operation = std::function<domain::LifecycleResult(domain::IUnitOfWork&)>;

    /**
     * @brief Run op in a new unit of work; commit only on success
     */
    domain::LifecycleResult inTransaction(const char* operation, const Operation& op);

    /** @brief Locked row, or nullopt when missing or owned by another user */
    std::optional<domain::NisabYearRecord> loadOwned(domain::IUnitOfWork& uow,
                                                     const std::string& userId,
                                                     const std::string& recordId);

    domain::LifecycleResult deleteDraft(const std::string& userId,
                                        const std::string& recordId,
                                        const char* operation);

    domain::IUnitOfWorkFactory* uowFactory_;
    domain::INisabYearRecordRepository* reader_;
    AuditLedger* ledger_;
    common::IFieldCipher* cipher_;
    domain::IClock* clock_;
};

} // namespace nisab::hawl::services
