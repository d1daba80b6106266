#pragma once

#include "../models/nisab_year_record.h"
#include <optional>
#include <string>
#include <vector>

namespace nisab::hawl::domain {

/**
 * @brief Persistence of NisabYearRecord rows
 *
 * All methods throw common::DatabaseException on storage failure.
 * Monetary fields are encrypted by the implementation, callers see plain values.
 */
class INisabYearRecordRepository {
public:
    virtual ~INisabYearRecordRepository() = default;

    virtual std::optional<NisabYearRecord> findById(const std::string& id) = 0;

    /**
     * @brief findById that also holds a row lock until the transaction ends
     */
    virtual std::optional<NisabYearRecord> findByIdForUpdate(const std::string& id) = 0;

    /** @brief The user's open window, if any */
    virtual std::optional<NisabYearRecord> findDraftByUser(const std::string& userId) = 0;

    /**
     * @brief Newest first
     */
    virtual std::vector<NisabYearRecord> findByUser(
        const std::string& userId,
        const std::optional<RecordStatus>& status,
        int limit,
        int offset) = 0;

    virtual int countByUser(const std::string& userId, const std::optional<RecordStatus>& status) = 0;

    /**
     * @brief Insert a new record; sets record.id
     */
    virtual void insert(NisabYearRecord& record) = 0;

    virtual void update(const NisabYearRecord& record) = 0;

    /**
     * @brief Delete a record together with its audit entries
     */
    virtual void remove(const std::string& id) = 0;

    /**
     * @brief Serialize record creation for one user until the transaction ends
     */
    virtual void lockUser(const std::string& userId) = 0;
};

} // namespace nisab::hawl::domain
