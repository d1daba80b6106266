#pragma once

#include "../models/audit_trail_entry.h"
#include <optional>
#include <string>
#include <vector>

namespace nisab::hawl::domain {

/**
 * @brief Append-only storage of audit entries
 *
 * No update or delete. Entries only disappear
 * with their draft record (INisabYearRecordRepository::remove).
 */
class IAuditTrailRepository {
public:
    virtual ~IAuditTrailRepository() = default;

    /**
     * @brief Store a new entry; sets entry.id
     * @throws common::DatabaseException on failure
     */
    virtual void append(AuditTrailEntry& entry) = 0;

    /** @brief Ordered by sequence */
    virtual std::vector<AuditTrailEntry> findByRecord(const std::string& recordId) = 0;

    virtual std::optional<AuditTrailEntry> findLatest(const std::string& recordId) = 0;
};

} // namespace nisab::hawl::domain
