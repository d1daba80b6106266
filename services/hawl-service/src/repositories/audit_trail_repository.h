#pragma once

#include "../domain/repositories/i_audit_trail_repository.h"
#include "i_query_executor.h"
#include "field_cipher.h"

namespace nisab::hawl::repositories {

/**
 * @brief audit_trail_entry table operations (INSERT and SELECT only)
 *
 * The change summary is stored as encrypted JSON.
 */
class AuditTrailRepository : public domain::IAuditTrailRepository {
public:
    AuditTrailRepository(common::IQueryExecutor* executor, const common::IFieldCipher* cipher);

    void append(domain::AuditTrailEntry& entry) override;
    std::vector<domain::AuditTrailEntry> findByRecord(const std::string& recordId) override;
    std::optional<domain::AuditTrailEntry> findLatest(const std::string& recordId) override;

private:
    domain::AuditTrailEntry rowToEntry(const Json::Value& row) const;

    common::IQueryExecutor* queryExecutor_;
    const common::IFieldCipher* cipher_;
};

} // namespace nisab::hawl::repositories
