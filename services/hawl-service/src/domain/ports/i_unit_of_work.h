#pragma once

#include "../repositories/i_nisab_year_record_repository.h"
#include "../repositories/i_audit_trail_repository.h"
#include <memory>

namespace nisab::hawl::domain {

/**
 * @brief One atomic unit: record and audit writes commit or vanish together
 *
 * A unit of work destroyed without commit() is rolled back.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual INisabYearRecordRepository& records() = 0;
    virtual IAuditTrailRepository& audit() = 0;

    /**
     * @throws common::DatabaseException if the commit fails
     */
    virtual void commit() = 0;
};

class IUnitOfWorkFactory {
public:
    virtual ~IUnitOfWorkFactory() = default;

    /**
     * @throws common::DatabaseException if no transaction can be opened
     */
    virtual std::unique_ptr<IUnitOfWork> begin() = 0;
};

} // namespace nisab::hawl::domain
