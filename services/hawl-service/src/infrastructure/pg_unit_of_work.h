#pragma once

/**
 * @file pg_unit_of_work.h
 * @brief Unit of work over one PostgreSQL transaction
 *
 * The record and audit repositories share the transaction's pinned
 * connection. Destroying an uncommitted unit rolls it back.
 *
 * @date 2026-10-18
 */

#include "../domain/ports/i_unit_of_work.h"
#include "../repositories/audit_trail_repository.h"
#include "../repositories/nisab_year_record_repository.h"
#include "db_connection_pool.h"
#include "field_cipher.h"
#include "pg_transaction.h"

namespace nisab::hawl::infrastructure {

class PgUnitOfWork : public domain::IUnitOfWork {
public:
    /**
     * @throws common::DatabaseException if BEGIN fails
     */
    PgUnitOfWork(common::DbConnectionPool* pool, const common::IFieldCipher* cipher);

    domain::INisabYearRecordRepository& records() override { return records_; }
    domain::IAuditTrailRepository& audit() override { return audit_; }

    void commit() override { tx_.commit(); }

private:
    common::PostgreSQLTransaction tx_;
    repositories::NisabYearRecordRepository records_;
    repositories::AuditTrailRepository audit_;
};

class PgUnitOfWorkFactory : public domain::IUnitOfWorkFactory {
public:
    PgUnitOfWorkFactory(common::DbConnectionPool* pool, const common::IFieldCipher* cipher);

    std::unique_ptr<domain::IUnitOfWork> begin() override;

private:
    common::DbConnectionPool* pool_;
    const common::IFieldCipher* cipher_;
};

} // namespace nisab::hawl::infrastructure
