#include "pg_unit_of_work.h"
#include <stdexcept>

namespace nisab::hawl::infrastructure {

PgUnitOfWork::PgUnitOfWork(common::DbConnectionPool* pool, const common::IFieldCipher* cipher)
    : tx_(pool), records_(&tx_, cipher), audit_(&tx_, cipher) {}

PgUnitOfWorkFactory::PgUnitOfWorkFactory(common::DbConnectionPool* pool, const common::IFieldCipher* cipher)
    : pool_(pool), cipher_(cipher)
{
    if (!pool_ || !cipher_) {
        throw std::invalid_argument("PgUnitOfWorkFactory: pool and cipher cannot be nullptr");
    }
}

std::unique_ptr<domain::IUnitOfWork> PgUnitOfWorkFactory::begin() {
    return std::make_unique<PgUnitOfWork>(pool_, cipher_);
}

} // namespace nisab::hawl::infrastructure
