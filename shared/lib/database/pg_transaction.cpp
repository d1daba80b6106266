#include "pg_transaction.h"
#include "postgresql_query_executor.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>

namespace nisab::common {

PostgreSQLTransaction::PostgreSQLTransaction(DbConnectionPool* pool)
    : conn_(pool ? pool->acquire() : DbConnection(nullptr, nullptr))
    , active_(false)
{
    if (!conn_.isValid()) {
        throw DatabaseException("PostgreSQLTransaction: no connection");
    }
    if (!conn_.execute("BEGIN")) {
        throw DatabaseException("BEGIN failed");
    }
    active_ = true;
}

PostgreSQLTransaction::~PostgreSQLTransaction() {
    if (active_) {
        rollback();
    }
}

void PostgreSQLTransaction::ensureActive() const {
    if (!active_) {
        throw DatabaseException("transaction is no longer active");
    }
}

Json::Value PostgreSQLTransaction::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    ensureActive();
    auto res = pg::execParams(conn_.get(), query, params);
    return pg::toJson(res.get());
}

int PostgreSQLTransaction::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    ensureActive();
    auto res = pg::execParams(conn_.get(), query, params);
    return pg::affectedRows(res.get());
}

Json::Value PostgreSQLTransaction::executeScalar(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    ensureActive();
    auto res = pg::execParams(conn_.get(), query, params);
    return pg::toScalar(res.get());
}

void PostgreSQLTransaction::commit() {
    ensureActive();
    if (!conn_.execute("COMMIT")) {
        rollback();
        throw DatabaseException("COMMIT failed");
    }
    active_ = false;
}

void PostgreSQLTransaction::rollback() {
    if (!active_) {
        return;
    }
    active_ = false;
    if (!conn_.execute("ROLLBACK")) {
        spdlog::error("[PostgreSQLTransaction] ROLLBACK failed; connection will be discarded");
    }
}

} // namespace nisab::common
