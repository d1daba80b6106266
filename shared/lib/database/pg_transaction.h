#pragma once

#include "i_query_executor.h"
#include "db_connection_pool.h"

/**
 * @file pg_transaction.h
 * @brief Executor bound to one connection inside BEGIN ... COMMIT
 *
 * The transaction is opened in the constructor. Destroying an
 * uncommitted transaction rolls it back, so an exception thrown
 * anywhere between construction and commit() leaves no trace.
 *
 * @date 2026-10-18
 */

namespace nisab::common {

class PostgreSQLTransaction : public IQueryExecutor {
public:
    /**
     * @throws DatabaseException if BEGIN fails
     */
    explicit PostgreSQLTransaction(DbConnectionPool* pool);
    ~PostgreSQLTransaction() override;

    PostgreSQLTransaction(const PostgreSQLTransaction&) = delete;
    PostgreSQLTransaction& operator=(const PostgreSQLTransaction&) = delete;

    Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) override;

    Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) override;

    std::string getDatabaseType() const override { return "postgres"; }

    /**
     * @throws DatabaseException if COMMIT fails (the transaction is then rolled back)
     */
    void commit();

    void rollback();

    bool isActive() const { return active_; }

private:
    void ensureActive() const;

    DbConnection conn_;
    bool active_;
};

} // namespace nisab::common
