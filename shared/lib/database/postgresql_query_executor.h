#pragma once

#include "i_query_executor.h"
#include "db_connection_pool.h"
#include <libpq-fe.h>
#include <memory>

/**
 * @file postgresql_query_executor.h
 * @brief libpq-based IQueryExecutor
 *
 * PostgreSQLQueryExecutor borrows a pooled connection per call.
 * The pg:: helpers are shared with PostgreSQLTransaction, which runs
 * every call on one pinned connection.
 *
 * @date 2026-10-18
 */

namespace nisab::common {

namespace pg {

using ResultPtr = std::unique_ptr<PGresult, decltype(&PQclear)>;

/**
 * @brief PQexecParams with text parameters (empty -> NULL)
 * @throws DatabaseException when the statement fails
 */
ResultPtr execParams(PGconn* conn, const std::string& query,
                     const std::vector<std::string>& params);

/**
 * @brief Convert a result set to a JSON array
 *
 * INT2/INT4/INT8 -> integer, FLOAT4/FLOAT8/NUMERIC -> double,
 * BOOL -> bool, NULL -> null, everything else -> string.
 */
Json::Value toJson(PGresult* res);

/**
 * @brief Single value of a one-row, one-column result
 * @throws DatabaseException on shape mismatch
 */
Json::Value toScalar(PGresult* res);

int affectedRows(PGresult* res);

} // namespace pg

class PostgreSQLQueryExecutor : public IQueryExecutor {
public:
    /**
     * @throws std::invalid_argument if pool is nullptr
     */
    explicit PostgreSQLQueryExecutor(DbConnectionPool* pool);

    ~PostgreSQLQueryExecutor() override = default;

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

private:
    DbConnectionPool* pool_;  // Non-owning
};

} // namespace nisab::common
