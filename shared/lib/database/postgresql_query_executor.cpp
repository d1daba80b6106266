#include "postgresql_query_executor.h"
#include "exceptions.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <stdexcept>

namespace nisab::common {

namespace pg {

namespace {

constexpr Oid kBoolOid = 16;
constexpr Oid kInt8Oid = 20;
constexpr Oid kInt2Oid = 21;
constexpr Oid kInt4Oid = 23;
constexpr Oid kFloat4Oid = 700;
constexpr Oid kFloat8Oid = 701;
constexpr Oid kNumericOid = 1700;

Json::Value convertValue(const char* value, Oid type) {
    switch (type) {
        case kInt2Oid:
        case kInt4Oid:
            return Json::Value(std::atoi(value));
        case kInt8Oid:
            return Json::Value(static_cast<Json::Int64>(std::atoll(value)));
        case kFloat4Oid:
        case kFloat8Oid:
        case kNumericOid:
            return Json::Value(std::atof(value));
        case kBoolOid:
            return Json::Value(value[0] == 't');
        default:
            return Json::Value(value);
    }
}

} // anonymous namespace

ResultPtr execParams(PGconn* conn, const std::string& query,
                     const std::vector<std::string>& params) {
    std::vector<const char*> paramValues;
    paramValues.reserve(params.size());
    for (const auto& param : params) {
        paramValues.push_back(param.empty() ? nullptr : param.c_str());
    }

    ResultPtr res(PQexecParams(
        conn,
        query.c_str(),
        static_cast<int>(params.size()),
        nullptr,             // infer parameter types
        paramValues.data(),
        nullptr,             // text parameters
        nullptr,
        0                    // text results
    ), &PQclear);

    if (!res) {
        throw DatabaseException("query execution failed: null result");
    }

    ExecStatusType status = PQresultStatus(res.get());
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        std::string error = PQerrorMessage(conn);
        spdlog::debug("[PostgreSQLQueryExecutor] Failed query: {}", query);
        throw DatabaseException(error);
    }
    return res;
}

Json::Value toJson(PGresult* res) {
    Json::Value array = Json::arrayValue;

    int rows = PQntuples(res);
    int cols = PQnfields(res);

    for (int i = 0; i < rows; ++i) {
        Json::Value row(Json::objectValue);
        for (int j = 0; j < cols; ++j) {
            const char* fieldName = PQfname(res, j);
            if (PQgetisnull(res, i, j)) {
                row[fieldName] = Json::nullValue;
            } else {
                row[fieldName] = convertValue(PQgetvalue(res, i, j), PQftype(res, j));
            }
        }
        array.append(row);
    }
    return array;
}

Json::Value toScalar(PGresult* res) {
    if (PQntuples(res) == 0) {
        throw DatabaseException("scalar query returned no rows");
    }
    if (PQnfields(res) != 1) {
        throw DatabaseException("scalar query must return exactly one column");
    }
    if (PQgetisnull(res, 0, 0)) {
        return Json::nullValue;
    }
    return convertValue(PQgetvalue(res, 0, 0), PQftype(res, 0));
}

int affectedRows(PGresult* res) {
    const char* tuples = PQcmdTuples(res);
    return (tuples && tuples[0] != '\0') ? std::atoi(tuples) : 0;
}

} // namespace pg

// ============================================================================
// PostgreSQLQueryExecutor
// ============================================================================

PostgreSQLQueryExecutor::PostgreSQLQueryExecutor(DbConnectionPool* pool)
    : pool_(pool)
{
    if (!pool_) {
        throw std::invalid_argument("PostgreSQLQueryExecutor: pool cannot be nullptr");
    }
}

Json::Value PostgreSQLQueryExecutor::executeQuery(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    auto conn = pool_->acquire();
    auto res = pg::execParams(conn.get(), query, params);
    return pg::toJson(res.get());
}

int PostgreSQLQueryExecutor::executeCommand(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    auto conn = pool_->acquire();
    auto res = pg::execParams(conn.get(), query, params);
    int affected = pg::affectedRows(res.get());
    spdlog::debug("[PostgreSQLQueryExecutor] Command affected {} rows", affected);
    return affected;
}

Json::Value PostgreSQLQueryExecutor::executeScalar(
    const std::string& query,
    const std::vector<std::string>& params
)
{
    auto conn = pool_->acquire();
    auto res = pg::execParams(conn.get(), query, params);
    return pg::toScalar(res.get());
}

} // namespace nisab::common
