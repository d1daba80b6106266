#pragma once

#include <string>
#include <vector>
#include <json/json.h>

/**
 * @file i_query_executor.h
 * @brief Query execution seam used by every repository
 *
 * Rows come back as a JSON array of objects keyed by column name.
 * Parameters are bound positionally ($1, $2, ...); an empty string
 * parameter is bound as SQL NULL.
 *
 * @date 2026-10-18
 */

namespace nisab::common {

class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Execute a row-returning statement
     * @return Json::Value array of row objects
     * @throws DatabaseException on failure
     */
    virtual Json::Value executeQuery(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    /**
     * @brief Execute INSERT/UPDATE/DELETE
     * @return Number of affected rows
     * @throws DatabaseException on failure
     */
    virtual int executeCommand(
        const std::string& query,
        const std::vector<std::string>& params
    ) = 0;

    /**
     * @brief Execute a query returning one row with one column
     * @return The value (Json::nullValue for SQL NULL)
     * @throws DatabaseException on failure, no row, or more than one column
     */
    virtual Json::Value executeScalar(
        const std::string& query,
        const std::vector<std::string>& params = {}
    ) = 0;

    virtual std::string getDatabaseType() const = 0;
};

} // namespace nisab::common
