#pragma once

#include <string>
#include <json/json.h>

/**
 * @file query_helpers.h
 * @brief Row value extraction and small SQL fragments
 *
 * Row values may arrive as native JSON types or as strings depending on
 * the column type (NUMERIC arrives as double, TEXT as string), so every
 * getter accepts both.
 *
 * @date 2026-10-18
 */

namespace nisab::common::db {

int getInt(const Json::Value& json, const std::string& field, int defaultValue = 0);

long long getInt64(const Json::Value& json, const std::string& field, long long defaultValue = 0);

double getDouble(const Json::Value& json, const std::string& field, double defaultValue = 0.0);

bool getBool(const Json::Value& json, const std::string& field, bool defaultValue = false);

/**
 * @brief String value, or defaultValue for a missing/NULL column
 */
std::string getString(const Json::Value& json, const std::string& field,
                      const std::string& defaultValue = "");

int scalarToInt(const Json::Value& value, int defaultValue = 0);

/**
 * @brief Format a monetary amount for a NUMERIC parameter ("1234.50")
 */
std::string formatAmount(double amount);

/**
 * @brief " LIMIT n OFFSET m" with both values clamped to >= 0
 */
std::string paginationClause(int limit, int offset);

} // namespace nisab::common::db
