#include "query_helpers.h"
#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace nisab::common::db {

int getInt(const Json::Value& json, const std::string& field, int defaultValue) {
    return static_cast<int>(getInt64(json, field, defaultValue));
}

long long getInt64(const Json::Value& json, const std::string& field, long long defaultValue) {
    const Json::Value& v = json[field];
    if (v.isNull()) return defaultValue;
    if (v.isIntegral()) return v.asInt64();
    if (v.isDouble()) return static_cast<long long>(v.asDouble());
    if (v.isString()) {
        try {
            return std::stoll(v.asString());
        } catch (const std::exception&) {
            return defaultValue;
        }
    }
    return defaultValue;
}

double getDouble(const Json::Value& json, const std::string& field, double defaultValue) {
    const Json::Value& v = json[field];
    if (v.isNull()) return defaultValue;
    if (v.isNumeric()) return v.asDouble();
    if (v.isString()) {
        try {
            return std::stod(v.asString());
        } catch (const std::exception&) {
            return defaultValue;
        }
    }
    return defaultValue;
}

bool getBool(const Json::Value& json, const std::string& field, bool defaultValue) {
    const Json::Value& v = json[field];
    if (v.isNull()) return defaultValue;
    if (v.isBool()) return v.asBool();
    if (v.isIntegral()) return v.asInt() != 0;
    if (v.isString()) {
        std::string s = v.asString();
        return s == "t" || s == "true" || s == "1" || s == "TRUE";
    }
    return defaultValue;
}

std::string getString(const Json::Value& json, const std::string& field,
                      const std::string& defaultValue) {
    const Json::Value& v = json[field];
    if (v.isNull()) return defaultValue;
    return v.asString();
}

int scalarToInt(const Json::Value& value, int defaultValue) {
    if (value.isNull()) return defaultValue;
    if (value.isIntegral()) return value.asInt();
    if (value.isDouble()) return static_cast<int>(value.asDouble());
    if (value.isString()) {
        try {
            return std::stoi(value.asString());
        } catch (const std::exception&) {
            return defaultValue;
        }
    }
    return defaultValue;
}

std::string formatAmount(double amount) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", amount);
    return buf;
}

std::string paginationClause(int limit, int offset) {
    return " LIMIT " + std::to_string(std::max(limit, 0)) +
           " OFFSET " + std::to_string(std::max(offset, 0));
}

} // namespace nisab::common::db
