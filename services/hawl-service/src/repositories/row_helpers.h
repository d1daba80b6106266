#pragma once

/**
 * @file row_helpers.h
 * @brief Conversions between query result rows and domain values
 *
 * Every function throws common::ParsingException when a stored value
 * cannot be interpreted, since that means the row is corrupt.
 */

#include "field_cipher.h"
#include "nisab/utils/hijri_calendar.h"
#include "nisab/utils/time_utils.h"
#include <json/json.h>
#include <chrono>
#include <optional>
#include <string>

namespace nisab::hawl::repositories::rows {

std::chrono::system_clock::time_point requireTimestamp(const Json::Value& row, const std::string& field);

std::optional<std::chrono::system_clock::time_point> optionalTimestamp(const Json::Value& row,
                                                                       const std::string& field);

utils::CivilDate requireDate(const Json::Value& row, const std::string& field);

utils::hijri::HijriDate requireHijriDate(const Json::Value& row, const std::string& field);

/** @brief ISO 8601 with milliseconds, accepted by TIMESTAMPTZ */
std::string timestampParam(const std::chrono::system_clock::time_point& tp);

std::string optionalTimestampParam(const std::optional<std::chrono::system_clock::time_point>& tp);

std::string compactJson(const Json::Value& json);

Json::Value parseJson(const std::string& text);

/** @brief Encrypted "%.2f" text, or "" (NULL) when absent */
std::string encryptAmount(const common::IFieldCipher& cipher, const std::optional<double>& amount);

std::optional<double> decryptAmount(const common::IFieldCipher& cipher, const Json::Value& row,
                                    const std::string& field);

} // namespace nisab::hawl::repositories::rows
