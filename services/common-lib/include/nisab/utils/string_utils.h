/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * @date 2026-10-18
 */

#pragma once

#include <string>

namespace nisab {
namespace utils {

std::string toLower(const std::string& str);

std::string toUpper(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 */
std::string trim(const std::string& str);

/**
 * @brief Number of Unicode code points in a UTF-8 string
 *
 * Continuation bytes are not counted, so "مال" has length 3.
 */
size_t utf8Length(const std::string& str);

} // namespace utils
} // namespace nisab
