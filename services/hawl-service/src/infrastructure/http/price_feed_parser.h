/**
 * @file price_feed_parser.h
 * @brief Metal price response parsing (goldapi.io format)
 */
#pragma once

#include <optional>
#include <string>

namespace nisab::hawl::infrastructure::http {

/**
 * @brief Extract the price of one gram from a price feed response body
 *
 * Uses "price_gram_24k" when present, otherwise "price" (per troy ounce)
 * divided by 31.1034768. Responses carrying "error", non-JSON bodies and
 * missing or non-positive prices yield std::nullopt.
 */
std::optional<double> parsePricePerGram(const std::string& body);

} // namespace nisab::hawl::infrastructure::http
