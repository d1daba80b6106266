/**
 * @file price_feed_parser.cpp
 * @brief Metal price response parsing
 */
#include "price_feed_parser.h"
#include "../../domain/models/nisab_constants.h"
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <memory>

namespace nisab::hawl::infrastructure::http {

namespace {

std::optional<double> positiveNumber(const Json::Value& value) {
    if (!value.isNumeric()) return std::nullopt;
    double v = value.asDouble();
    if (!std::isfinite(v) || v <= 0.0) return std::nullopt;
    return v;
}

} // anonymous namespace

std::optional<double> parsePricePerGram(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;

    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        spdlog::warn("[PriceFeed] Malformed response: {}", errors);
        return std::nullopt;
    }
    if (!root.isObject()) {
        spdlog::warn("[PriceFeed] Unexpected response shape");
        return std::nullopt;
    }
    if (root.isMember("error")) {
        spdlog::warn("[PriceFeed] Provider error: {}", root["error"].asString());
        return std::nullopt;
    }

    if (auto perGram = positiveNumber(root["price_gram_24k"])) {
        return perGram;
    }
    if (auto perOunce = positiveNumber(root["price"])) {
        return *perOunce / domain::TROY_OUNCE_TO_GRAMS;
    }

    spdlog::warn("[PriceFeed] Response has no usable price field");
    return std::nullopt;
}

} // namespace nisab::hawl::infrastructure::http
