#pragma once

/**
 * @file metal_price.h
 * @brief Nisab basis (gold/silver) and cached metal price readings
 *
 * @date 2026-10-18
 */

#include "nisab_constants.h"
#include <chrono>
#include <optional>
#include <string>

namespace nisab::hawl::domain {

enum class NisabBasis {
    Gold,
    Silver
};

inline std::string toString(NisabBasis basis) {
    return basis == NisabBasis::Gold ? "gold" : "silver";
}

inline std::optional<NisabBasis> parseNisabBasis(const std::string& text) {
    if (text == "gold" || text == "GOLD") return NisabBasis::Gold;
    if (text == "silver" || text == "SILVER") return NisabBasis::Silver;
    return std::nullopt;
}

/** @brief Price feed symbol: XAU or XAG */
inline std::string metalSymbol(NisabBasis basis) {
    return basis == NisabBasis::Gold ? "XAU" : "XAG";
}

inline double nisabGrams(NisabBasis basis) {
    return basis == NisabBasis::Gold ? NISAB_GOLD_GRAMS : NISAB_SILVER_GRAMS;
}

/**
 * @brief One row of precious_metal_price_cache
 *
 * Rows are superseded by newer fetches, never updated or deleted.
 */
struct PriceCacheEntry {
    std::string id;
    NisabBasis metal = NisabBasis::Gold;
    std::string currency;
    double pricePerGram = 0.0;
    std::chrono::system_clock::time_point fetchedAt;
    std::chrono::system_clock::time_point expiresAt;

    bool isExpired(std::chrono::system_clock::time_point now) const {
        return now >= expiresAt;
    }
};

} // namespace nisab::hawl::domain
