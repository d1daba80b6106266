#pragma once

/**
 * @file nisab_constants.h
 * @brief Fixed religious and unit-conversion constants
 *
 * These are definitions, not configuration.
 *
 * @date 2026-10-18
 */

namespace nisab::hawl::domain {

constexpr double NISAB_GOLD_GRAMS = 87.48;
constexpr double NISAB_SILVER_GRAMS = 612.36;
constexpr double TROY_OUNCE_TO_GRAMS = 31.1034768;

constexpr double ZAKAT_RATE = 0.025;
constexpr int HAWL_DURATION_DAYS = 354;

constexpr int MIN_UNLOCK_REASON_LENGTH = 10;

} // namespace nisab::hawl::domain
