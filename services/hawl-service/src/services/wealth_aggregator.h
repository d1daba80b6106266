#pragma once

/**
 * @file wealth_aggregator.h
 * @brief Sum of a user's zakat-eligible assets
 *
 * Reads the user's assets in one query and decrypts all values in one
 * batch. Pure read-and-compute; nothing is written.
 *
 * @date 2026-10-18
 */

#include "../domain/ports/i_wealth_source.h"
#include "../domain/ports/i_clock.h"
#include "../domain/repositories/i_asset_repository.h"
#include "field_cipher.h"
#include <string>

namespace nisab::hawl::services {

class WealthAggregator : public domain::IWealthSource {
public:
    WealthAggregator(domain::IAssetRepository* assetRepo,
                     common::IFieldCipher* cipher,
                     domain::IClock* clock);

    /**
     * @brief Total and per-category breakdown of zakat-eligible assets
     *
     * Each asset contributes value x calculationModifier.
     *
     * @throws common::CryptoException if a stored value cannot be decrypted
     * @throws common::ParsingException if a decrypted value is not a number
     */
    domain::WealthSnapshot aggregateZakatableWealth(const std::string& userId) override;

private:
    domain::IAssetRepository* assetRepo_;
    common::IFieldCipher* cipher_;
    domain::IClock* clock_;
};

} // namespace nisab::hawl::services
