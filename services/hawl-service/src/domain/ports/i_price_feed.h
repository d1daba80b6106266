#pragma once

#include "../models/metal_price.h"
#include <optional>
#include <string>

namespace nisab::hawl::domain {

/**
 * @brief External precious metal price source
 *
 * Implementations are bounded by a timeout. Network errors, timeouts,
 * non-2xx responses and malformed payloads all come back as
 * std::nullopt; implementations do not throw.
 */
class IPriceFeed {
public:
    virtual ~IPriceFeed() = default;

    /**
     * @brief Current price of one gram of the basis metal
     * @param basis Gold (XAU) or silver (XAG)
     * @param currency ISO 4217 code, e.g. "USD"
     */
    virtual std::optional<double> fetchPricePerGram(NisabBasis basis, const std::string& currency) = 0;
};

} // namespace nisab::hawl::domain
