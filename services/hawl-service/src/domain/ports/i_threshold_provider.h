#pragma once

#include "../models/threshold_result.h"
#include <string>

namespace nisab::hawl::domain {

/**
 * @brief Current Nisab threshold for a basis and currency
 */
class IThresholdProvider {
public:
    virtual ~IThresholdProvider() = default;

    /**
     * @throws common::PriceUnavailableException when no price can be found
     */
    virtual ThresholdResult getNisabThreshold(const std::string& currency, NisabBasis basis) = 0;
};

} // namespace nisab::hawl::domain
