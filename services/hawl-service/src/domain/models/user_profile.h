#pragma once

#include "metal_price.h"
#include <string>

namespace nisab::hawl::domain {

/**
 * @brief The parts of a user the engine needs
 */
struct UserProfile {
    std::string id;
    std::string currency = "USD";
    NisabBasis preferredBasis = NisabBasis::Gold;
};

} // namespace nisab::hawl::domain
