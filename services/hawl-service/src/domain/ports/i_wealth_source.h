#pragma once

#include "../models/wealth_snapshot.h"
#include <string>

namespace nisab::hawl::domain {

/**
 * @brief Current zakatable wealth of a user
 */
class IWealthSource {
public:
    virtual ~IWealthSource() = default;

    virtual WealthSnapshot aggregateZakatableWealth(const std::string& userId) = 0;
};

} // namespace nisab::hawl::domain
