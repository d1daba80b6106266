#pragma once

#include "nisab/utils/time_utils.h"
#include <chrono>

namespace nisab::hawl::domain {

/**
 * @brief Source of "now" for every date decision in the engine
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;

    /** @brief UTC calendar date of now() */
    utils::CivilDate today() const { return utils::toCivilDate(now()); }
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace nisab::hawl::domain
