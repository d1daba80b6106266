#pragma once

#include "../models/user_profile.h"
#include <optional>
#include <string>
#include <vector>

namespace nisab::hawl::domain {

class IUserRepository {
public:
    virtual ~IUserRepository() = default;

    /** @brief Users the detection job should evaluate */
    virtual std::vector<UserProfile> findActiveUsers() = 0;

    virtual std::optional<UserProfile> findById(const std::string& userId) = 0;
};

} // namespace nisab::hawl::domain
