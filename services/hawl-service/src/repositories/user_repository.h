#pragma once

#include "../domain/repositories/i_user_repository.h"
#include "i_query_executor.h"
#include <string>

namespace nisab::hawl::repositories {

/**
 * @brief Read access to app_user
 *
 * Users without a currency or basis preference get the configured defaults.
 */
class UserRepository : public domain::IUserRepository {
public:
    UserRepository(common::IQueryExecutor* executor,
                   std::string defaultCurrency,
                   domain::NisabBasis defaultBasis);

    std::vector<domain::UserProfile> findActiveUsers() override;
    std::optional<domain::UserProfile> findById(const std::string& userId) override;

private:
    domain::UserProfile rowToProfile(const Json::Value& row) const;

    common::IQueryExecutor* queryExecutor_;
    std::string defaultCurrency_;
    domain::NisabBasis defaultBasis_;
};

} // namespace nisab::hawl::repositories
