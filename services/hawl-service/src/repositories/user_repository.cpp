/**
 * @file user_repository.cpp
 * @brief User repository implementation
 */
#include "user_repository.h"
#include "query_helpers.h"
#include "nisab/utils/string_utils.h"
#include <stdexcept>

using nisab::common::db::getString;

namespace nisab::hawl::repositories {

namespace {

const std::string kSelectColumns =
    "SELECT id::text AS id, currency, preferred_nisab_basis FROM app_user ";

} // anonymous namespace

UserRepository::UserRepository(common::IQueryExecutor* executor,
                               std::string defaultCurrency,
                               domain::NisabBasis defaultBasis)
    : queryExecutor_(executor), defaultCurrency_(std::move(defaultCurrency)), defaultBasis_(defaultBasis)
{
    if (!queryExecutor_) {
        throw std::invalid_argument("UserRepository: queryExecutor cannot be nullptr");
    }
}

std::vector<domain::UserProfile> UserRepository::findActiveUsers() {
    Json::Value rows = queryExecutor_->executeQuery(
        kSelectColumns + "WHERE is_active = TRUE ORDER BY created_at", {});

    std::vector<domain::UserProfile> users;
    users.reserve(rows.size());
    for (const auto& row : rows) {
        users.push_back(rowToProfile(row));
    }
    return users;
}

std::optional<domain::UserProfile> UserRepository::findById(const std::string& userId) {
    Json::Value rows = queryExecutor_->executeQuery(kSelectColumns + "WHERE id = $1::uuid", {userId});
    if (rows.empty()) {
        return std::nullopt;
    }
    return rowToProfile(rows[0]);
}

domain::UserProfile UserRepository::rowToProfile(const Json::Value& row) const {
    domain::UserProfile user;
    user.id = getString(row, "id");

    std::string currency = utils::toUpper(utils::trim(getString(row, "currency")));
    user.currency = currency.empty() ? defaultCurrency_ : currency;

    auto basis = domain::parseNisabBasis(getString(row, "preferred_nisab_basis"));
    user.preferredBasis = basis.value_or(defaultBasis_);
    return user;
}

} // namespace nisab::hawl::repositories
