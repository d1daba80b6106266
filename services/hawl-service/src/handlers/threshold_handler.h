#pragma once

#include <drogon/HttpAppFramework.h>
#include <functional>
#include <string>

namespace nisab::hawl::services { class PriceOracleCache; }
namespace nisab::hawl::domain { class IUserRepository; }

namespace nisab::hawl::handlers {

/**
 * @brief Current Nisab thresholds
 *
 * - GET /api/nisab/threshold?currency=USD
 *
 * Without a currency parameter the caller's preferred currency is used,
 * then the configured reporting currency.
 */
class ThresholdHandler {
public:
    ThresholdHandler(services::PriceOracleCache* oracle,
                     domain::IUserRepository* users,
                     std::string defaultCurrency);

    void registerRoutes(drogon::HttpAppFramework& app);

private:
    void handleThreshold(
        const drogon::HttpRequestPtr& req,
        std::function<void(const drogon::HttpResponsePtr&)>&& callback);

    services::PriceOracleCache* oracle_;
    domain::IUserRepository* users_;
    std::string defaultCurrency_;
};

} // namespace nisab::hawl::handlers
