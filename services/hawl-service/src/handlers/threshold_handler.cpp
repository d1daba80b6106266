/** @file threshold_handler.cpp
 *  @brief ThresholdHandler implementation
 */

#include "threshold_handler.h"
#include "request_utils.h"
#include "../services/price_oracle_cache.h"
#include "../domain/repositories/i_user_repository.h"
#include "exceptions.h"
#include "nisab/utils/string_utils.h"

#include <spdlog/spdlog.h>
#include <cctype>

namespace nisab::hawl::handlers {

namespace {

bool isCurrencyCode(const std::string& code) {
    if (code.size() != 3) return false;
    for (char c : code) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

ThresholdHandler::ThresholdHandler(services::PriceOracleCache* oracle,
                                   domain::IUserRepository* users,
                                   std::string defaultCurrency)
    : oracle_(oracle), users_(users), defaultCurrency_(std::move(defaultCurrency)) {

    if (!oracle_ || !users_) {
        throw std::invalid_argument("ThresholdHandler: service/repository pointers cannot be nullptr");
    }

    spdlog::info("[ThresholdHandler] Initialized");
}

void ThresholdHandler::registerRoutes(drogon::HttpAppFramework& app) {
    // GET /api/nisab/threshold
    app.registerHandler(
        "/api/nisab/threshold",
        [this](const drogon::HttpRequestPtr& req,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
            handleThreshold(req, std::move(callback));
        },
        {drogon::Get}
    );

    spdlog::info("[ThresholdHandler] Routes registered");
}

void ThresholdHandler::handleThreshold(
    const drogon::HttpRequestPtr& req,
    std::function<void(const drogon::HttpResponsePtr&)>&& callback) {

    try {
        std::string currency = utils::toUpper(utils::trim(req->getParameter("currency")));
        if (currency.empty()) {
            currency = defaultCurrency_;
            if (auto userId = callerId(req)) {
                if (auto user = users_->findById(*userId)) {
                    currency = user->currency;
                }
            }
        }
        if (!isCurrencyCode(currency)) {
            callback(common::handler::badRequest("currency must be a 3-letter ISO 4217 code"));
            return;
        }

        auto thresholds = oracle_->getBothThresholds(currency);
        callback(common::handler::ok(thresholds.toJson()));

    } catch (const common::PriceUnavailableException& e) {
        callback(priceUnavailable(e));
    } catch (const std::exception& e) {
        callback(common::handler::internalError("ThresholdHandler::handleThreshold", e));
    }
}

} // namespace nisab::hawl::handlers
