/**
 * @file price_feed_client.cpp
 * @brief HTTP price feed client implementation
 */
#include "price_feed_client.h"
#include "price_feed_parser.h"
#include <drogon/HttpClient.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <future>
#include <memory>
#include <regex>

namespace nisab::hawl::infrastructure::http {

PriceFeedClient::PriceFeedClient(std::string baseUrl, std::string apiKey, int timeoutSeconds)
    : baseUrl_(std::move(baseUrl)), apiKey_(std::move(apiKey)), timeoutSeconds_(timeoutSeconds),
      loopThread_("PriceFeedLoop")
{
    loopThread_.run();
    if (apiKey_.empty()) {
        spdlog::warn("[PriceFeedClient] No API key configured; requests will be rejected by the provider");
    }
}

std::optional<double> PriceFeedClient::fetchPricePerGram(domain::NisabBasis basis, const std::string& currency) {
    std::string host = extractHost(baseUrl_);
    if (host.empty()) {
        spdlog::error("[PriceFeedClient] Invalid base URL: {}", baseUrl_);
        return std::nullopt;
    }
    std::string path = extractPath(baseUrl_) + "/" + domain::metalSymbol(basis) + "/" + currency;

    spdlog::debug("[PriceFeedClient] GET {}{}", host, path);

    auto client = drogon::HttpClient::newHttpClient(host, loopThread_.getLoop());
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setPath(path);
    req->setMethod(drogon::Get);
    req->addHeader("x-access-token", apiKey_);
    req->addHeader("Accept", "application/json");

    // Outlives this call when the response arrives after the timeout
    auto promise = std::make_shared<std::promise<std::optional<double>>>();
    auto future = promise->get_future();
    const std::string label = domain::metalSymbol(basis) + "/" + currency;

    client->sendRequest(req, [promise, label](drogon::ReqResult result,
                                              const drogon::HttpResponsePtr& response) {
        if (result != drogon::ReqResult::Ok || !response) {
            spdlog::warn("[PriceFeedClient] {} request failed: {}", label, static_cast<int>(result));
            promise->set_value(std::nullopt);
            return;
        }
        int status = static_cast<int>(response->getStatusCode());
        if (status < 200 || status >= 300) {
            spdlog::warn("[PriceFeedClient] {} HTTP error: {}", label, status);
            promise->set_value(std::nullopt);
            return;
        }
        promise->set_value(parsePricePerGram(std::string(response->getBody())));
    }, static_cast<double>(timeoutSeconds_));

    if (future.wait_for(std::chrono::seconds(timeoutSeconds_ + 1)) == std::future_status::timeout) {
        spdlog::warn("[PriceFeedClient] {} request timed out after {} seconds", label, timeoutSeconds_);
        return std::nullopt;
    }
    return future.get();
}

std::string PriceFeedClient::extractHost(const std::string& url) const {
    std::regex hostRegex(R"(^(https?://[^/]+))");
    std::smatch match;
    if (std::regex_search(url, match, hostRegex)) {
        return match.str(1);
    }
    return "";
}

std::string PriceFeedClient::extractPath(const std::string& url) const {
    std::regex pathRegex(R"(^https?://[^/]+(/.*)?$)");
    std::smatch match;
    if (std::regex_search(url, match, pathRegex)) {
        std::string path = match.str(1);
        while (!path.empty() && path.back() == '/') {
            path.pop_back();
        }
        return path;
    }
    return "";
}

} // namespace nisab::hawl::infrastructure::http
