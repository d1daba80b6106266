/**
 * @file price_feed_client.h
 * @brief HTTP price feed client (goldapi.io compatible)
 */
#pragma once

#include "../../domain/ports/i_price_feed.h"
#include <trantor/net/EventLoopThread.h>
#include <string>

namespace nisab::hawl::infrastructure::http {

/**
 * @brief Fetches GET {baseUrl}/{XAU|XAG}/{CURRENCY} with Drogon's HttpClient
 *
 * Blocks the calling thread until the response arrives or the timeout
 * expires. Requests run on the client's own event loop thread, so
 * callers may be Drogon handler threads.
 */
class PriceFeedClient : public domain::IPriceFeed {
public:
    /**
     * @param baseUrl e.g. "https://www.goldapi.io/api"
     * @param apiKey Sent as x-access-token
     * @param timeoutSeconds Request timeout
     */
    PriceFeedClient(std::string baseUrl, std::string apiKey, int timeoutSeconds = 5);

    std::optional<double> fetchPricePerGram(domain::NisabBasis basis, const std::string& currency) override;

private:
    /** @brief "https://host[:port]" */
    std::string extractHost(const std::string& url) const;

    /** @brief Path after the host, without trailing slash ("" for none) */
    std::string extractPath(const std::string& url) const;

    std::string baseUrl_;
    std::string apiKey_;
    int timeoutSeconds_;

    trantor::EventLoopThread loopThread_;
};

} // namespace nisab::hawl::infrastructure::http
