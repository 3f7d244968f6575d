#pragma once

#include <string>
#include <map>
#include "market_data/odds_provider.hpp"

namespace betarb {

/**
 * The Odds API v4 over libcurl.
 *   GET {base}/sports
 *   GET {base}/sports/{sport}/odds?apiKey=..&regions=..&markets=..&oddsFormat=decimal
 * Quota comes back in x-requests-remaining / x-requests-used.
 */
class OddsApiClient : public OddsProvider {
public:
    explicit OddsApiClient(const std::string& base_url = "https://api.the-odds-api.com/v4",
                           long timeout_seconds = 30);
    ~OddsApiClient() override;

    OddsApiClient(const OddsApiClient&) = delete;
    OddsApiClient& operator=(const OddsApiClient&) = delete;

    ProviderResponse fetch_sports(const std::string& api_key) override;
    ProviderResponse fetch_odds(const std::string& api_key, const OddsRequest& request) override;

    std::string name() const override { return "the-odds-api"; }

    std::string build_odds_url(const std::string& api_key, const OddsRequest& request) const;

private:
    std::string base_url_;
    long timeout_seconds_;

    ProviderResponse http_get(const std::string& url);
    std::string url_escape(const std::string& s) const;
};

} // namespace betarb
