#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace betarb {

struct ProviderResponse {
    nlohmann::json body;
    std::optional<int64_t> requests_remaining;
    std::optional<int64_t> requests_used;
};

struct OddsRequest {
    std::string sport;
    std::vector<std::string> markets{"h2h"};
    std::vector<std::string> bookmakers;   // Empty = all
    std::string regions{"eu,uk"};
};

/**
 * Upstream odds source. Implementations throw UpstreamError on transport
 * failure, non-success status or an unparseable body.
 */
class OddsProvider {
public:
    virtual ~OddsProvider() = default;

    virtual ProviderResponse fetch_sports(const std::string& api_key) = 0;
    virtual ProviderResponse fetch_odds(const std::string& api_key, const OddsRequest& request) = 0;

    virtual std::string name() const = 0;
};

} // namespace betarb
