#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "market_data/odds_provider.hpp"
#include "quotes/credential_store.hpp"
#include "quotes/quote_cache.hpp"

namespace betarb {

struct Sport {
    std::string key;
    std::string group;
    std::string title;
    bool active{true};
    bool has_outrights{false};
};

void from_json(const nlohmann::json& j, Sport& s);

/**
 * Cache-first access to upstream odds.
 *
 * On a miss: pick the best credential, call the provider, record the quota it
 * reports (also on a rejected request), store the raw body, normalize.
 * Throws ConfigurationError when no credential has quota left. UpstreamError
 * passes through from the provider, and is raised for a body that is not an
 * array; such bodies are never cached.
 */
class OddsService {
public:
    OddsService(std::shared_ptr<OddsProvider> provider,
                std::shared_ptr<CredentialStore> credentials,
                std::shared_ptr<QuoteCache> cache);

    // Active sports only
    std::vector<Sport> get_sports();

    std::vector<CanonicalGame> get_odds(const OddsRequest& request);

    CredentialStore& credentials() { return *credentials_; }
    QuoteCache& cache() { return *cache_; }

private:
    std::shared_ptr<OddsProvider> provider_;
    std::shared_ptr<CredentialStore> credentials_;
    std::shared_ptr<QuoteCache> cache_;

    std::string acquire_credential() const;
    void record(const std::string& key, const std::optional<int64_t>& remaining,
                const std::optional<int64_t>& used);
    ProviderResponse fetch(const std::string& key, const std::function<ProviderResponse()>& call);
};

} // namespace betarb
