#include "market_data/odds_service.hpp"
#include "market_data/odds_normalizer.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace betarb {

namespace {
    std::string join(const std::vector<std::string>& items) {
        std::string out;
        for (size_t i = 0; i < items.size(); i++) {
            if (i > 0) out += ",";
            out += items[i];
        }
        return out;
    }
}

void from_json(const nlohmann::json& j, Sport& s) {
    j.at("key").get_to(s.key);
    if (j.contains("group")) j.at("group").get_to(s.group);
    if (j.contains("title")) j.at("title").get_to(s.title);
    if (j.contains("active")) j.at("active").get_to(s.active);
    if (j.contains("has_outrights")) j.at("has_outrights").get_to(s.has_outrights);
}

OddsService::OddsService(std::shared_ptr<OddsProvider> provider,
                         std::shared_ptr<CredentialStore> credentials,
                         std::shared_ptr<QuoteCache> cache)
    : provider_(std::move(provider))
    , credentials_(std::move(credentials))
    , cache_(std::move(cache))
{
}

std::string OddsService::acquire_credential() const {
    auto key = credentials_->best_credential();
    if (!key) {
        throw ConfigurationError(credentials_->size() == 0
            ? "No API keys configured"
            : "All API keys are out of quota");
    }
    return *key;
}

void OddsService::record(const std::string& key, const std::optional<int64_t>& remaining,
                         const std::optional<int64_t>& used) {
    if (remaining) {
        credentials_->record_usage(key, remaining, used);
    }
}

ProviderResponse OddsService::fetch(const std::string& key,
                                    const std::function<ProviderResponse()>& call) {
    try {
        auto response = call();
        record(key, response.requests_remaining, response.requests_used);
        return response;
    } catch (const UpstreamError& e) {
        // Rejected keys still report quota, and rotation depends on it
        record(key, e.requests_remaining, e.requests_used);
        throw;
    }
}

std::vector<Sport> OddsService::get_sports() {
    auto body = cache_->cache_get("", CacheClass::SPORTS);
    if (!body) {
        std::string key = acquire_credential();
        auto response = fetch(key, [&] { return provider_->fetch_sports(key); });
        if (!response.body.is_array()) {
            throw UpstreamError("Sports list is not an array");
        }
        cache_->cache_put("", response.body, CacheClass::SPORTS);
        body = response.body;
    }

    std::vector<Sport> sports;
    if (!body->is_array()) {
        throw UpstreamError("Cached sports list is not an array");
    }
    for (const auto& item : *body) {
        try {
            auto sport = item.get<Sport>();
            if (sport.active) {
                sports.push_back(std::move(sport));
            }
        } catch (const nlohmann::json::exception& e) {
            spdlog::debug("Skipping malformed sport entry: {}", e.what());
        }
    }
    return sports;
}

std::vector<CanonicalGame> OddsService::get_odds(const OddsRequest& request) {
    std::string signature = QuoteCache::signature(request.sport,
                                                  join(request.markets),
                                                  join(request.bookmakers));

    if (auto cached = cache_->cache_get(signature, CacheClass::ODDS)) {
        return normalize::from_odds_api(*cached);
    }

    std::string key = acquire_credential();
    auto response = fetch(key, [&] { return provider_->fetch_odds(key, request); });

    spdlog::debug("Fetched odds for {} via {} (remaining: {})",
                  request.sport, mask_key(key),
                  response.requests_remaining ? std::to_string(*response.requests_remaining) : "?");

    if (!response.body.is_array()) {
        throw UpstreamError(fmt::format("Odds for {} are not an array", request.sport));
    }
    cache_->cache_put(signature, response.body, CacheClass::ODDS);
    return normalize::from_odds_api(response.body);
}

} // namespace betarb
