#include "quotes/quote_cache.hpp"
#include "utils/crypto.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace betarb {

namespace {
    nlohmann::json entry_to_json(const CacheEntry& e) {
        return nlohmann::json{
            {"data", e.data},
            {"timestamp", time_utils::to_iso8601(e.timestamp)}
        };
    }

    CacheEntry entry_from_json(const nlohmann::json& j) {
        auto ts = time_utils::parse_iso8601(j.at("timestamp").get<std::string>());
        if (!ts) {
            throw std::runtime_error("bad cache timestamp");
        }
        return CacheEntry{j.at("data"), *ts};
    }
}

QuoteCache::QuoteCache(std::shared_ptr<DocumentStore> store,
                       std::chrono::seconds odds_ttl,
                       std::chrono::seconds sports_ttl,
                       Clock clock)
    : store_(std::move(store))
    , odds_ttl_(odds_ttl)
    , sports_ttl_(sports_ttl)
    , clock_(std::move(clock))
{
    load();
}

std::string QuoteCache::signature(const std::string& sport,
                                  const std::string& markets,
                                  const std::string& bookmakers) {
    return crypto::md5_hex(fmt::format("{}:{}:{}", sport, markets,
                                       bookmakers.empty() ? "all" : bookmakers));
}

std::chrono::seconds QuoteCache::ttl(CacheClass cls) const {
    return cls == CacheClass::SPORTS ? sports_ttl_ : odds_ttl_;
}

bool QuoteCache::is_fresh(const CacheEntry& entry, CacheClass cls) const {
    return clock_() - entry.timestamp < ttl(cls);
}

std::optional<nlohmann::json> QuoteCache::cache_get(const std::string& signature,
                                                    CacheClass cls) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (cls == CacheClass::SPORTS) {
        if (sports_ && is_fresh(*sports_, cls)) {
            spdlog::debug("Cache hit: sports list");
            return sports_->data;
        }
        return std::nullopt;
    }

    auto it = odds_.find(signature);
    if (it != odds_.end() && is_fresh(it->second, cls)) {
        spdlog::debug("Cache hit: odds {}", signature);
        return it->second.data;
    }
    return std::nullopt;
}

void QuoteCache::cache_put(const std::string& signature,
                           const nlohmann::json& payload,
                           CacheClass cls) {
    std::lock_guard<std::mutex> lock(mutex_);

    CacheEntry entry{payload, clock_()};
    if (cls == CacheClass::SPORTS) {
        sports_ = entry;
    } else {
        odds_[signature] = entry;
    }
    persist_locked();
}

void QuoteCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sports_.reset();
    odds_.clear();
    persist_locked();
    spdlog::info("Quote cache cleared");
}

CacheStats QuoteCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s;
    s.sports_cached = sports_.has_value();
    s.odds_entries = odds_.size();
    s.sports_ttl_seconds = sports_ttl_.count();
    s.odds_ttl_seconds = odds_ttl_.count();
    return s;
}

void QuoteCache::load() {
    if (!store_) return;

    auto body = store_->load(DOCUMENT_NAME);
    if (!body) return;

    try {
        auto j = nlohmann::json::parse(*body);

        std::optional<CacheEntry> sports;
        if (j.contains("sports") && !j["sports"].is_null()) {
            sports = entry_from_json(j["sports"]);
        }

        std::map<std::string, CacheEntry> odds;
        if (j.contains("odds")) {
            for (const auto& [sig, entry] : j["odds"].items()) {
                odds.emplace(sig, entry_from_json(entry));
            }
        }

        sports_ = std::move(sports);
        odds_ = std::move(odds);
        spdlog::debug("Cache restored: sports={} odds_entries={}", sports_.has_value(), odds_.size());
    } catch (const std::exception& e) {
        spdlog::warn("Cache document corrupt, starting empty: {}", e.what());
        sports_.reset();
        odds_.clear();
    }
}

void QuoteCache::persist_locked() const {
    if (!store_) return;

    nlohmann::json odds = nlohmann::json::object();
    for (const auto& [sig, entry] : odds_) {
        odds[sig] = entry_to_json(entry);
    }

    nlohmann::json j{
        {"sports", sports_ ? entry_to_json(*sports_) : nlohmann::json(nullptr)},
        {"odds", odds}
    };

    if (!store_->save(DOCUMENT_NAME, j.dump())) {
        spdlog::warn("Failed to persist quote cache");
    }
}

} // namespace betarb
