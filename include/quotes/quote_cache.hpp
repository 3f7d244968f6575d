#pragma once

#include <string>
#include <map>
#include <optional>
#include <memory>
#include <mutex>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "persistence/document_store.hpp"

namespace betarb {

// ============================================================================
// QUOTE CACHE
//
// Two classes of cached upstream responses:
//   SPORTS - the single sports list, 24h TTL
//   ODDS   - odds responses keyed by signature, 5min TTL
//
// Expiry is checked on read only. Stale entries stay in the document until
// overwritten or cleared.
// ============================================================================

enum class CacheClass {
    SPORTS,
    ODDS
};

struct CacheEntry {
    nlohmann::json data;
    WallClock timestamp;
};

struct CacheStats {
    bool sports_cached{false};
    size_t odds_entries{0};
    int64_t sports_ttl_seconds{0};
    int64_t odds_ttl_seconds{0};
};

class QuoteCache {
public:
    using Clock = std::function<WallClock()>;

    static constexpr const char* DOCUMENT_NAME = "cache";

    QuoteCache(std::shared_ptr<DocumentStore> store,
               std::chrono::seconds odds_ttl = std::chrono::minutes(5),
               std::chrono::seconds sports_ttl = std::chrono::hours(24),
               Clock clock = wall_now);

    // md5("<sport>:<markets>:<bookmakers or 'all'>")
    static std::string signature(const std::string& sport,
                                 const std::string& markets,
                                 const std::string& bookmakers);

    // SPORTS ignores the signature
    std::optional<nlohmann::json> cache_get(const std::string& signature, CacheClass cls) const;
    void cache_put(const std::string& signature, const nlohmann::json& payload, CacheClass cls);

    void clear();
    CacheStats stats() const;

    std::chrono::seconds ttl(CacheClass cls) const;

private:
    std::shared_ptr<DocumentStore> store_;
    std::chrono::seconds odds_ttl_;
    std::chrono::seconds sports_ttl_;
    Clock clock_;

    std::optional<CacheEntry> sports_;
    std::map<std::string, CacheEntry> odds_;
    mutable std::mutex mutex_;

    bool is_fresh(const CacheEntry& entry, CacheClass cls) const;
    void load();
    void persist_locked() const;
};

} // namespace betarb
