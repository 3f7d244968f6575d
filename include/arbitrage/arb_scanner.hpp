#pragma once

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <mutex>
#include <functional>
#include <cstdint>
#include "common/types.hpp"
#include "arbitrage/arbitrage_engine.hpp"
#include "market_data/odds_service.hpp"

namespace betarb {

struct ScanRequest {
    std::optional<std::vector<std::string>> sports;   // nullopt = every active sport
    std::vector<MarketType> markets{MarketType::H2H, MarketType::SPREADS, MarketType::TOTALS};
    std::vector<std::string> bookmakers;              // Empty = all
    std::string regions{"eu,uk"};
    double min_roi{0.5};
    double investment{500.0};
    std::optional<double> max_hours;                  // Only games starting within this window
    bool live_only{false};                            // Only games already started
};

struct ScanReport {
    std::vector<Opportunity> opportunities;           // Ranked
    size_t sports_scanned{0};
    size_t games_scanned{0};
    std::vector<std::string> failed_sports;
};

/**
 * Runs the detection engine over every requested sport and market.
 *
 * An upstream failure for one sport is logged and that sport contributes
 * nothing; the rest of the scan continues. ConfigurationError (no usable
 * credential) aborts the scan.
 */
class ArbScanner {
public:
    using Clock = std::function<WallClock()>;

    struct Stats {
        uint64_t scans{0};
        uint64_t opportunities_found{0};
        uint64_t upstream_failures{0};
        uint64_t games_scanned{0};
    };

    explicit ArbScanner(std::shared_ptr<OddsService> odds, Clock clock = wall_now);

    ScanReport scan(const ScanRequest& request);

    std::vector<Opportunity> scan_for_arbitrage(const ScanRequest& request) {
        return scan(request).opportunities;
    }

    // Sport keys for outright/futures markets are not matches
    static bool is_outright_sport(const std::string& sport_key);

    bool passes_time_filter(const CanonicalGame& game, const ScanRequest& request) const;

    Stats get_stats() const;

private:
    std::shared_ptr<OddsService> odds_;
    ArbitrageEngine engine_;
    Clock clock_;

    Stats stats_;
    mutable std::mutex stats_mutex_;

    std::vector<std::string> resolve_sports(const ScanRequest& request);
};

} // namespace betarb
