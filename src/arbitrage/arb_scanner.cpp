#include "arbitrage/arb_scanner.hpp"
#include "common/errors.hpp"
#include <spdlog/spdlog.h>

namespace betarb {

ArbScanner::ArbScanner(std::shared_ptr<OddsService> odds, Clock clock)
    : odds_(std::move(odds))
    , clock_(std::move(clock))
{
}

bool ArbScanner::is_outright_sport(const std::string& sport_key) {
    return sport_key.find("winner") != std::string::npos ||
           sport_key.find("championship") != std::string::npos;
}

bool ArbScanner::passes_time_filter(const CanonicalGame& game, const ScanRequest& request) const {
    if (request.live_only) {
        // Started games only; max_hours does not apply to them
        return game.commence_time && *game.commence_time <= clock_();
    }

    if (request.max_hours && game.commence_time) {
        double hours_until = std::chrono::duration<double>(*game.commence_time - clock_()).count() / 3600.0;
        if (hours_until > *request.max_hours || hours_until < 0) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> ArbScanner::resolve_sports(const ScanRequest& request) {
    if (request.sports) {
        return *request.sports;
    }

    std::vector<std::string> keys;
    try {
        for (const auto& sport : odds_->get_sports()) {
            if (!is_outright_sport(sport.key)) {
                keys.push_back(sport.key);
            }
        }
    } catch (const UpstreamError& e) {
        spdlog::error("Failed to list sports: {}", e.what());
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.upstream_failures++;
    }
    return keys;
}

ScanReport ArbScanner::scan(const ScanRequest& request) {
    ScanReport report;

    std::vector<std::string> market_keys;
    for (auto m : request.markets) {
        market_keys.push_back(market_type_to_string(m));
    }

    auto sports = resolve_sports(request);
    uint64_t failures = 0;

    for (const auto& sport : sports) {
        OddsRequest odds_request;
        odds_request.sport = sport;
        odds_request.markets = market_keys;
        odds_request.bookmakers = request.bookmakers;
        odds_request.regions = request.regions;

        std::vector<CanonicalGame> games;
        try {
            games = odds_->get_odds(odds_request);
        } catch (const UpstreamError& e) {
            spdlog::warn("Skipping {}: {}", sport, e.what());
            report.failed_sports.push_back(sport);
            failures++;
            continue;
        }

        report.sports_scanned++;

        for (const auto& game : games) {
            if (!passes_time_filter(game, request)) continue;
            report.games_scanned++;

            for (auto market : request.markets) {
                auto found = engine_.analyze_game(game, market, request.investment, request.min_roi);
                report.opportunities.insert(report.opportunities.end(),
                                            std::make_move_iterator(found.begin()),
                                            std::make_move_iterator(found.end()));
            }
        }
    }

    ArbitrageEngine::rank(report.opportunities);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.scans++;
        stats_.opportunities_found += report.opportunities.size();
        stats_.upstream_failures += failures;
        stats_.games_scanned += report.games_scanned;
    }

    spdlog::info("Scan complete: {} sports, {} games, {} opportunities, {} failed",
                 report.sports_scanned, report.games_scanned,
                 report.opportunities.size(), report.failed_sports.size());

    return report;
}

ArbScanner::Stats ArbScanner::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

} // namespace betarb
