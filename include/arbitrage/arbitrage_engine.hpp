#pragma once

#include <string>
#include <vector>
#include <optional>
#include "common/types.hpp"

namespace betarb {

// ============================================================================
// Arbitrage Detection Engine
//
// For n mutually exclusive outcomes with best decimal prices o_i:
//
//   p_i = 1 / o_i                    implied probability
//   T   = sum(p_i)                   arbitrage iff T < 1
//
// Splitting investment I as stake_i = I * p_i / T pays I / T whichever
// outcome wins, so
//
//   profit = I / T - I
//   roi    = 100 * (1 / T - 1)
//
// Everything is kept at full precision. Rounding to cents happens only
// when an opportunity is displayed or serialized.
// ============================================================================

struct BestPrice {
    std::string key;               // "Arsenal" (h2h) or "Over +2.5" (spreads/totals)
    std::string name;
    std::optional<double> point;
    double price{0.0};
    std::string bookmaker;
    std::string bookmaker_key;
};

struct LineGroup {
    double line{0.0};              // abs(point)
    std::vector<BestPrice> outcomes;
};

// "Over +2.5", "Home -1", "Draw"
std::string outcome_label(const std::string& name, std::optional<double> point);

class ArbitrageEngine {
public:
    /**
     * Best price per outcome key across bookmakers, in first-seen order.
     * Ties keep the first bookmaker. Non-positive prices are ignored.
     * Spread/total quotes without a point are skipped.
     */
    std::vector<BestPrice> find_best_odds(const CanonicalGame& game, MarketType market) const;

    /**
     * Spread/total keys grouped by abs(point), in first-seen order.
     * Only groups with at least two distinct keys are returned.
     */
    std::vector<LineGroup> group_by_line(const std::vector<BestPrice>& best) const;

    /**
     * Stake split for one mutually exclusive outcome set.
     * nullopt when fewer than two outcomes, a non-positive price or
     * investment, or implied probability sum >= 1.
     * Game fields of the result are left empty.
     */
    std::optional<Opportunity> calculate_arbitrage(const std::vector<BestPrice>& outcomes,
                                                   double investment) const;

    /**
     * All opportunities in one game/market with roi >= min_roi.
     */
    std::vector<Opportunity> analyze_game(const CanonicalGame& game,
                                          MarketType market,
                                          double investment,
                                          double min_roi) const;

    /**
     * ROI descending; equal ROI keeps discovery order.
     */
    static void rank(std::vector<Opportunity>& opportunities);
};

} // namespace betarb
