#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace betarb {
namespace normalize {

// ============================================================================
// ODDS NORMALIZATION
//
// Every upstream payload is reduced to CanonicalGame. Records that cannot be
// understood are dropped, never fatal:
//   - unknown market keys / bet types       -> market dropped
//   - missing or non-numeric price          -> outcome dropped
//   - unparseable point                     -> point dropped, outcome kept
//   - unparseable commence time             -> game kept without a time
// ============================================================================

/**
 * Bet-type name heuristic (case-insensitive, first match wins):
 *   "winner"/"match" -> h2h, "spread"/"handicap" -> spreads, "total"/"over" -> totals
 */
std::optional<MarketType> classify_market(const std::string& bet_name);

/**
 * Trailing signed numeral of an outcome label: "Over +2.5" -> 2.5, "Home -1" -> -1.
 */
std::optional<double> parse_point(const std::string& label);

/**
 * Decimal price from a JSON number or numeric string.
 */
std::optional<double> parse_price(const nlohmann::json& value);

/**
 * "basketball_nba" -> "Basketball Nba"
 */
std::string title_from_key(const std::string& sport_key);

// The Odds API v4: [{id, sport_key, home_team, ..., bookmakers: [{markets: [{outcomes}]}]}]
std::optional<CanonicalGame> from_odds_api_game(const nlohmann::json& game);
std::vector<CanonicalGame> from_odds_api(const nlohmann::json& games);

// API-Sports odds response: [{fixture, teams, bookmakers: [{name, bets: [{name, values}]}]}]
std::vector<CanonicalGame> from_api_sports(const nlohmann::json& response,
                                           const std::string& sport_key);

// Flat sportsbook event: {sport, home_team, away_team, odds: {Book: {home, away, draw}}}
std::optional<CanonicalGame> from_sportsbook(const nlohmann::json& event);

} // namespace normalize
} // namespace betarb
