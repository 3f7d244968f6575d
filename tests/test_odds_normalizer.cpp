#include <gtest/gtest.h>
#include "market_data/odds_normalizer.hpp"
#include "utils/time_utils.hpp"

using namespace betarb;

class OddsNormalizerTest : public ::testing::Test {
protected:
    nlohmann::json odds_api_game() {
        return nlohmann::json::parse(R"({
            "id": "e912304de2b2ce35b473ce2ecd3d1502",
            "sport_key": "soccer_epl",
            "sport_title": "EPL",
            "commence_time": "2024-03-02T15:00:00Z",
            "home_team": "Arsenal",
            "away_team": "Chelsea",
            "bookmakers": [
                {
                    "key": "pinnacle",
                    "title": "Pinnacle",
                    "markets": [
                        {"key": "h2h", "outcomes": [
                            {"name": "Arsenal", "price": 2.10},
                            {"name": "Chelsea", "price": 3.40},
                            {"name": "Draw", "price": 3.60}
                        ]},
                        {"key": "totals", "outcomes": [
                            {"name": "Over", "price": 1.95, "point": 2.5},
                            {"name": "Under", "price": 1.90, "point": 2.5}
                        ]},
                        {"key": "btts", "outcomes": [
                            {"name": "Yes", "price": 1.70}
                        ]}
                    ]
                },
                {
                    "key": "betfair_ex_eu",
                    "title": "Betfair",
                    "markets": [
                        {"key": "h2h", "outcomes": [
                            {"name": "Arsenal", "price": "2.2"},
                            {"name": "Chelsea"},
                            {"name": "Draw", "price": "n/a"}
                        ]}
                    ]
                }
            ]
        })");
    }
};

// ============================================================================
// Helpers
// ============================================================================

TEST_F(OddsNormalizerTest, ClassifyMarket_Heuristics) {
    EXPECT_EQ(normalize::classify_market("Match Winner"), MarketType::H2H);
    EXPECT_EQ(normalize::classify_market("Home/Away"), std::nullopt);
    EXPECT_EQ(normalize::classify_market("Asian Handicap"), MarketType::SPREADS);
    EXPECT_EQ(normalize::classify_market("Point Spread"), MarketType::SPREADS);
    EXPECT_EQ(normalize::classify_market("Goals Over/Under"), MarketType::TOTALS);
    EXPECT_EQ(normalize::classify_market("Total Points"), MarketType::TOTALS);
    EXPECT_EQ(normalize::classify_market("Both Teams Score"), std::nullopt);
}

TEST_F(OddsNormalizerTest, ParsePoint_SignedTrailingNumber) {
    EXPECT_DOUBLE_EQ(*normalize::parse_point("Over +2.5"), 2.5);
    EXPECT_DOUBLE_EQ(*normalize::parse_point("Home -1"), -1.0);
    EXPECT_DOUBLE_EQ(*normalize::parse_point("Away +0.25"), 0.25);
}

TEST_F(OddsNormalizerTest, ParsePoint_RejectsUnsignedOrGarbage) {
    EXPECT_FALSE(normalize::parse_point("Over 2.5").has_value());
    EXPECT_FALSE(normalize::parse_point("Home").has_value());
    EXPECT_FALSE(normalize::parse_point("Home -x").has_value());
}

TEST_F(OddsNormalizerTest, ParsePrice_NumberOrNumericString) {
    EXPECT_DOUBLE_EQ(*normalize::parse_price(nlohmann::json(1.95)), 1.95);
    EXPECT_DOUBLE_EQ(*normalize::parse_price(nlohmann::json("2.05")), 2.05);
    EXPECT_FALSE(normalize::parse_price(nlohmann::json("abc")).has_value());
    EXPECT_FALSE(normalize::parse_price(nlohmann::json(nullptr)).has_value());
}

TEST_F(OddsNormalizerTest, TitleFromKey) {
    EXPECT_EQ(normalize::title_from_key("basketball_nba"), "Basketball Nba");
    EXPECT_EQ(normalize::title_from_key("soccer"), "Soccer");
}

// ============================================================================
// The Odds API
// ============================================================================

TEST_F(OddsNormalizerTest, OddsApi_KeepsKnownMarketsAndValidPrices) {
    auto game = normalize::from_odds_api_game(odds_api_game());
    ASSERT_TRUE(game.has_value());

    EXPECT_EQ(game->id, "e912304de2b2ce35b473ce2ecd3d1502");
    EXPECT_EQ(game->sport_title, "EPL");
    EXPECT_EQ(game->teams(), "Arsenal vs Chelsea");
    ASSERT_TRUE(game->commence_time.has_value());
    EXPECT_EQ(time_utils::to_iso8601(*game->commence_time), "2024-03-02T15:00:00.000Z");

    // 3 h2h + 2 totals from Pinnacle, 1 valid h2h from Betfair; btts dropped
    ASSERT_EQ(game->quotes.size(), 6u);

    int totals = 0;
    for (const auto& q : game->quotes) {
        if (q.market == MarketType::TOTALS) {
            totals++;
            ASSERT_TRUE(q.point.has_value());
            EXPECT_DOUBLE_EQ(*q.point, 2.5);
        }
        if (q.bookmaker_key == "betfair_ex_eu") {
            EXPECT_EQ(q.outcome_name, "Arsenal");
            EXPECT_DOUBLE_EQ(q.price, 2.2);
        }
    }
    EXPECT_EQ(totals, 2);
}

TEST_F(OddsNormalizerTest, OddsApi_BadTimeKeepsGame) {
    auto raw = odds_api_game();
    raw["commence_time"] = "tomorrow";
    auto game = normalize::from_odds_api_game(raw);
    ASSERT_TRUE(game.has_value());
    EXPECT_FALSE(game->commence_time.has_value());
}

TEST_F(OddsNormalizerTest, OddsApi_NonArrayYieldsNothing) {
    EXPECT_TRUE(normalize::from_odds_api(nlohmann::json::object()).empty());
    EXPECT_EQ(normalize::from_odds_api(nlohmann::json::array({odds_api_game(), 42})).size(), 1u);
}

// ============================================================================
// API-Sports
// ============================================================================

TEST_F(OddsNormalizerTest, ApiSports_MapsBetsToMarkets) {
    auto response = nlohmann::json::parse(R"([
        {
            "fixture": {"id": 1035046, "date": "2024-03-02T15:00:00+00:00"},
            "teams": {"home": {"name": "Lakers"}, "away": {"name": "Celtics"}},
            "bookmakers": [
                {"name": "Bet 365", "bets": [
                    {"name": "Home/Away", "values": [{"value": "Home", "odd": "1.90"}]},
                    {"name": "Match Winner", "values": [
                        {"value": "Home", "odd": "1.90"},
                        {"value": "Away", "odd": "2.00"}
                    ]},
                    {"name": "Asian Handicap", "values": [
                        {"value": "Home -3.5", "odd": "1.95"},
                        {"value": "Away +3.5", "odd": "1.85"}
                    ]}
                ]}
            ]
        }
    ])");

    auto games = normalize::from_api_sports(response, "basketball_nba");
    ASSERT_EQ(games.size(), 1u);

    const auto& g = games[0];
    EXPECT_EQ(g.id, "1035046");
    EXPECT_EQ(g.sport_title, "Basketball Nba");
    EXPECT_EQ(g.home_team, "Lakers");
    EXPECT_EQ(g.away_team, "Celtics");
    EXPECT_TRUE(g.commence_time.has_value());
    ASSERT_EQ(g.quotes.size(), 4u);

    EXPECT_EQ(g.quotes[0].bookmaker_key, "bet365");
    EXPECT_EQ(g.quotes[0].bookmaker_title, "Bet 365");
    EXPECT_EQ(g.quotes[0].market, MarketType::H2H);
    EXPECT_FALSE(g.quotes[0].point.has_value());

    EXPECT_EQ(g.quotes[2].market, MarketType::SPREADS);
    EXPECT_DOUBLE_EQ(*g.quotes[2].point, -3.5);
    EXPECT_DOUBLE_EQ(*g.quotes[3].point, 3.5);
}

// ============================================================================
// Flat Sportsbook Feed
// ============================================================================

TEST_F(OddsNormalizerTest, Sportsbook_HomeAwayDraw) {
    auto event = nlohmann::json::parse(R"({
        "id": "evt-1",
        "sport": "soccer_epl",
        "home_team": "Arsenal",
        "away_team": "Chelsea",
        "odds": {
            "William Hill": {"home": 2.1, "away": 3.5, "draw": 3.3},
            "Sky Bet": {"home": "2.05", "away": null}
        }
    })");

    auto game = normalize::from_sportsbook(event);
    ASSERT_TRUE(game.has_value());
    EXPECT_EQ(game->sport_title, "Soccer Epl");
    ASSERT_EQ(game->quotes.size(), 4u);

    bool saw_draw = false;
    for (const auto& q : game->quotes) {
        EXPECT_EQ(q.market, MarketType::H2H);
        if (q.bookmaker_title == "William Hill") {
            EXPECT_EQ(q.bookmaker_key, "william_hill");
        }
        if (q.outcome_name == "Draw") saw_draw = true;
    }
    EXPECT_TRUE(saw_draw);
}

TEST_F(OddsNormalizerTest, Sportsbook_EmptyEventIsNothing) {
    EXPECT_FALSE(normalize::from_sportsbook(nlohmann::json::object()).has_value());
}
