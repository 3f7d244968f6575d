#include <gtest/gtest.h>
#include "arbitrage/arb_scanner.hpp"
#include "utils/time_utils.hpp"
#include "fake_odds_provider.hpp"

using namespace betarb;

class ArbScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryDocumentStore>();
        provider_ = std::make_shared<FakeOddsProvider>();
        credentials_ = std::make_shared<CredentialStore>(store_);
        cache_ = std::make_shared<QuoteCache>(store_);
        odds_ = std::make_shared<OddsService>(provider_, credentials_, cache_);

        now_ = *time_utils::parse_iso8601("2030-01-01T12:00:00Z");
        scanner_ = std::make_unique<ArbScanner>(odds_, [this] { return now_; });

        credentials_->add_credential("key-one-0001");

        provider_->sports = nlohmann::json::parse(R"([
            {"key": "soccer_epl", "title": "EPL", "active": true},
            {"key": "basketball_nba", "title": "NBA", "active": true},
            {"key": "soccer_fifa_world_cup_winner", "title": "World Cup Winner", "active": true}
        ])");
    }

    std::shared_ptr<MemoryDocumentStore> store_;
    std::shared_ptr<FakeOddsProvider> provider_;
    std::shared_ptr<CredentialStore> credentials_;
    std::shared_ptr<QuoteCache> cache_;
    std::shared_ptr<OddsService> odds_;
    WallClock now_;
    std::unique_ptr<ArbScanner> scanner_;

    ScanRequest h2h_request() {
        ScanRequest r;
        r.markets = {MarketType::H2H};
        r.min_roi = 0.0;
        r.investment = 100.0;
        return r;
    }
};

// ============================================================================
// Sport Selection
// ============================================================================

TEST_F(ArbScannerTest, OutrightSportsAreSkipped) {
    EXPECT_TRUE(ArbScanner::is_outright_sport("soccer_fifa_world_cup_winner"));
    EXPECT_TRUE(ArbScanner::is_outright_sport("golf_pga_championship"));
    EXPECT_FALSE(ArbScanner::is_outright_sport("soccer_epl"));

    scanner_->scan(h2h_request());
    for (const auto& call : provider_->calls) {
        EXPECT_NE(call, "soccer_fifa_world_cup_winner");
    }
}

TEST_F(ArbScannerTest, ExplicitSportsSkipDiscovery) {
    auto request = h2h_request();
    request.sports = std::vector<std::string>{"soccer_epl"};

    scanner_->scan(request);
    ASSERT_EQ(provider_->calls.size(), 1u);
    EXPECT_EQ(provider_->calls[0], "soccer_epl");
}

// ============================================================================
// Detection and Ranking
// ============================================================================

TEST_F(ArbScannerTest, FindsAndRanksAcrossSports) {
    provider_->odds["soccer_epl"] = nlohmann::json::array({
        FakeOddsProvider::arb_game("small", "soccer_epl", "2030-01-01T15:00:00Z", 2.04, 2.04)
    });
    provider_->odds["basketball_nba"] = nlohmann::json::array({
        FakeOddsProvider::arb_game("big", "basketball_nba", "2030-01-01T18:00:00Z", 2.20, 2.20)
    });

    auto report = scanner_->scan(h2h_request());

    EXPECT_EQ(report.sports_scanned, 2u);
    EXPECT_EQ(report.games_scanned, 2u);
    ASSERT_EQ(report.opportunities.size(), 2u);
    EXPECT_EQ(report.opportunities[0].game_id, "big");
    EXPECT_EQ(report.opportunities[1].game_id, "small");
    EXPECT_EQ(report.opportunities[0].sport, "basketball_nba");
}

TEST_F(ArbScannerTest, MinRoiApplies) {
    provider_->odds["soccer_epl"] = nlohmann::json::array({
        FakeOddsProvider::arb_game("small", "soccer_epl", "2030-01-01T15:00:00Z", 2.04, 2.04)
    });

    auto request = h2h_request();
    request.min_roi = 5.0;
    EXPECT_TRUE(scanner_->scan_for_arbitrage(request).empty());
}

// ============================================================================
// Failure Handling
// ============================================================================

TEST_F(ArbScannerTest, UpstreamFailureSkipsOnlyThatSport) {
    provider_->failing_sports.insert("soccer_epl");
    provider_->odds["basketball_nba"] = nlohmann::json::array({
        FakeOddsProvider::arb_game("nba", "basketball_nba", "2030-01-01T18:00:00Z")
    });

    auto report = scanner_->scan(h2h_request());

    ASSERT_EQ(report.failed_sports.size(), 1u);
    EXPECT_EQ(report.failed_sports[0], "soccer_epl");
    ASSERT_EQ(report.opportunities.size(), 1u);
    EXPECT_EQ(scanner_->get_stats().upstream_failures, 1u);
}

TEST_F(ArbScannerTest, NoCredentialAbortsScan) {
    auto store = std::make_shared<MemoryDocumentStore>();
    auto odds = std::make_shared<OddsService>(provider_, std::make_shared<CredentialStore>(store),
                                              std::make_shared<QuoteCache>(store));
    ArbScanner scanner(odds);

    auto request = h2h_request();
    request.sports = std::vector<std::string>{"soccer_epl"};
    EXPECT_THROW(scanner.scan(request), ConfigurationError);
}

// ============================================================================
// Time Filters
// ============================================================================

TEST_F(ArbScannerTest, MaxHoursDropsLaterAndStartedGames) {
    provider_->odds["soccer_epl"] = nlohmann::json::array({
        FakeOddsProvider::arb_game("soon", "soccer_epl", "2030-01-01T14:00:00Z"),
        FakeOddsProvider::arb_game("later", "soccer_epl", "2030-01-02T12:00:00Z"),
        FakeOddsProvider::arb_game("started", "soccer_epl", "2030-01-01T11:00:00Z"),
        FakeOddsProvider::arb_game("untimed", "soccer_epl", "not a time")
    });

    auto request = h2h_request();
    request.sports = std::vector<std::string>{"soccer_epl"};
    request.max_hours = 6.0;

    auto found = scanner_->scan_for_arbitrage(request);
    std::vector<std::string> ids;
    for (const auto& o : found) ids.push_back(o.game_id);

    EXPECT_EQ(ids.size(), 2u);
    EXPECT_NE(std::find(ids.begin(), ids.end(), "soon"), ids.end());
    EXPECT_NE(std::find(ids.begin(), ids.end(), "untimed"), ids.end());
}

TEST_F(ArbScannerTest, LiveOnlyKeepsStartedGames) {
    CanonicalGame started;
    started.commence_time = now_ - std::chrono::minutes(30);
    CanonicalGame upcoming;
    upcoming.commence_time = now_ + std::chrono::minutes(30);
    CanonicalGame untimed;

    ScanRequest request;
    request.live_only = true;
    request.max_hours = 0.1;

    EXPECT_TRUE(scanner_->passes_time_filter(started, request));
    EXPECT_FALSE(scanner_->passes_time_filter(upcoming, request));
    EXPECT_FALSE(scanner_->passes_time_filter(untimed, request));
}
