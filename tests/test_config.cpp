#include <gtest/gtest.h>
#include "config/config.hpp"
#include "app/services.hpp"
#include "fake_odds_provider.hpp"
#include <filesystem>
#include <fstream>
#include <cstdlib>

using namespace betarb;

class ConfigTest : public ::testing::Test {
protected:
    std::string test_config_path_;

    void SetUp() override {
        test_config_path_ = "/tmp/test_betarb_config_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".json";
        unsetenv("ODDS_API_KEYS");
    }

    void TearDown() override {
        std::filesystem::remove(test_config_path_);
        unsetenv("ODDS_API_KEYS");
    }

    void write_config(const std::string& body) {
        std::ofstream file(test_config_path_);
        file << body;
    }
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(ConfigTest, Defaults_AreValid) {
    Config config;
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.cache.odds_ttl_seconds, 300);
    EXPECT_EQ(config.cache.sports_ttl_seconds, 86400);
    EXPECT_EQ(config.scan.markets.size(), 3u);
    EXPECT_EQ(config.persistence.backend, "file");
}

TEST_F(ConfigTest, Load_PartialFileKeepsDefaults) {
    write_config(R"({
        "scan": {"min_roi": 1.5, "sports": ["soccer_epl"]},
        "auto_scan": {"peak_start": 18, "peak_end": 23},
        "schedule": {"categories": {"cricket": {"weekday": [[6, 9]], "weekend": [[5, 10]]}}},
        "persistence": {"backend": "sqlite", "location": "/tmp/betarb.db"}
    })");

    auto config = Config::load(test_config_path_);
    EXPECT_DOUBLE_EQ(config.scan.min_roi, 1.5);
    EXPECT_DOUBLE_EQ(config.scan.investment, 500.0);
    EXPECT_EQ(config.auto_scan.peak_start, 18);
    EXPECT_EQ(config.persistence.backend, "sqlite");

    ASSERT_EQ(config.schedule.categories.count("cricket"), 1u);
    const auto& cricket = config.schedule.categories.at("cricket");
    ASSERT_EQ(cricket.weekend.size(), 1u);
    EXPECT_EQ(cricket.weekend[0].start, 5);
    EXPECT_EQ(cricket.weekend[0].end, 10);
}

TEST_F(ConfigTest, Load_InvalidConfigThrows) {
    write_config(R"({"scan": {"markets": ["h2h", "btts"]}})");
    EXPECT_THROW(Config::load(test_config_path_), std::runtime_error);
}

TEST_F(ConfigTest, Load_MissingFileThrows) {
    EXPECT_THROW(Config::load("/tmp/definitely_missing_betarb.json"), std::runtime_error);
}

TEST_F(ConfigTest, SaveThenLoad) {
    Config config;
    config.scan.bookmakers = {"pinnacle", "bet365"};
    config.simulation.starting_bankroll = 2500.0;
    config.schedule.categories["darts"] = PeakWindows{{{19, 22}}, {{14, 22}}};
    config.save(test_config_path_);

    auto loaded = Config::load(test_config_path_);
    EXPECT_EQ(loaded.scan.bookmakers, config.scan.bookmakers);
    EXPECT_DOUBLE_EQ(loaded.simulation.starting_bankroll, 2500.0);
    EXPECT_EQ(loaded.schedule.categories.at("darts").weekday[0].start, 19);
}

TEST_F(ConfigTest, Validate_RejectsBadValues) {
    Config window;
    window.auto_scan.peak_end = window.auto_scan.peak_start;
    EXPECT_FALSE(window.validate());

    Config backend;
    backend.persistence.backend = "redis";
    EXPECT_FALSE(backend.validate());

    Config category;
    category.schedule.categories["x"] = PeakWindows{{{20, 10}}, {}};
    EXPECT_FALSE(category.validate());
}

// ============================================================================
// API Keys
// ============================================================================

TEST_F(ConfigTest, ParseKeyList_CommaAndJson) {
    EXPECT_EQ(Config::parse_key_list("a, b,,c "), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(Config::parse_key_list(R"(["a", " b ", ""])"), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(Config::parse_key_list("   ").empty());
}

TEST_F(ConfigTest, ApplyEnv_MergesWithoutDuplicates) {
    setenv("ODDS_API_KEYS", "k1,k2", 1);
    Config config;
    config.api_keys = {"k2", "k0"};
    config.apply_env();
    EXPECT_EQ(config.api_keys, (std::vector<std::string>{"k2", "k0", "k1"}));
}

// ============================================================================
// Service Wiring
// ============================================================================

TEST_F(ConfigTest, ScanRequest_FromConfig) {
    Config config;
    config.scan.markets = {"totals"};
    config.scan.max_hours = 12.0;
    config.provider.regions = "us";

    auto request = scan_request_from(config);
    ASSERT_EQ(request.markets.size(), 1u);
    EXPECT_EQ(request.markets[0], MarketType::TOTALS);
    EXPECT_FALSE(request.sports.has_value());
    ASSERT_TRUE(request.max_hours.has_value());
    EXPECT_DOUBLE_EQ(*request.max_hours, 12.0);
    EXPECT_EQ(request.regions, "us");

    config.scan.max_hours = 0.0;
    EXPECT_FALSE(scan_request_from(config).max_hours.has_value());
}

TEST_F(ConfigTest, AutoSchedule_UsesGlobalWindow) {
    Config config;
    config.auto_scan.peak_start = 9;
    config.auto_scan.peak_end = 11;
    config.auto_scan.peak_interval_seconds = 60;
    config.auto_scan.skip_off_peak = true;

    ScanSchedule schedule;
    configure_auto_schedule(schedule, config.auto_scan);

    std::tm local{};
    local.tm_wday = 2;
    local.tm_hour = 10;
    EXPECT_TRUE(schedule.is_optimal_time(local));
    local.tm_hour = 11;
    EXPECT_FALSE(schedule.is_optimal_time(local));
    EXPECT_EQ(schedule.peak_interval(), std::chrono::seconds(60));
    EXPECT_TRUE(schedule.skip_off_peak());
}

TEST_F(ConfigTest, BuildServices_RegistersKeysAndCategories) {
    Config config;
    config.api_keys = {"key-one-0001", "key-two-0002"};
    config.schedule.categories["cricket"] = PeakWindows{{{6, 9}}, {{6, 9}}};
    config.simulation.starting_bankroll = 300.0;

    auto services = build_services(config, std::make_shared<MemoryDocumentStore>(),
                                   std::make_shared<FakeOddsProvider>());

    EXPECT_EQ(services.credentials->size(), 2u);
    EXPECT_EQ(services.schedule->category_for(std::string("cricket_ipl")), "cricket");
    EXPECT_DOUBLE_EQ(services.ledger->get_stats().bankroll.total, 300.0);
    EXPECT_EQ(services.provider->name(), "fake");
    EXPECT_EQ(services.cache->ttl(CacheClass::ODDS), std::chrono::seconds(300));
}
