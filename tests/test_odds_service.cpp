#include <gtest/gtest.h>
#include "market_data/odds_service.hpp"
#include "fake_odds_provider.hpp"

using namespace betarb;

class OddsServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryDocumentStore>();
        provider_ = std::make_shared<FakeOddsProvider>();
        credentials_ = std::make_shared<CredentialStore>(store_);
        cache_ = std::make_shared<QuoteCache>(store_);
        service_ = std::make_unique<OddsService>(provider_, credentials_, cache_);

        provider_->sports = nlohmann::json::parse(R"([
            {"key": "soccer_epl", "group": "Soccer", "title": "EPL", "active": true, "has_outrights": false},
            {"key": "soccer_fa_cup", "group": "Soccer", "title": "FA Cup", "active": false},
            {"key": "golf_masters_tournament_winner", "group": "Golf", "title": "Masters", "active": true, "has_outrights": true}
        ])");
        provider_->odds["soccer_epl"] = nlohmann::json::array({
            FakeOddsProvider::arb_game("g1", "soccer_epl", "2030-01-01T15:00:00Z")
        });
    }

    std::shared_ptr<MemoryDocumentStore> store_;
    std::shared_ptr<FakeOddsProvider> provider_;
    std::shared_ptr<CredentialStore> credentials_;
    std::shared_ptr<QuoteCache> cache_;
    std::unique_ptr<OddsService> service_;

    OddsRequest epl_request() {
        OddsRequest r;
        r.sport = "soccer_epl";
        r.markets = {"h2h"};
        return r;
    }
};

// ============================================================================
// Credentials
// ============================================================================

TEST_F(OddsServiceTest, NoKeysIsConfigurationError) {
    EXPECT_THROW(service_->get_odds(epl_request()), ConfigurationError);
    EXPECT_TRUE(provider_->calls.empty());
}

TEST_F(OddsServiceTest, ExhaustedKeysIsConfigurationError) {
    credentials_->add_credential("key-one-0001");
    credentials_->record_usage("key-one-0001", 0);
    EXPECT_THROW(service_->get_odds(epl_request()), ConfigurationError);
}

TEST_F(OddsServiceTest, RecordsQuotaFromResponse) {
    credentials_->add_credential("key-one-0001");
    provider_->remaining = 321;
    provider_->used = 179;

    service_->get_odds(epl_request());

    auto list = credentials_->credentials();
    EXPECT_EQ(*list[0].remaining, 321);
    EXPECT_EQ(*list[0].used, 179);
}

TEST_F(OddsServiceTest, MissingQuotaHeaderLeavesKeyUnknown) {
    credentials_->add_credential("key-one-0001");
    provider_->remaining.reset();

    service_->get_odds(epl_request());
    EXPECT_FALSE(credentials_->credentials()[0].remaining.has_value());
}

TEST_F(OddsServiceTest, RotatesToKeyWithMostQuota) {
    credentials_->add_credential("key-low-00001");
    credentials_->add_credential("key-high-0002");
    credentials_->record_usage("key-low-00001", 5);
    credentials_->record_usage("key-high-0002", 400);

    service_->get_odds(epl_request());
    ASSERT_EQ(provider_->keys_used.size(), 1u);
    EXPECT_EQ(provider_->keys_used[0], "key-high-0002");
}

TEST_F(OddsServiceTest, RejectedKeyQuotaRecordedAndNextCallRotates) {
    credentials_->add_credential("key-dead-0001");
    credentials_->add_credential("key-live-0002");
    credentials_->record_usage("key-dead-0001", 5);
    credentials_->record_usage("key-live-0002", 3);
    provider_->rejected_keys.insert("key-dead-0001");

    EXPECT_THROW(service_->get_odds(epl_request()), UpstreamError);
    EXPECT_EQ(*credentials_->credentials()[0].remaining, 0);

    auto games = service_->get_odds(epl_request());
    ASSERT_EQ(provider_->keys_used.size(), 2u);
    EXPECT_EQ(provider_->keys_used[0], "key-dead-0001");
    EXPECT_EQ(provider_->keys_used[1], "key-live-0002");
    EXPECT_EQ(games.size(), 1u);
}

TEST_F(OddsServiceTest, RejectedSportsCallAlsoRecordsQuota) {
    credentials_->add_credential("key-dead-0001");
    credentials_->record_usage("key-dead-0001", 5);
    provider_->rejected_keys.insert("key-dead-0001");

    EXPECT_THROW(service_->get_sports(), UpstreamError);
    EXPECT_THROW(service_->get_sports(), ConfigurationError);
    EXPECT_EQ(provider_->calls.size(), 1u);
}

// ============================================================================
// Caching
// ============================================================================

TEST_F(OddsServiceTest, OddsServedFromCacheOnSecondCall) {
    credentials_->add_credential("key-one-0001");

    auto first = service_->get_odds(epl_request());
    auto second = service_->get_odds(epl_request());

    EXPECT_EQ(provider_->calls.size(), 1u);
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].id, "g1");
}

TEST_F(OddsServiceTest, CacheHitNeedsNoCredential) {
    credentials_->add_credential("key-one-0001");
    service_->get_odds(epl_request());
    credentials_->record_usage("key-one-0001", 0);

    EXPECT_NO_THROW(service_->get_odds(epl_request()));
}

TEST_F(OddsServiceTest, SportsActiveOnlyAndCached) {
    credentials_->add_credential("key-one-0001");

    auto sports = service_->get_sports();
    ASSERT_EQ(sports.size(), 2u);
    EXPECT_EQ(sports[0].key, "soccer_epl");
    EXPECT_TRUE(sports[1].has_outrights);

    service_->get_sports();
    EXPECT_EQ(provider_->calls.size(), 1u);
}

TEST_F(OddsServiceTest, UpstreamErrorPassesThrough) {
    credentials_->add_credential("key-one-0001");
    provider_->failing_sports.insert("soccer_epl");

    try {
        service_->get_odds(epl_request());
        FAIL() << "expected UpstreamError";
    } catch (const UpstreamError& e) {
        EXPECT_EQ(e.http_status(), 500);
    }
}

TEST_F(OddsServiceTest, NonArraySportsBodyIsNotCached) {
    credentials_->add_credential("key-one-0001");
    auto good = provider_->sports;
    provider_->sports = nlohmann::json{{"message", "maintenance"}};

    EXPECT_THROW(service_->get_sports(), UpstreamError);

    provider_->sports = good;
    EXPECT_EQ(service_->get_sports().size(), 2u);
    EXPECT_EQ(provider_->calls.size(), 2u);
}

TEST_F(OddsServiceTest, NonArrayOddsBodyIsNotCached) {
    credentials_->add_credential("key-one-0001");
    auto good = provider_->odds["soccer_epl"];
    provider_->odds["soccer_epl"] = nlohmann::json{{"message", "maintenance"}};

    EXPECT_THROW(service_->get_odds(epl_request()), UpstreamError);

    provider_->odds["soccer_epl"] = good;
    EXPECT_EQ(service_->get_odds(epl_request()).size(), 1u);
    EXPECT_EQ(provider_->calls.size(), 2u);
}
