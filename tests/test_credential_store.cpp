#include <gtest/gtest.h>
#include "quotes/credential_store.hpp"
#include <thread>
#include <algorithm>

using namespace betarb;

class CredentialStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryDocumentStore>();
        credentials_ = std::make_unique<CredentialStore>(store_);
    }

    std::shared_ptr<MemoryDocumentStore> store_;
    std::unique_ptr<CredentialStore> credentials_;
};

// ============================================================================
// Selection
// ============================================================================

TEST_F(CredentialStoreTest, Best_NoneWhenEmpty) {
    EXPECT_FALSE(credentials_->best_credential().has_value());
}

TEST_F(CredentialStoreTest, Best_UnknownKeysInRegistrationOrder) {
    credentials_->add_credential("key-alpha-0001");
    credentials_->add_credential("key-bravo-0002");
    EXPECT_EQ(*credentials_->best_credential(), "key-alpha-0001");
}

TEST_F(CredentialStoreTest, Best_PrefersHighestKnownRemaining) {
    credentials_->add_credential("A");
    credentials_->add_credential("B");
    credentials_->add_credential("C");

    credentials_->record_usage("A", 10);
    credentials_->record_usage("B", 450);

    // Known quota beats an unknown key
    EXPECT_EQ(*credentials_->best_credential(), "B");
}

TEST_F(CredentialStoreTest, Best_FallsBackToUnknownWhenKnownExhausted) {
    credentials_->add_credential("A");
    credentials_->add_credential("B");
    credentials_->record_usage("A", 0);

    EXPECT_EQ(*credentials_->best_credential(), "B");
}

TEST_F(CredentialStoreTest, Best_NoneWhenEveryKeyExhausted) {
    credentials_->add_credential("A");
    credentials_->add_credential("B");
    credentials_->record_usage("A", 0);
    credentials_->record_usage("B", 0);

    EXPECT_FALSE(credentials_->best_credential().has_value());
}

// ============================================================================
// Registration and Usage
// ============================================================================

TEST_F(CredentialStoreTest, Add_RejectsDuplicatesAndBlank) {
    EXPECT_TRUE(credentials_->add_credential("A"));
    EXPECT_FALSE(credentials_->add_credential("A"));
    EXPECT_FALSE(credentials_->add_credential(""));
    EXPECT_EQ(credentials_->size(), 1u);
}

TEST_F(CredentialStoreTest, RecordUsage_OverwritesAndStamps) {
    credentials_->add_credential("A");
    credentials_->record_usage("A", 100, 400);
    credentials_->record_usage("A", 120);   // Out-of-order report is accepted

    auto list = credentials_->credentials();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(*list[0].remaining, 120);
    EXPECT_EQ(*list[0].used, 400);
    EXPECT_TRUE(list[0].last_used.has_value());
}

TEST_F(CredentialStoreTest, RecordUsage_IgnoresUnknownKey) {
    credentials_->add_credential("A");
    credentials_->record_usage("Z", 5);
    EXPECT_EQ(credentials_->size(), 1u);
    EXPECT_FALSE(credentials_->credentials()[0].remaining.has_value());
}

TEST_F(CredentialStoreTest, TotalRemaining_OnlyKnownKeys) {
    credentials_->add_credential("A");
    credentials_->add_credential("B");
    EXPECT_FALSE(credentials_->total_remaining().has_value());

    credentials_->record_usage("A", 30);
    EXPECT_EQ(*credentials_->total_remaining(), 30);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(CredentialStoreTest, Persist_RestoresQuotaState) {
    credentials_->add_credential("A");
    credentials_->record_usage("A", 77, 423);

    CredentialStore restored(store_);
    auto list = restored.credentials();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].key, "A");
    EXPECT_EQ(*list[0].remaining, 77);
    EXPECT_EQ(*list[0].used, 423);
}

TEST_F(CredentialStoreTest, Persist_CorruptDocumentStartsEmpty) {
    store_->save(CredentialStore::DOCUMENT_NAME, "{not json");
    CredentialStore restored(store_);
    EXPECT_EQ(restored.size(), 0u);
}

TEST_F(CredentialStoreTest, Stats_MasksKeys) {
    credentials_->add_credential("abcdefghijklmnop");
    auto stats = credentials_->stats();
    EXPECT_EQ(stats["total_keys"], 1);
    EXPECT_EQ(stats["keys"][0]["key"], "abcd...mnop");
}

TEST_F(CredentialStoreTest, MaskKey_ShortKeysFullyHidden) {
    EXPECT_EQ(mask_key("short"), "*****");
    EXPECT_EQ(mask_key("0123456789"), "0123...6789");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(CredentialStoreTest, Concurrent_RecordAndSelect) {
    const std::vector<std::string> keys{"key-a-0001", "key-b-0002", "key-c-0003", "key-d-0004"};
    for (const auto& k : keys) credentials_->add_credential(k);

    std::vector<std::thread> workers;
    for (const auto& k : keys) {
        workers.emplace_back([&, k] {
            for (int64_t remaining = 200; remaining >= 0; remaining--) {
                credentials_->record_usage(k, remaining, 200 - remaining);
                auto best = credentials_->best_credential();
                if (best) {
                    EXPECT_TRUE(std::find(keys.begin(), keys.end(), *best) != keys.end());
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_FALSE(credentials_->best_credential().has_value());
    EXPECT_EQ(*credentials_->total_remaining(), 0);

    CredentialStore reloaded(store_);
    ASSERT_EQ(reloaded.size(), keys.size());
    for (const auto& c : reloaded.credentials()) {
        EXPECT_EQ(*c.remaining, 0);
        EXPECT_EQ(*c.used, 200);
    }
}
