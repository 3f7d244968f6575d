#include <gtest/gtest.h>
#include "persistence/document_store.hpp"
#include "persistence/sqlite_document_store.hpp"
#include <filesystem>
#include <fstream>
#include <chrono>

using namespace betarb;

class DocumentStoreTest : public ::testing::Test {
protected:
    std::string test_dir_;
    std::string test_db_path_;

    void SetUp() override {
        auto stamp = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        test_dir_ = "/tmp/test_betarb_docs_" + stamp;
        test_db_path_ = "/tmp/test_betarb_docs_" + stamp + ".db";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
        std::filesystem::remove(test_db_path_);
        std::filesystem::remove(test_db_path_ + "-wal");
        std::filesystem::remove(test_db_path_ + "-shm");
    }
};

// ============================================================================
// File Store
// ============================================================================

TEST_F(DocumentStoreTest, File_MissingDocumentIsNullopt) {
    FileDocumentStore store(test_dir_);
    EXPECT_FALSE(store.load("nothing").has_value());
}

TEST_F(DocumentStoreTest, File_SaveThenLoad) {
    FileDocumentStore store(test_dir_);
    ASSERT_TRUE(store.save("cache", R"({"odds":{}})"));

    auto body = store.load("cache");
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, R"({"odds":{}})");
    EXPECT_TRUE(std::filesystem::exists(store.path_for("cache")));
}

TEST_F(DocumentStoreTest, File_SaveReplacesWholeDocument) {
    FileDocumentStore store(test_dir_);
    store.save("simulation", "first version, long body");
    store.save("simulation", "second");

    EXPECT_EQ(*store.load("simulation"), "second");
    EXPECT_FALSE(std::filesystem::exists(store.path_for("simulation") + ".tmp"));
}

TEST_F(DocumentStoreTest, File_SurvivesReopen) {
    {
        FileDocumentStore store(test_dir_);
        store.save("credentials", R"({"keys":[]})");
    }
    FileDocumentStore reopened(test_dir_);
    EXPECT_EQ(*reopened.load("credentials"), R"({"keys":[]})");
}

// ============================================================================
// SQLite Store
// ============================================================================

TEST_F(DocumentStoreTest, Sqlite_OpensAndRoundTrips) {
    SqliteDocumentStore store(test_db_path_);
    EXPECT_TRUE(store.is_open());
    EXPECT_FALSE(store.load("cache").has_value());
    EXPECT_EQ(store.updated_at("cache"), 0);

    ASSERT_TRUE(store.save("cache", R"({"sports":null})"));
    EXPECT_EQ(*store.load("cache"), R"({"sports":null})");
    EXPECT_GT(store.updated_at("cache"), 0);
}

TEST_F(DocumentStoreTest, Sqlite_UpsertKeepsOneRow) {
    SqliteDocumentStore store(test_db_path_);
    store.save("simulation", "v1");
    store.save("simulation", "v2");
    EXPECT_EQ(*store.load("simulation"), "v2");
}

TEST_F(DocumentStoreTest, Sqlite_SurvivesReopen) {
    {
        SqliteDocumentStore store(test_db_path_);
        store.save("credentials", "persisted");
    }
    SqliteDocumentStore reopened(test_db_path_);
    EXPECT_EQ(*reopened.load("credentials"), "persisted");
}

// ============================================================================
// Memory Store and Factory
// ============================================================================

TEST_F(DocumentStoreTest, Memory_CountsSaves) {
    MemoryDocumentStore store;
    store.save("a", "1");
    store.save("a", "2");
    EXPECT_EQ(store.save_count(), 2u);
    EXPECT_EQ(*store.load("a"), "2");
    EXPECT_EQ(store.describe(), "memory");
}

TEST_F(DocumentStoreTest, Factory_BuildsEachBackend) {
    auto file = make_document_store("file", test_dir_);
    EXPECT_EQ(file->describe(), "file:" + test_dir_);

    auto sqlite = make_document_store("sqlite", test_db_path_);
    EXPECT_TRUE(sqlite->save("x", "y"));

    auto memory = make_document_store("memory", "");
    EXPECT_EQ(memory->describe(), "memory");
}

TEST_F(DocumentStoreTest, Factory_RejectsUnknownBackend) {
    EXPECT_THROW(make_document_store("redis", test_dir_), std::runtime_error);
}
