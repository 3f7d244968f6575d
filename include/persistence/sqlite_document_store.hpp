#pragma once

#include <string>
#include <optional>
#include <mutex>
#include <cstdint>
#include "persistence/document_store.hpp"

// Forward declare sqlite3
struct sqlite3;
struct sqlite3_stmt;

namespace betarb {

// ============================================================================
// SQLITE DOCUMENT STORE
//
// Single table keyed by document name:
//   documents(name TEXT PRIMARY KEY, body TEXT, updated_at INTEGER)
// Saves are one upsert statement, so a document is never half-written.
// ============================================================================

class SqliteDocumentStore : public DocumentStore {
public:
    explicit SqliteDocumentStore(const std::string& db_path);
    ~SqliteDocumentStore() override;

    // Non-copyable
    SqliteDocumentStore(const SqliteDocumentStore&) = delete;
    SqliteDocumentStore& operator=(const SqliteDocumentStore&) = delete;

    std::optional<std::string> load(const std::string& name) override;
    bool save(const std::string& name, const std::string& body) override;
    std::string describe() const override;

    bool is_open() const;
    void close();

    // Unix ms of the last save, or 0
    int64_t updated_at(const std::string& name);

private:
    std::string db_path_;
    sqlite3* db_{nullptr};
    std::mutex mutex_;

    void execute(const std::string& sql);
    sqlite3_stmt* prepare(const std::string& sql);
    void bind_text(sqlite3_stmt* stmt, int index, const std::string& value);
    void bind_int64(sqlite3_stmt* stmt, int index, int64_t value);
    void finalize(sqlite3_stmt* stmt);
    std::string get_text(sqlite3_stmt* stmt, int col);
};

} // namespace betarb
