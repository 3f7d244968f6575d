#include "persistence/sqlite_document_store.hpp"
#include "common/types.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace betarb {

SqliteDocumentStore::SqliteDocumentStore(const std::string& db_path)
    : db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    // WAL mode for better concurrent access
    execute("PRAGMA journal_mode = WAL;");

    execute(R"(
        CREATE TABLE IF NOT EXISTS documents (
            name TEXT PRIMARY KEY,
            body TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )");

    spdlog::info("SqliteDocumentStore opened: {}", db_path);
}

SqliteDocumentStore::~SqliteDocumentStore() {
    close();
}

bool SqliteDocumentStore::is_open() const {
    return db_ != nullptr;
}

void SqliteDocumentStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
        spdlog::debug("SqliteDocumentStore closed");
    }
}

std::string SqliteDocumentStore::describe() const {
    return "sqlite:" + db_path_;
}

std::optional<std::string> SqliteDocumentStore::load(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }

    try {
        sqlite3_stmt* stmt = prepare("SELECT body FROM documents WHERE name = ?;");
        bind_text(stmt, 1, name);

        std::optional<std::string> result;
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            result = get_text(stmt, 0);
        } else if (rc != SQLITE_DONE) {
            spdlog::error("Failed to load document {}: {}", name, sqlite3_errmsg(db_));
        }
        finalize(stmt);
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load document {}: {}", name, e.what());
        return std::nullopt;
    }
}

bool SqliteDocumentStore::save(const std::string& name, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        spdlog::error("Save of {} on closed database", name);
        return false;
    }

    try {
        sqlite3_stmt* stmt = prepare(R"(
            INSERT INTO documents (name, body, updated_at) VALUES (?, ?, ?)
            ON CONFLICT(name) DO UPDATE SET body = excluded.body,
                                            updated_at = excluded.updated_at;
        )");
        bind_text(stmt, 1, name);
        bind_text(stmt, 2, body);
        bind_int64(stmt, 3, now_ms());

        int rc = sqlite3_step(stmt);
        finalize(stmt);

        if (rc != SQLITE_DONE) {
            spdlog::error("Failed to save document {}: {}", name, sqlite3_errmsg(db_));
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save document {}: {}", name, e.what());
        return false;
    }
}

int64_t SqliteDocumentStore::updated_at(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }

    sqlite3_stmt* stmt = prepare("SELECT updated_at FROM documents WHERE name = ?;");
    bind_text(stmt, 1, name);

    int64_t result = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        result = sqlite3_column_int64(stmt, 0);
    }
    finalize(stmt);
    return result;
}

void SqliteDocumentStore::execute(const std::string& sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string error = errmsg ? errmsg : "Unknown error";
        sqlite3_free(errmsg);
        throw std::runtime_error("SQL error: " + error + " in: " + sql);
    }
}

sqlite3_stmt* SqliteDocumentStore::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " +
                                 std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void SqliteDocumentStore::bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void SqliteDocumentStore::bind_int64(sqlite3_stmt* stmt, int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
}

void SqliteDocumentStore::finalize(sqlite3_stmt* stmt) {
    sqlite3_finalize(stmt);
}

std::string SqliteDocumentStore::get_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

} // namespace betarb
