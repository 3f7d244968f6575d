#include "persistence/document_store.hpp"
#include "persistence/sqlite_document_store.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace betarb {

// ============================================================================
// FILE STORE
// ============================================================================

FileDocumentStore::FileDocumentStore(const std::string& directory)
    : directory_(directory)
{
    std::filesystem::create_directories(directory_);
    spdlog::debug("FileDocumentStore at {}", directory_);
}

std::string FileDocumentStore::path_for(const std::string& name) const {
    return (std::filesystem::path(directory_) / (name + ".json")).string();
}

std::optional<std::string> FileDocumentStore::load(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string path = path_for(name);
    try {
        if (!std::filesystem::exists(path)) {
            return std::nullopt;
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::error("Failed to open document: {}", path);
            return std::nullopt;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    } catch (const std::exception& e) {
        spdlog::error("Failed to read document {}: {}", path, e.what());
        return std::nullopt;
    }
}

bool FileDocumentStore::save(const std::string& name, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_atomic(path_for(name), body);
}

std::string FileDocumentStore::describe() const {
    return "file:" + directory_;
}

bool FileDocumentStore::write_atomic(const std::string& path, const std::string& content) {
    std::string temp_path = path + ".tmp";

    try {
        {
            std::ofstream file(temp_path, std::ios::trunc);
            if (!file.is_open()) {
                spdlog::error("Failed to open temp file: {}", temp_path);
                return false;
            }

            file << content;
            file.flush();

            if (!file.good()) {
                spdlog::error("Failed to write temp file: {}", temp_path);
                return false;
            }
        }

        // Atomic rename
        std::filesystem::rename(temp_path, path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Atomic write failed for {}: {}", path, e.what());
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return false;
    }
}

// ============================================================================
// MEMORY STORE
// ============================================================================

std::optional<std::string> MemoryDocumentStore::load(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(name);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryDocumentStore::save(const std::string& name, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    documents_[name] = body;
    save_count_++;
    return true;
}

size_t MemoryDocumentStore::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_count_;
}

// ============================================================================
// FACTORY
// ============================================================================

std::shared_ptr<DocumentStore> make_document_store(const std::string& backend,
                                                   const std::string& location) {
    if (backend == "file") {
        return std::make_shared<FileDocumentStore>(location);
    }
    if (backend == "sqlite") {
        std::filesystem::path db_path(location);
        if (db_path.has_parent_path()) {
            std::filesystem::create_directories(db_path.parent_path());
        }
        return std::make_shared<SqliteDocumentStore>(location);
    }
    if (backend == "memory") {
        return std::make_shared<MemoryDocumentStore>();
    }
    throw std::runtime_error("Unknown persistence backend: " + backend);
}

} // namespace betarb
