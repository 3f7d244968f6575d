#pragma once

#include <string>
#include <optional>
#include <map>
#include <memory>
#include <mutex>

namespace betarb {

// ============================================================================
// DOCUMENT STORE
//
// Whole-document persistence for the cache, the credential list and the
// simulation ledger. Every save replaces the previous document entirely
// (last writer wins). Callers own the JSON encoding.
// ============================================================================

class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    // Returns nullopt if the document was never saved or cannot be read
    virtual std::optional<std::string> load(const std::string& name) = 0;

    // Returns false on write failure (already logged)
    virtual bool save(const std::string& name, const std::string& body) = 0;

    virtual std::string describe() const = 0;
};

/**
 * One JSON file per document under a directory.
 * Writes go to "<name>.json.tmp" and are renamed over the target.
 */
class FileDocumentStore : public DocumentStore {
public:
    explicit FileDocumentStore(const std::string& directory);

    std::optional<std::string> load(const std::string& name) override;
    bool save(const std::string& name, const std::string& body) override;
    std::string describe() const override;

    std::string path_for(const std::string& name) const;

private:
    std::string directory_;
    std::mutex mutex_;

    bool write_atomic(const std::string& path, const std::string& content);
};

/**
 * Process-local store for tests and ephemeral runs.
 */
class MemoryDocumentStore : public DocumentStore {
public:
    std::optional<std::string> load(const std::string& name) override;
    bool save(const std::string& name, const std::string& body) override;
    std::string describe() const override { return "memory"; }

    size_t save_count() const;

private:
    std::map<std::string, std::string> documents_;
    size_t save_count_{0};
    mutable std::mutex mutex_;
};

/**
 * Build a store from a backend name: "file", "sqlite" or "memory".
 * Throws std::runtime_error for unknown backends or open failures.
 */
std::shared_ptr<DocumentStore> make_document_store(const std::string& backend,
                                                   const std::string& location);

} // namespace betarb
