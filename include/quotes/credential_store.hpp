#pragma once

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <mutex>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "persistence/document_store.hpp"

namespace betarb {

// ============================================================================
// CREDENTIAL ROTATION
//
// Several rate-limited API keys are rotated by remaining quota. Quota is only
// known after a key has been used once (the provider reports it in response
// headers), so a fresh key starts out "unknown".
//
// Selection order:
//   1. known remaining > 0, highest first
//   2. unknown remaining, in registration order
//   3. nothing (every key is known to be exhausted)
// ============================================================================

struct Credential {
    std::string key;
    std::optional<int64_t> remaining;
    std::optional<int64_t> used;
    std::optional<WallClock> last_used;
};

void to_json(nlohmann::json& j, const Credential& c);
void from_json(const nlohmann::json& j, Credential& c);

// "abcd...wxyz" for display and logs
std::string mask_key(const std::string& key);

class CredentialStore {
public:
    static constexpr const char* DOCUMENT_NAME = "credentials";

    // Restores persisted quota state; a corrupt document starts empty
    explicit CredentialStore(std::shared_ptr<DocumentStore> store);

    // Returns false if the key is empty or already registered
    bool add_credential(const std::string& key);

    std::optional<std::string> best_credential() const;

    // Overwrites remaining/used and stamps last_used. Out-of-order updates
    // are accepted as-is. Unknown keys are ignored.
    void record_usage(const std::string& key,
                      std::optional<int64_t> remaining,
                      std::optional<int64_t> used = std::nullopt);

    // Sum over keys with known quota; nullopt if none is known
    std::optional<int64_t> total_remaining() const;

    std::vector<Credential> credentials() const;
    size_t size() const;

    // Masked per-key summary
    nlohmann::json stats() const;

private:
    std::shared_ptr<DocumentStore> store_;
    std::vector<Credential> credentials_;
    mutable std::mutex mutex_;

    void load();
    void persist_locked() const;
};

} // namespace betarb
