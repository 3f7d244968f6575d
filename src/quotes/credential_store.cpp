#include "quotes/credential_store.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace betarb {

void to_json(nlohmann::json& j, const Credential& c) {
    j = nlohmann::json{
        {"key", c.key},
        {"remaining", nullptr},
        {"used", nullptr},
        {"last_used", nullptr}
    };
    if (c.remaining) j["remaining"] = *c.remaining;
    if (c.used) j["used"] = *c.used;
    if (c.last_used) j["last_used"] = time_utils::to_iso8601(*c.last_used);
}

void from_json(const nlohmann::json& j, Credential& c) {
    j.at("key").get_to(c.key);
    if (j.contains("remaining") && !j["remaining"].is_null()) {
        c.remaining = j["remaining"].get<int64_t>();
    }
    if (j.contains("used") && !j["used"].is_null()) {
        c.used = j["used"].get<int64_t>();
    }
    if (j.contains("last_used") && j["last_used"].is_string()) {
        c.last_used = time_utils::parse_iso8601(j["last_used"].get<std::string>());
    }
}

std::string mask_key(const std::string& key) {
    if (key.size() <= 8) {
        return std::string(key.size(), '*');
    }
    return key.substr(0, 4) + "..." + key.substr(key.size() - 4);
}

CredentialStore::CredentialStore(std::shared_ptr<DocumentStore> store)
    : store_(std::move(store))
{
    load();
}

void CredentialStore::load() {
    if (!store_) return;

    auto body = store_->load(DOCUMENT_NAME);
    if (!body) return;

    try {
        auto j = nlohmann::json::parse(*body);
        std::vector<Credential> loaded;
        for (const auto& item : j.at("keys")) {
            loaded.push_back(item.get<Credential>());
        }
        credentials_ = std::move(loaded);
        spdlog::debug("Restored {} credentials", credentials_.size());
    } catch (const std::exception& e) {
        spdlog::warn("Credential document unreadable, starting empty: {}", e.what());
        credentials_.clear();
    }
}

void CredentialStore::persist_locked() const {
    if (!store_) return;

    nlohmann::json j;
    j["keys"] = credentials_;
    j["updated_at"] = time_utils::now_iso8601();

    if (!store_->save(DOCUMENT_NAME, j.dump(2))) {
        spdlog::warn("Failed to persist credential state");
    }
}

bool CredentialStore::add_credential(const std::string& key) {
    if (key.empty()) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(credentials_.begin(), credentials_.end(),
                           [&](const Credential& c) { return c.key == key; });
    if (it != credentials_.end()) {
        return false;
    }

    Credential c;
    c.key = key;
    credentials_.push_back(c);
    persist_locked();

    spdlog::info("Registered API key {}", mask_key(key));
    return true;
}

std::optional<std::string> CredentialStore::best_credential() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const Credential* best_known = nullptr;
    const Credential* first_unknown = nullptr;

    for (const auto& c : credentials_) {
        if (!c.remaining) {
            if (!first_unknown) first_unknown = &c;
            continue;
        }
        if (*c.remaining <= 0) continue;
        if (!best_known || *c.remaining > *best_known->remaining) {
            best_known = &c;
        }
    }

    if (best_known) return best_known->key;
    if (first_unknown) return first_unknown->key;
    return std::nullopt;
}

void CredentialStore::record_usage(const std::string& key,
                                   std::optional<int64_t> remaining,
                                   std::optional<int64_t> used) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(credentials_.begin(), credentials_.end(),
                           [&](const Credential& c) { return c.key == key; });
    if (it == credentials_.end()) {
        spdlog::warn("Usage reported for unregistered key {}", mask_key(key));
        return;
    }

    it->remaining = remaining;
    if (used) it->used = used;
    it->last_used = wall_now();

    if (remaining) {
        spdlog::debug("Key {} has {} requests remaining", mask_key(key), *remaining);
    }
    persist_locked();
}

std::optional<int64_t> CredentialStore::total_remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<int64_t> total;
    for (const auto& c : credentials_) {
        if (c.remaining) {
            total = total.value_or(0) + *c.remaining;
        }
    }
    return total;
}

std::vector<Credential> CredentialStore::credentials() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_;
}

size_t CredentialStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_.size();
}

nlohmann::json CredentialStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json keys = nlohmann::json::array();
    int64_t known_total = 0;
    for (const auto& c : credentials_) {
        nlohmann::json entry = c;
        entry["key"] = mask_key(c.key);
        keys.push_back(entry);
        if (c.remaining) known_total += *c.remaining;
    }

    return nlohmann::json{
        {"total_keys", credentials_.size()},
        {"total_remaining", known_total},
        {"keys", keys}
    };
}

} // namespace betarb
