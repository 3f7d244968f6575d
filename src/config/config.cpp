#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <sstream>
#include <spdlog/spdlog.h>

namespace betarb {

void to_json(nlohmann::json& j, const HourRange& r) {
    j = nlohmann::json::array({r.start, r.end});
}

void from_json(const nlohmann::json& j, HourRange& r) {
    j.at(0).get_to(r.start);
    j.at(1).get_to(r.end);
}

void to_json(nlohmann::json& j, const PeakWindows& w) {
    j = nlohmann::json{
        {"weekday", w.weekday},
        {"weekend", w.weekend}
    };
}

void from_json(const nlohmann::json& j, PeakWindows& w) {
    if (j.contains("weekday")) j.at("weekday").get_to(w.weekday);
    if (j.contains("weekend")) j.at("weekend").get_to(w.weekend);
}

void to_json(nlohmann::json& j, const ProviderConfig& c) {
    j = nlohmann::json{
        {"base_url", c.base_url},
        {"regions", c.regions},
        {"timeout_seconds", c.timeout_seconds}
    };
}

void from_json(const nlohmann::json& j, ProviderConfig& c) {
    if (j.contains("base_url")) j.at("base_url").get_to(c.base_url);
    if (j.contains("regions")) j.at("regions").get_to(c.regions);
    if (j.contains("timeout_seconds")) j.at("timeout_seconds").get_to(c.timeout_seconds);
}

void to_json(nlohmann::json& j, const CacheConfig& c) {
    j = nlohmann::json{
        {"odds_ttl_seconds", c.odds_ttl_seconds},
        {"sports_ttl_seconds", c.sports_ttl_seconds}
    };
}

void from_json(const nlohmann::json& j, CacheConfig& c) {
    if (j.contains("odds_ttl_seconds")) j.at("odds_ttl_seconds").get_to(c.odds_ttl_seconds);
    if (j.contains("sports_ttl_seconds")) j.at("sports_ttl_seconds").get_to(c.sports_ttl_seconds);
}

void to_json(nlohmann::json& j, const ScanConfig& c) {
    j = nlohmann::json{
        {"sports", c.sports},
        {"markets", c.markets},
        {"bookmakers", c.bookmakers},
        {"min_roi", c.min_roi},
        {"investment", c.investment},
        {"max_hours", c.max_hours},
        {"live_only", c.live_only}
    };
}

void from_json(const nlohmann::json& j, ScanConfig& c) {
    if (j.contains("sports")) j.at("sports").get_to(c.sports);
    if (j.contains("markets")) j.at("markets").get_to(c.markets);
    if (j.contains("bookmakers")) j.at("bookmakers").get_to(c.bookmakers);
    if (j.contains("min_roi")) j.at("min_roi").get_to(c.min_roi);
    if (j.contains("investment")) j.at("investment").get_to(c.investment);
    if (j.contains("max_hours")) j.at("max_hours").get_to(c.max_hours);
    if (j.contains("live_only")) j.at("live_only").get_to(c.live_only);
}

void to_json(nlohmann::json& j, const AutoScanConfig& c) {
    j = nlohmann::json{
        {"peak_start", c.peak_start},
        {"peak_end", c.peak_end},
        {"peak_interval_seconds", c.peak_interval_seconds},
        {"off_peak_interval_seconds", c.off_peak_interval_seconds},
        {"skip_off_peak", c.skip_off_peak},
        {"min_roi", c.min_roi},
        {"max_investment", c.max_investment},
        {"investment_cap", c.investment_cap},
        {"auto_bet", c.auto_bet}
    };
}

void from_json(const nlohmann::json& j, AutoScanConfig& c) {
    if (j.contains("peak_start")) j.at("peak_start").get_to(c.peak_start);
    if (j.contains("peak_end")) j.at("peak_end").get_to(c.peak_end);
    if (j.contains("peak_interval_seconds")) j.at("peak_interval_seconds").get_to(c.peak_interval_seconds);
    if (j.contains("off_peak_interval_seconds")) j.at("off_peak_interval_seconds").get_to(c.off_peak_interval_seconds);
    if (j.contains("skip_off_peak")) j.at("skip_off_peak").get_to(c.skip_off_peak);
    if (j.contains("min_roi")) j.at("min_roi").get_to(c.min_roi);
    if (j.contains("max_investment")) j.at("max_investment").get_to(c.max_investment);
    if (j.contains("investment_cap")) j.at("investment_cap").get_to(c.investment_cap);
    if (j.contains("auto_bet")) j.at("auto_bet").get_to(c.auto_bet);
}

void to_json(nlohmann::json& j, const ScheduleConfig& c) {
    j = nlohmann::json{
        {"peak_interval_seconds", c.peak_interval_seconds},
        {"off_peak_interval_seconds", c.off_peak_interval_seconds},
        {"categories", c.categories}
    };
}

void from_json(const nlohmann::json& j, ScheduleConfig& c) {
    if (j.contains("peak_interval_seconds")) j.at("peak_interval_seconds").get_to(c.peak_interval_seconds);
    if (j.contains("off_peak_interval_seconds")) j.at("off_peak_interval_seconds").get_to(c.off_peak_interval_seconds);
    if (j.contains("categories")) j.at("categories").get_to(c.categories);
}

void to_json(nlohmann::json& j, const SimulationConfig& c) {
    j = nlohmann::json{
        {"starting_bankroll", c.starting_bankroll}
    };
}

void from_json(const nlohmann::json& j, SimulationConfig& c) {
    if (j.contains("starting_bankroll")) j.at("starting_bankroll").get_to(c.starting_bankroll);
}

void to_json(nlohmann::json& j, const PersistenceConfig& c) {
    j = nlohmann::json{
        {"backend", c.backend},
        {"location", c.location}
    };
}

void from_json(const nlohmann::json& j, PersistenceConfig& c) {
    if (j.contains("backend")) j.at("backend").get_to(c.backend);
    if (j.contains("location")) j.at("location").get_to(c.location);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"provider", c.provider},
        {"cache", c.cache},
        {"scan", c.scan},
        {"auto_scan", c.auto_scan},
        {"schedule", c.schedule},
        {"simulation", c.simulation},
        {"persistence", c.persistence},
        {"logging", c.logging},
        {"api_keys", c.api_keys}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("provider")) j.at("provider").get_to(c.provider);
    if (j.contains("cache")) j.at("cache").get_to(c.cache);
    if (j.contains("scan")) j.at("scan").get_to(c.scan);
    if (j.contains("auto_scan")) j.at("auto_scan").get_to(c.auto_scan);
    if (j.contains("schedule")) j.at("schedule").get_to(c.schedule);
    if (j.contains("simulation")) j.at("simulation").get_to(c.simulation);
    if (j.contains("persistence")) j.at("persistence").get_to(c.persistence);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("api_keys")) j.at("api_keys").get_to(c.api_keys);
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (simulation.starting_bankroll <= 0) {
        spdlog::error("starting_bankroll must be positive");
        return false;
    }

    if (scan.investment <= 0) {
        spdlog::error("scan.investment must be positive");
        return false;
    }

    for (const auto& m : scan.markets) {
        if (!market_type_from_string(m)) {
            spdlog::error("Unknown market in scan.markets: {}", m);
            return false;
        }
    }

    if (scan.max_hours < 0) {
        spdlog::error("scan.max_hours must be non-negative");
        return false;
    }

    if (cache.odds_ttl_seconds <= 0 || cache.sports_ttl_seconds <= 0) {
        spdlog::error("Cache TTLs must be positive");
        return false;
    }

    if (auto_scan.peak_start < 0 || auto_scan.peak_start > 23 ||
        auto_scan.peak_end <= auto_scan.peak_start || auto_scan.peak_end > 24) {
        spdlog::error("auto_scan peak window {}-{} is invalid", auto_scan.peak_start, auto_scan.peak_end);
        return false;
    }

    if (auto_scan.peak_interval_seconds <= 0 || auto_scan.off_peak_interval_seconds <= 0 ||
        schedule.peak_interval_seconds <= 0 || schedule.off_peak_interval_seconds <= 0) {
        spdlog::error("Scan intervals must be positive");
        return false;
    }

    if (auto_scan.max_investment <= 0 || auto_scan.investment_cap <= 0) {
        spdlog::error("auto_scan investment limits must be positive");
        return false;
    }

    if (auto_scan.max_investment > simulation.starting_bankroll * 0.5) {
        spdlog::warn("auto_scan.max_investment is > 50% of bankroll, this is risky");
    }

    for (const auto& [name, windows] : schedule.categories) {
        for (const auto* ranges : {&windows.weekday, &windows.weekend}) {
            for (const auto& r : *ranges) {
                if (r.start < 0 || r.end > 23 || r.start > r.end) {
                    spdlog::error("schedule.categories.{} has invalid range {}-{}", name, r.start, r.end);
                    return false;
                }
            }
        }
    }

    if (persistence.backend != "file" && persistence.backend != "sqlite" && persistence.backend != "memory") {
        spdlog::error("Unknown persistence backend: {}", persistence.backend);
        return false;
    }

    return true;
}

void Config::apply_env() {
    for (const auto& key : parse_key_list(get_env("ODDS_API_KEYS"))) {
        if (std::find(api_keys.begin(), api_keys.end(), key) == api_keys.end()) {
            api_keys.push_back(key);
        }
    }
}

std::vector<std::string> Config::parse_key_list(const std::string& raw) {
    std::vector<std::string> keys;

    auto trim = [](std::string s) {
        auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return std::string();
        auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    };

    std::string trimmed = trim(raw);
    if (trimmed.empty()) return keys;

    if (trimmed.front() == '[') {
        try {
            for (const auto& item : nlohmann::json::parse(trimmed)) {
                if (item.is_string() && !trim(item.get<std::string>()).empty()) {
                    keys.push_back(trim(item.get<std::string>()));
                }
            }
            return keys;
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("ODDS_API_KEYS is not valid JSON, reading as comma list: {}", e.what());
            keys.clear();
        }
    }

    std::stringstream ss(trimmed);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) keys.push_back(item);
    }
    return keys;
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace betarb
