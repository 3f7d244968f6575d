#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "scheduler/scan_schedule.hpp"

namespace betarb {

struct ProviderConfig {
    std::string base_url{"https://api.the-odds-api.com/v4"};
    std::string regions{"eu,uk"};
    int timeout_seconds{30};
};

struct CacheConfig {
    int odds_ttl_seconds{300};               // 5 minutes
    int sports_ttl_seconds{86400};           // 24 hours
};

struct ScanConfig {
    std::vector<std::string> sports;         // Empty = every active sport
    std::vector<std::string> markets{"h2h", "spreads", "totals"};
    std::vector<std::string> bookmakers;     // Empty = all
    double min_roi{0.5};                     // Percent
    double investment{500.0};
    double max_hours{0.0};                   // 0 = no limit
    bool live_only{false};
};

struct AutoScanConfig {
    int peak_start{17};                      // Inclusive hour
    int peak_end{22};                        // Exclusive hour
    int peak_interval_seconds{1800};
    int off_peak_interval_seconds{3600};
    bool skip_off_peak{true};
    double min_roi{0.5};
    double max_investment{100.0};
    double investment_cap{100.0};
    bool auto_bet{true};
};

struct ScheduleConfig {
    int peak_interval_seconds{300};          // Recommended interval during peak
    int off_peak_interval_seconds{1800};
    std::map<std::string, PeakWindows> categories;   // Overrides/additions to built-in table
};

struct SimulationConfig {
    double starting_bankroll{1000.0};
};

struct PersistenceConfig {
    std::string backend{"file"};             // file, sqlite, memory
    std::string location{"./data"};          // Directory (file) or db path (sqlite)
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{false};                 // JSON lines format
    int max_log_file_size_mb{20};
    int max_log_files{5};
};

struct Config {
    ProviderConfig provider;
    CacheConfig cache;
    ScanConfig scan;
    AutoScanConfig auto_scan;
    ScheduleConfig schedule;
    SimulationConfig simulation;
    PersistenceConfig persistence;
    LoggingConfig logging;

    std::vector<std::string> api_keys;

    // Load from file
    static Config load(const std::string& path);

    // Save to file
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Merge keys from ODDS_API_KEYS (JSON array or comma-separated)
    void apply_env();

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");

    // JSON array or comma-separated list, blanks dropped
    static std::vector<std::string> parse_key_list(const std::string& raw);
};

// JSON serialization
void to_json(nlohmann::json& j, const HourRange& r);
void from_json(const nlohmann::json& j, HourRange& r);
void to_json(nlohmann::json& j, const PeakWindows& w);
void from_json(const nlohmann::json& j, PeakWindows& w);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace betarb
