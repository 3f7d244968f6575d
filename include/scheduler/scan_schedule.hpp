#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <chrono>
#include <ctime>
#include <mutex>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace betarb {

// Inclusive local-hour range: {17, 22} covers 17:00 through 22:59
struct HourRange {
    int start{0};
    int end{23};
};

struct PeakWindows {
    std::vector<HourRange> weekday;
    std::vector<HourRange> weekend;
};

enum class DayType {
    WEEKDAY,
    WEEKEND   // Saturday, Sunday
};

inline DayType day_type_of(const std::tm& local) {
    return (local.tm_wday == 0 || local.tm_wday == 6) ? DayType::WEEKEND : DayType::WEEKDAY;
}

struct ScheduleDecision {
    enum class Action {
        SCAN,                // Scan now, then wait `wait`
        SLEEP_UNTIL_PEAK     // Don't scan, wait `wait` until the next peak
    };

    Action action{Action::SCAN};
    std::chrono::seconds wait{0};
    bool peak{false};
};

// ============================================================================
// SCAN SCHEDULE
//
// One table of peak hours per sport category and day type, with a "default"
// category used for the background loop and for unmatched sports. A sport
// matches the first category whose name is a substring of its lowercased key
// ("soccer_epl" -> soccer).
//
// The single global window {start, end-exclusive} is expressed in the same
// table: set_global_window() rewrites "default" to [start, end - 1] for both
// day types.
// ============================================================================

class ScanSchedule {
public:
    static constexpr const char* DEFAULT_CATEGORY = "default";

    // soccer/basketball/icehockey/tennis/default, 5min peak / 30min off-peak
    ScanSchedule();

    void set_category(const std::string& category, const PeakWindows& windows);
    std::string category_for(const std::optional<std::string>& sport) const;

    // start_hour inclusive, end_hour exclusive
    void set_global_window(int start_hour, int end_hour);
    void set_intervals(std::chrono::seconds peak, std::chrono::seconds off_peak);
    void set_skip_off_peak(bool skip);

    bool is_optimal_time(const std::tm& local, const std::optional<std::string>& sport = std::nullopt) const;
    bool is_optimal_time(WallClock t, const std::optional<std::string>& sport = std::nullopt) const;

    std::chrono::seconds recommended_interval(WallClock t) const;

    // Next start of a default-category range strictly after the current hour,
    // today or else tomorrow
    WallClock next_optimal_time(WallClock t) const;

    ScheduleDecision decide(WallClock t) const;

    nlohmann::json status(WallClock t) const;

    std::chrono::seconds peak_interval() const;
    std::chrono::seconds off_peak_interval() const;
    bool skip_off_peak() const;

private:
    std::vector<std::pair<std::string, PeakWindows>> categories_;
    PeakWindows default_;
    std::chrono::seconds peak_interval_{std::chrono::minutes(5)};
    std::chrono::seconds off_peak_interval_{std::chrono::minutes(30)};
    bool skip_off_peak_{false};
    mutable std::mutex mutex_;

    const PeakWindows& windows_for_locked(const std::string& category) const;
    bool in_ranges_locked(const std::tm& local, const std::string& category) const;
};

} // namespace betarb
