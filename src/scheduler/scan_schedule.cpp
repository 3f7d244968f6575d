#include "scheduler/scan_schedule.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace betarb {

namespace {
    const std::vector<HourRange>& ranges_for(const PeakWindows& w, DayType day) {
        return day == DayType::WEEKEND ? w.weekend : w.weekday;
    }

    WallClock at_local_hour(std::tm local, int hour) {
        local.tm_hour = hour;
        local.tm_min = 0;
        local.tm_sec = 0;
        local.tm_isdst = -1;
        return std::chrono::system_clock::from_time_t(std::mktime(&local));
    }

    nlohmann::json ranges_to_json(const std::vector<HourRange>& ranges) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& r : ranges) {
            out.push_back(fmt::format("{:02d}:00-{:02d}:59", r.start, r.end));
        }
        return out;
    }
}

ScanSchedule::ScanSchedule() {
    categories_ = {
        {"soccer",     PeakWindows{{{17, 22}}, {{12, 22}}}},
        {"basketball", PeakWindows{{{18, 23}}, {{15, 23}}}},
        {"icehockey",  PeakWindows{{{18, 23}}, {{15, 23}}}},
        {"tennis",     PeakWindows{{{10, 20}}, {{10, 20}}}},
    };
    default_ = PeakWindows{{{16, 23}}, {{12, 23}}};
}

void ScanSchedule::set_category(const std::string& category, const PeakWindows& windows) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (category == DEFAULT_CATEGORY) {
        default_ = windows;
        return;
    }
    for (auto& [name, w] : categories_) {
        if (name == category) {
            w = windows;
            return;
        }
    }
    categories_.emplace_back(category, windows);
}

std::string ScanSchedule::category_for(const std::optional<std::string>& sport) const {
    if (!sport) return DEFAULT_CATEGORY;

    std::string lowered = *sport;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, w] : categories_) {
        if (lowered.find(name) != std::string::npos) {
            return name;
        }
    }
    return DEFAULT_CATEGORY;
}

void ScanSchedule::set_global_window(int start_hour, int end_hour) {
    if (start_hour < 0 || start_hour > 23 || end_hour <= start_hour || end_hour > 24) {
        throw std::invalid_argument(fmt::format("Invalid peak window {}-{}", start_hour, end_hour));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    HourRange range{start_hour, end_hour - 1};
    default_ = PeakWindows{{range}, {range}};
    spdlog::info("Peak window set to {:02d}:00-{:02d}:00", start_hour, end_hour);
}

void ScanSchedule::set_intervals(std::chrono::seconds peak, std::chrono::seconds off_peak) {
    if (peak.count() <= 0 || off_peak.count() <= 0) {
        throw std::invalid_argument("Scan intervals must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    peak_interval_ = peak;
    off_peak_interval_ = off_peak;
}

void ScanSchedule::set_skip_off_peak(bool skip) {
    std::lock_guard<std::mutex> lock(mutex_);
    skip_off_peak_ = skip;
}

std::chrono::seconds ScanSchedule::peak_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_interval_;
}

std::chrono::seconds ScanSchedule::off_peak_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return off_peak_interval_;
}

bool ScanSchedule::skip_off_peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return skip_off_peak_;
}

const PeakWindows& ScanSchedule::windows_for_locked(const std::string& category) const {
    for (const auto& [name, w] : categories_) {
        if (name == category) return w;
    }
    return default_;
}

bool ScanSchedule::in_ranges_locked(const std::tm& local, const std::string& category) const {
    const auto& ranges = ranges_for(windows_for_locked(category), day_type_of(local));
    return std::any_of(ranges.begin(), ranges.end(), [&](const HourRange& r) {
        return r.start <= local.tm_hour && local.tm_hour <= r.end;
    });
}

bool ScanSchedule::is_optimal_time(const std::tm& local, const std::optional<std::string>& sport) const {
    std::string category = category_for(sport);
    std::lock_guard<std::mutex> lock(mutex_);
    return in_ranges_locked(local, category);
}

bool ScanSchedule::is_optimal_time(WallClock t, const std::optional<std::string>& sport) const {
    return is_optimal_time(time_utils::local_tm(t), sport);
}

std::chrono::seconds ScanSchedule::recommended_interval(WallClock t) const {
    bool optimal = is_optimal_time(t);
    std::lock_guard<std::mutex> lock(mutex_);
    return optimal ? peak_interval_ : off_peak_interval_;
}

WallClock ScanSchedule::next_optimal_time(WallClock t) const {
    std::tm local = time_utils::local_tm(t);

    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& r : ranges_for(default_, day_type_of(local))) {
        if (local.tm_hour < r.start) {
            return at_local_hour(local, r.start);
        }
    }

    // Tomorrow, normalized through mktime so tm_wday is correct
    std::tm tomorrow = local;
    tomorrow.tm_mday += 1;
    tomorrow.tm_hour = 0;
    tomorrow.tm_min = 0;
    tomorrow.tm_sec = 0;
    tomorrow.tm_isdst = -1;
    std::mktime(&tomorrow);

    const auto& ranges = ranges_for(default_, day_type_of(tomorrow));
    if (ranges.empty()) {
        return at_local_hour(tomorrow, 0);
    }
    return at_local_hour(tomorrow, ranges.front().start);
}

ScheduleDecision ScanSchedule::decide(WallClock t) const {
    ScheduleDecision d;
    d.peak = is_optimal_time(t);

    bool skip;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        skip = skip_off_peak_;
        d.wait = d.peak ? peak_interval_ : off_peak_interval_;
    }

    if (!d.peak && skip) {
        d.action = ScheduleDecision::Action::SLEEP_UNTIL_PEAK;
        auto until = std::chrono::duration_cast<std::chrono::seconds>(next_optimal_time(t) - t);
        d.wait = std::max(until, std::chrono::seconds(1));
    } else {
        d.action = ScheduleDecision::Action::SCAN;
    }
    return d;
}

nlohmann::json ScanSchedule::status(WallClock t) const {
    std::tm local = time_utils::local_tm(t);
    bool optimal = is_optimal_time(local);
    auto next = next_optimal_time(t);

    std::lock_guard<std::mutex> lock(mutex_);
    DayType day = day_type_of(local);

    return nlohmann::json{
        {"current_hour", local.tm_hour},
        {"day_type", day == DayType::WEEKEND ? "weekend" : "weekday"},
        {"is_optimal", optimal},
        {"peak_hours", ranges_to_json(ranges_for(default_, day))},
        {"recommended_interval_minutes", (optimal ? peak_interval_ : off_peak_interval_).count() / 60},
        {"skip_off_peak", skip_off_peak_},
        {"next_optimal_time", time_utils::to_iso8601(next)}
    };
}

} // namespace betarb
