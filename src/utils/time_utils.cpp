#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <cctype>
#include <algorithm>

namespace betarb {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

std::optional<WallClock> parse_iso8601(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    auto time_t = timegm(&tm);
    auto tp = std::chrono::system_clock::from_time_t(time_t);

    // Remainder after seconds: optional fraction, then optional zone
    std::string rest = s.size() > 19 ? s.substr(19) : std::string();
    size_t pos = 0;

    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        std::string digits;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            digits += rest[pos++];
        }
        if (!digits.empty()) {
            digits = digits.substr(0, 3);
            while (digits.size() < 3) digits += '0';
            tp += std::chrono::milliseconds(std::stoi(digits));
        }
    }

    if (pos < rest.size()) {
        char zone = rest[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            std::string offset = rest.substr(pos + 1);
            offset.erase(std::remove(offset.begin(), offset.end(), ':'), offset.end());
            if (offset.size() != 4 ||
                !std::all_of(offset.begin(), offset.end(),
                             [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
                return std::nullopt;
            }
            int hours = std::stoi(offset.substr(0, 2));
            int minutes = std::stoi(offset.substr(2, 2));
            auto delta = std::chrono::hours(hours) + std::chrono::minutes(minutes);
            // Local time = UTC + offset
            tp = zone == '+' ? tp - delta : tp + delta;
        } else {
            return std::nullopt;
        }
    }

    return tp;
}

std::string now_iso8601() {
    return to_iso8601(wall_now());
}

std::tm local_tm(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    return tm;
}

std::string format_duration_seconds(int64_t seconds) {
    if (seconds <= 0) return "0s";

    int64_t hours = seconds / 3600;
    int64_t minutes = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h";
        if (minutes > 0) ss << " " << minutes << "m";
    } else if (minutes > 0) {
        ss << minutes << "m";
        if (secs > 0) ss << " " << secs << "s";
    } else {
        ss << secs << "s";
    }
    return ss.str();
}

} // namespace time_utils
} // namespace betarb
