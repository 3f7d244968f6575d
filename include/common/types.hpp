#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cmath>
#include <cstdint>

namespace betarb {

// Time types
using WallClock = std::chrono::time_point<std::chrono::system_clock>;

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// Monetary display precision (cents)
inline double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

// Market types
enum class MarketType {
    H2H,      // Moneyline, 2-way or 3-way
    SPREADS,  // Handicap
    TOTALS    // Over/under
};

inline std::string market_type_to_string(MarketType m) {
    switch (m) {
        case MarketType::H2H: return "h2h";
        case MarketType::SPREADS: return "spreads";
        case MarketType::TOTALS: return "totals";
    }
    return "unknown";
}

inline std::optional<MarketType> market_type_from_string(const std::string& s) {
    if (s == "h2h") return MarketType::H2H;
    if (s == "spreads") return MarketType::SPREADS;
    if (s == "totals") return MarketType::TOTALS;
    return std::nullopt;
}

// One price from one bookmaker for one outcome
struct BookmakerQuote {
    std::string bookmaker_key;
    std::string bookmaker_title;
    MarketType market{MarketType::H2H};
    std::string outcome_name;
    double price{0.0};                 // Decimal odds
    std::optional<double> point;       // Spread/total line
};

struct CanonicalGame {
    std::string id;
    std::string sport_key;
    std::string sport_title;
    std::string home_team;
    std::string away_team;
    std::optional<WallClock> commence_time;
    std::vector<BookmakerQuote> quotes;

    std::string teams() const { return home_team + " vs " + away_team; }
};

// One outcome of a detected opportunity with its hedged stake
struct StakeLeg {
    std::string label;                 // "Over +2.5" or plain outcome name
    std::string name;
    std::optional<double> point;
    double stake{0.0};
    double odds{0.0};
    std::string bookmaker;
    std::string bookmaker_key;
    double potential_return{0.0};
};

struct Opportunity {
    std::string game_id;
    std::string sport;
    std::string sport_title;
    std::string home_team;
    std::string away_team;
    std::optional<WallClock> commence_time;
    MarketType market{MarketType::H2H};
    std::optional<double> line;

    std::vector<StakeLeg> legs;

    // Full precision; rounded only when displayed or serialized
    double total_investment{0.0};
    double total_return{0.0};
    double profit{0.0};
    double roi{0.0};                   // Percent
    double implied_probability{0.0};   // Sum of 1/odds over legs

    std::string teams() const { return home_team + " vs " + away_team; }
};

// Virtual bet states
enum class BetStatus {
    PENDING,
    SETTLED
};

inline std::string bet_status_to_string(BetStatus s) {
    return s == BetStatus::PENDING ? "pending" : "settled";
}

inline BetStatus bet_status_from_string(const std::string& s) {
    return s == "settled" ? BetStatus::SETTLED : BetStatus::PENDING;
}

enum class LegStatus {
    PENDING,
    WON,
    LOST
};

inline std::string leg_status_to_string(LegStatus s) {
    switch (s) {
        case LegStatus::PENDING: return "pending";
        case LegStatus::WON: return "won";
        case LegStatus::LOST: return "lost";
    }
    return "unknown";
}

inline LegStatus leg_status_from_string(const std::string& s) {
    if (s == "won") return LegStatus::WON;
    if (s == "lost") return LegStatus::LOST;
    return LegStatus::PENDING;
}

} // namespace betarb
