#include "simulation/simulation_ledger.hpp"
#include "arbitrage/arbitrage_engine.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace betarb {

namespace {
    constexpr double MONEY_EPSILON = 0.005;

    nlohmann::json optional_time(const std::optional<WallClock>& t) {
        return t ? nlohmann::json(time_utils::to_iso8601(*t)) : nlohmann::json(nullptr);
    }

    std::optional<WallClock> read_time(const nlohmann::json& j, const char* key) {
        if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
        return time_utils::parse_iso8601(j[key].get<std::string>());
    }

    template <typename T>
    nlohmann::json optional_value(const std::optional<T>& v) {
        return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
    }

    template <typename T>
    std::optional<T> read_optional(const nlohmann::json& j, const char* key) {
        if (!j.contains(key) || j[key].is_null()) return std::nullopt;
        return j[key].get<T>();
    }

    std::string csv_field(const std::string& s) {
        if (s.find_first_of(",\"\n") == std::string::npos) return s;
        std::string out = "\"";
        for (char c : s) {
            if (c == '"') out += "\"\"";
            else out += c;
        }
        out += "\"";
        return out;
    }

    std::string csv_money(const std::optional<double>& v) {
        return v ? fmt::format("{:.2f}", *v) : "";
    }

    void add_to_rollup(Rollup& r, const VirtualBet& bet) {
        r.bets++;
        r.profit += bet.actual_profit.value_or(0.0);
        r.staked += bet.total_stake;
        if (bet.actual_profit.value_or(0.0) > 0) r.wins++;
    }

    void finish_rollup(Rollup& r) {
        r.profit = round2(r.profit);
        r.staked = round2(r.staked);
        r.roi = r.staked > 0 ? r.profit / r.staked * 100.0 : 0.0;
    }
}

// ============================================================================
// JSON
// ============================================================================

void to_json(nlohmann::json& j, const LedgerLeg& l) {
    j = nlohmann::json{
        {"outcome", l.outcome},
        {"name", l.name},
        {"point", optional_value(l.point)},
        {"bookmaker", l.bookmaker},
        {"bookmaker_key", l.bookmaker_key},
        {"odds", l.odds},
        {"stake", l.stake},
        {"potential_return", l.potential_return},
        {"status", leg_status_to_string(l.status)},
        {"result", optional_value(l.result)}
    };
}

void from_json(const nlohmann::json& j, LedgerLeg& l) {
    j.at("outcome").get_to(l.outcome);
    if (j.contains("name")) j.at("name").get_to(l.name);
    l.point = read_optional<double>(j, "point");
    j.at("bookmaker").get_to(l.bookmaker);
    if (j.contains("bookmaker_key")) j.at("bookmaker_key").get_to(l.bookmaker_key);
    j.at("odds").get_to(l.odds);
    j.at("stake").get_to(l.stake);
    j.at("potential_return").get_to(l.potential_return);
    l.status = leg_status_from_string(j.at("status").get<std::string>());
    l.result = read_optional<double>(j, "result");
}

void to_json(nlohmann::json& j, const VirtualBet& b) {
    j = nlohmann::json{
        {"id", b.id},
        {"placed_at", time_utils::to_iso8601(b.placed_at)},
        {"settled_at", optional_time(b.settled_at)},
        {"status", bet_status_to_string(b.status)},
        {"sport", b.sport},
        {"sport_title", b.sport_title},
        {"event", b.event},
        {"home_team", b.home_team},
        {"away_team", b.away_team},
        {"commence_time", optional_time(b.commence_time)},
        {"market", market_type_to_string(b.market)},
        {"line", optional_value(b.line)},
        {"expected_roi", b.expected_roi},
        {"expected_profit", b.expected_profit},
        {"total_stake", b.total_stake},
        {"legs", b.legs},
        {"winning_outcome", optional_value(b.winning_outcome)},
        {"actual_return", optional_value(b.actual_return)},
        {"actual_profit", optional_value(b.actual_profit)}
    };
}

void from_json(const nlohmann::json& j, VirtualBet& b) {
    j.at("id").get_to(b.id);
    auto placed = read_time(j, "placed_at");
    if (!placed) {
        throw std::runtime_error(fmt::format("Bet #{} has no valid placed_at", b.id));
    }
    b.placed_at = *placed;
    b.settled_at = read_time(j, "settled_at");
    b.status = bet_status_from_string(j.at("status").get<std::string>());
    if (j.contains("sport")) j.at("sport").get_to(b.sport);
    if (j.contains("sport_title")) j.at("sport_title").get_to(b.sport_title);
    if (j.contains("event")) j.at("event").get_to(b.event);
    if (j.contains("home_team")) j.at("home_team").get_to(b.home_team);
    if (j.contains("away_team")) j.at("away_team").get_to(b.away_team);
    b.commence_time = read_time(j, "commence_time");
    b.market = market_type_from_string(j.at("market").get<std::string>()).value_or(MarketType::H2H);
    b.line = read_optional<double>(j, "line");
    j.at("expected_roi").get_to(b.expected_roi);
    j.at("expected_profit").get_to(b.expected_profit);
    j.at("total_stake").get_to(b.total_stake);
    j.at("legs").get_to(b.legs);
    b.winning_outcome = read_optional<std::string>(j, "winning_outcome");
    b.actual_return = read_optional<double>(j, "actual_return");
    b.actual_profit = read_optional<double>(j, "actual_profit");
}

void to_json(nlohmann::json& j, const BookmakerBalance& b) {
    j = nlohmann::json{
        {"deposited", b.deposited},
        {"balance", b.balance},
        {"in_play", b.in_play}
    };
}

void from_json(const nlohmann::json& j, BookmakerBalance& b) {
    if (j.contains("deposited")) j.at("deposited").get_to(b.deposited);
    if (j.contains("balance")) j.at("balance").get_to(b.balance);
    if (j.contains("in_play")) j.at("in_play").get_to(b.in_play);
}

void to_json(nlohmann::json& j, const Bankroll& b) {
    j = nlohmann::json{
        {"total", b.total},
        {"available", b.available},
        {"in_play", b.in_play}
    };
}

void from_json(const nlohmann::json& j, Bankroll& b) {
    j.at("total").get_to(b.total);
    j.at("available").get_to(b.available);
    j.at("in_play").get_to(b.in_play);
}

void to_json(nlohmann::json& j, const LedgerStatistics& s) {
    j = nlohmann::json{
        {"total_bets", s.total_bets},
        {"won", s.won},
        {"lost", s.lost},
        {"pending", s.pending},
        {"total_staked", s.total_staked},
        {"settled_staked", s.settled_staked},
        {"total_returns", s.total_returns},
        {"profit_loss", s.profit_loss},
        {"roi", s.roi}
    };
}

void from_json(const nlohmann::json& j, LedgerStatistics& s) {
    if (j.contains("total_bets")) j.at("total_bets").get_to(s.total_bets);
    if (j.contains("won")) j.at("won").get_to(s.won);
    if (j.contains("lost")) j.at("lost").get_to(s.lost);
    if (j.contains("pending")) j.at("pending").get_to(s.pending);
    if (j.contains("total_staked")) j.at("total_staked").get_to(s.total_staked);
    if (j.contains("settled_staked")) j.at("settled_staked").get_to(s.settled_staked);
    if (j.contains("total_returns")) j.at("total_returns").get_to(s.total_returns);
    if (j.contains("profit_loss")) j.at("profit_loss").get_to(s.profit_loss);
    if (j.contains("roi")) j.at("roi").get_to(s.roi);
}

void to_json(nlohmann::json& j, const LedgerState& s) {
    j = nlohmann::json{
        {"settings", {
            {"starting_bankroll", s.starting_bankroll},
            {"created_at", time_utils::to_iso8601(s.created_at)}
        }},
        {"bankroll", s.bankroll},
        {"bookmaker_balances", s.bookmaker_balances},
        {"bets", s.bets},
        {"settled_bets", s.settled_bets},
        {"statistics", s.statistics},
        {"next_bet_id", s.next_bet_id}
    };
}

void from_json(const nlohmann::json& j, LedgerState& s) {
    const auto& settings = j.at("settings");
    settings.at("starting_bankroll").get_to(s.starting_bankroll);
    s.created_at = read_time(settings, "created_at").value_or(wall_now());

    j.at("bankroll").get_to(s.bankroll);
    if (j.contains("bookmaker_balances")) j.at("bookmaker_balances").get_to(s.bookmaker_balances);
    j.at("bets").get_to(s.bets);
    if (j.contains("settled_bets")) j.at("settled_bets").get_to(s.settled_bets);
    if (j.contains("statistics")) j.at("statistics").get_to(s.statistics);

    // Never reuse an id, even if next_bet_id was lost
    int64_t max_id = 0;
    for (const auto& b : s.bets) max_id = std::max(max_id, b.id);
    for (const auto& b : s.settled_bets) max_id = std::max(max_id, b.id);
    s.next_bet_id = std::max<int64_t>(j.value("next_bet_id", int64_t{1}), max_id + 1);
}

void to_json(nlohmann::json& j, const LedgerSummary& s) {
    j = nlohmann::json{
        {"bankroll", s.bankroll},
        {"statistics", s.statistics},
        {"pending_bets", s.pending_bets},
        {"bookmaker_balances", s.bookmaker_balances}
    };
}

void to_json(nlohmann::json& j, const Rollup& r) {
    j = nlohmann::json{
        {"bets", r.bets},
        {"profit", r.profit},
        {"staked", r.staked},
        {"roi", r.roi},
        {"wins", r.wins}
    };
}

void to_json(nlohmann::json& j, const LedgerAnalytics& a) {
    nlohmann::json ranges = nlohmann::json::object();
    for (const auto& [label, rollup] : a.by_roi_range) {
        ranges[label] = rollup;
    }
    j = nlohmann::json{
        {"total_settled", a.total_settled},
        {"by_sport", a.by_sport},
        {"by_market", a.by_market},
        {"by_roi_range", ranges},
        {"statistics", a.statistics},
        {"bankroll", a.bankroll}
    };
}

std::string roi_bucket(double expected_roi) {
    if (expected_roi < 1.0) return "0-1%";
    if (expected_roi < 2.0) return "1-2%";
    if (expected_roi < 5.0) return "2-5%";
    return "5%+";
}

// ============================================================================
// LEDGER
// ============================================================================

SimulationLedger::SimulationLedger(std::shared_ptr<DocumentStore> store, double starting_bankroll)
    : store_(std::move(store))
    , state_(fresh_state(starting_bankroll))
{
    if (!store_) return;

    auto body = store_->load(DOCUMENT_NAME);
    if (!body) {
        spdlog::info("Starting new simulation with bankroll {:.2f}", starting_bankroll);
        return;
    }

    try {
        state_ = nlohmann::json::parse(*body).get<LedgerState>();
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("Simulation ledger unreadable: ") + e.what());
    }

    if (!check_invariants(state_)) {
        spdlog::warn("Loaded ledger violates bankroll invariants: total={:.2f} available={:.2f} in_play={:.2f}",
                     state_.bankroll.total, state_.bankroll.available, state_.bankroll.in_play);

        // Pending bets are the record; rebuild in_play and total from them
        double pending_stake = 0.0;
        for (const auto& bet : state_.bets) {
            pending_stake += bet.total_stake;
        }
        state_.bankroll.in_play = round2(pending_stake);
        state_.bankroll.total = round2(state_.bankroll.available + state_.bankroll.in_play);
        state_.statistics.pending = static_cast<int64_t>(state_.bets.size());

        spdlog::warn("Bankroll rebuilt from {} pending bets: total={:.2f} in_play={:.2f}",
                     state_.bets.size(), state_.bankroll.total, state_.bankroll.in_play);
    }

    spdlog::info("Simulation ledger loaded: {} pending, {} settled, bankroll {:.2f}",
                 state_.bets.size(), state_.settled_bets.size(), state_.bankroll.total);
}

LedgerState SimulationLedger::fresh_state(double starting_bankroll) {
    LedgerState s;
    s.starting_bankroll = starting_bankroll;
    s.created_at = wall_now();
    s.bankroll = Bankroll{starting_bankroll, starting_bankroll, 0.0};
    return s;
}

bool SimulationLedger::check_invariants(const LedgerState& state) {
    const auto& b = state.bankroll;
    if (std::fabs(b.total - (b.available + b.in_play)) > MONEY_EPSILON) {
        return false;
    }

    double pending_stake = 0.0;
    for (const auto& bet : state.bets) {
        pending_stake += bet.total_stake;
    }
    return std::fabs(pending_stake - b.in_play) <= MONEY_EPSILON;
}

PlaceResult SimulationLedger::place_virtual_bet(const Opportunity& opportunity,
                                                std::optional<double> investment) {
    PlaceResult result;

    if (opportunity.legs.size() < 2) {
        result.error = ErrorKind::VALIDATION;
        result.message = "Opportunity needs at least two outcomes";
        return result;
    }
    if (investment && *investment <= 0.0) {
        result.error = ErrorKind::VALIDATION;
        result.message = fmt::format("Investment must be positive, got {:.2f}", *investment);
        return result;
    }
    if (investment && opportunity.total_investment <= 0.0) {
        result.error = ErrorKind::VALIDATION;
        result.message = "Opportunity has no total investment to rescale from";
        return result;
    }

    double scale = investment ? *investment / opportunity.total_investment : 1.0;

    VirtualBet bet;
    bet.status = BetStatus::PENDING;
    bet.sport = opportunity.sport;
    bet.sport_title = opportunity.sport_title;
    bet.event = opportunity.teams();
    bet.home_team = opportunity.home_team;
    bet.away_team = opportunity.away_team;
    bet.commence_time = opportunity.commence_time;
    bet.market = opportunity.market;
    bet.line = opportunity.line;
    bet.expected_roi = round2(opportunity.roi);
    bet.expected_profit = round2(opportunity.profit * scale);

    double total_stake = 0.0;
    for (const auto& leg : opportunity.legs) {
        if (leg.odds <= 0.0 || leg.stake <= 0.0) {
            result.error = ErrorKind::VALIDATION;
            result.message = fmt::format("Invalid leg {}: odds {:.2f}, stake {:.2f}",
                                         leg.label, leg.odds, leg.stake);
            return result;
        }

        LedgerLeg l;
        l.outcome = leg.label;
        l.name = leg.name.empty() ? leg.label : leg.name;
        l.point = leg.point;
        l.bookmaker = leg.bookmaker;
        l.bookmaker_key = leg.bookmaker_key;
        l.odds = leg.odds;
        l.stake = round2(leg.stake * scale);
        l.potential_return = round2(l.stake * l.odds);
        total_stake += l.stake;
        bet.legs.push_back(std::move(l));
    }
    bet.total_stake = round2(total_stake);

    std::lock_guard<std::mutex> lock(mutex_);

    if (bet.total_stake > state_.bankroll.available + 1e-9) {
        result.error = ErrorKind::INSUFFICIENT_BANKROLL;
        result.message = fmt::format("Insufficient bankroll. Need {:.2f}, have {:.2f}",
                                     bet.total_stake, state_.bankroll.available);
        return result;
    }

    LedgerState next = state_;

    bet.id = next.next_bet_id++;
    bet.placed_at = wall_now();

    for (const auto& l : bet.legs) {
        auto& balance = next.bookmaker_balances[l.bookmaker];
        balance.in_play = round2(balance.in_play + l.stake);
    }

    next.bankroll.available = round2(next.bankroll.available - bet.total_stake);
    next.bankroll.in_play = round2(next.bankroll.in_play + bet.total_stake);
    next.bankroll.total = round2(next.bankroll.available + next.bankroll.in_play);

    next.statistics.total_bets++;
    next.statistics.pending++;
    next.statistics.total_staked = round2(next.statistics.total_staked + bet.total_stake);

    next.bets.push_back(bet);

    if (!check_invariants(next)) {
        spdlog::error("Placement of bet #{} would break bankroll invariants, rejected", bet.id);
        result.error = ErrorKind::VALIDATION;
        result.message = "Bankroll invariant violated";
        return result;
    }

    state_ = std::move(next);
    persist_locked();

    spdlog::info("Virtual bet #{} placed: {} {} stake {:.2f} (expected roi {:.2f}%)",
                 bet.id, bet.event, market_type_to_string(bet.market), bet.total_stake, bet.expected_roi);

    result.success = true;
    result.message = fmt::format("Virtual bet #{} placed! Staked {:.2f}", bet.id, bet.total_stake);
    result.bet = std::move(bet);
    return result;
}

template <typename Matcher>
SettleResult SimulationLedger::settle_impl(int64_t bet_id, const std::string& description, Matcher matches) {
    SettleResult result;
    result.bet_id = bet_id;

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(state_.bets.begin(), state_.bets.end(),
                           [&](const VirtualBet& b) { return b.id == bet_id; });
    if (it == state_.bets.end()) {
        bool settled = std::any_of(state_.settled_bets.begin(), state_.settled_bets.end(),
                                   [&](const VirtualBet& b) { return b.id == bet_id; });
        result.error = settled ? ErrorKind::ALREADY_SETTLED : ErrorKind::NOT_FOUND;
        result.message = settled ? fmt::format("Bet #{} already settled", bet_id)
                                 : fmt::format("Bet #{} not found", bet_id);
        return result;
    }

    LedgerState next = state_;
    auto pos = next.bets.begin() + std::distance(state_.bets.begin(), it);
    VirtualBet bet = *pos;
    next.bets.erase(pos);

    double total_return = 0.0;
    for (auto& leg : bet.legs) {
        auto& balance = next.bookmaker_balances[leg.bookmaker];
        balance.in_play = round2(balance.in_play - leg.stake);

        if (matches(leg)) {
            leg.status = LegStatus::WON;
            leg.result = leg.potential_return;
            total_return += leg.potential_return;
            balance.balance = round2(balance.balance + leg.potential_return);
        } else {
            leg.status = LegStatus::LOST;
            leg.result = 0.0;
        }
    }
    total_return = round2(total_return);

    bet.status = BetStatus::SETTLED;
    bet.settled_at = wall_now();
    bet.winning_outcome = description;
    bet.actual_return = total_return;
    bet.actual_profit = round2(total_return - bet.total_stake);

    next.bankroll.in_play = round2(next.bankroll.in_play - bet.total_stake);
    next.bankroll.available = round2(next.bankroll.available + total_return);
    next.bankroll.total = round2(next.bankroll.available + next.bankroll.in_play);

    auto& stats = next.statistics;
    stats.pending--;
    stats.settled_staked = round2(stats.settled_staked + bet.total_stake);
    stats.total_returns = round2(stats.total_returns + total_return);
    stats.profit_loss = round2(stats.total_returns - stats.settled_staked);
    stats.roi = stats.settled_staked > 0 ? stats.profit_loss / stats.settled_staked * 100.0 : 0.0;
    if (*bet.actual_profit > 0) {
        stats.won++;
    } else {
        stats.lost++;
    }

    next.settled_bets.push_back(bet);

    if (!check_invariants(next)) {
        spdlog::error("Settlement of bet #{} would break bankroll invariants, rejected", bet_id);
        result.error = ErrorKind::VALIDATION;
        result.message = "Bankroll invariant violated";
        return result;
    }

    state_ = std::move(next);
    persist_locked();

    result.success = true;
    result.profit = *bet.actual_profit;
    result.message = fmt::format("Bet #{} settled. {}: {:.2f}", bet_id,
                                 result.profit > 0 ? "Won" : "Lost", result.profit);
    spdlog::info("{}", result.message);
    return result;
}

SettleResult SimulationLedger::settle_bet(int64_t bet_id, const std::string& winning_outcome) {
    return settle_impl(bet_id, winning_outcome, [&](const LedgerLeg& leg) {
        return leg.outcome == winning_outcome;
    });
}

SettleResult SimulationLedger::settle_bet(int64_t bet_id, const OutcomeId& winning_outcome) {
    return settle_impl(bet_id, outcome_label(winning_outcome.name, winning_outcome.point),
                       [&](const LedgerLeg& leg) {
        if (leg.name != winning_outcome.name) return false;
        if (!winning_outcome.point) return true;
        return leg.point && std::fabs(*leg.point - *winning_outcome.point) < 1e-9;
    });
}

LedgerSummary SimulationLedger::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LedgerSummary s;
    s.bankroll = state_.bankroll;
    s.statistics = state_.statistics;
    s.pending_bets = state_.bets.size();
    s.bookmaker_balances = state_.bookmaker_balances;
    return s;
}

std::vector<VirtualBet> SimulationLedger::pending_bets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.bets;
}

std::vector<VirtualBet> SimulationLedger::bet_history(size_t limit) const {
    std::vector<VirtualBet> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all = state_.bets;
        all.insert(all.end(), state_.settled_bets.begin(), state_.settled_bets.end());
    }

    std::sort(all.begin(), all.end(),
              [](const VirtualBet& a, const VirtualBet& b) { return a.id > b.id; });
    if (all.size() > limit) {
        all.resize(limit);
    }
    return all;
}

std::optional<VirtualBet> SimulationLedger::find_bet(int64_t bet_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto* list : {&state_.bets, &state_.settled_bets}) {
        for (const auto& b : *list) {
            if (b.id == bet_id) return b;
        }
    }
    return std::nullopt;
}

LedgerAnalytics SimulationLedger::get_analytics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    LedgerAnalytics a;
    a.total_settled = state_.settled_bets.size();
    a.statistics = state_.statistics;
    a.bankroll = state_.bankroll;
    a.by_roi_range = {
        {"0-1%", Rollup{}},
        {"1-2%", Rollup{}},
        {"2-5%", Rollup{}},
        {"5%+", Rollup{}}
    };

    for (const auto& bet : state_.settled_bets) {
        add_to_rollup(a.by_sport[bet.sport_title.empty() ? "Unknown" : bet.sport_title], bet);
        add_to_rollup(a.by_market[market_type_to_string(bet.market)], bet);

        std::string bucket = roi_bucket(bet.expected_roi);
        for (auto& [label, rollup] : a.by_roi_range) {
            if (label == bucket) add_to_rollup(rollup, bet);
        }
    }

    for (auto& [name, r] : a.by_sport) finish_rollup(r);
    for (auto& [name, r] : a.by_market) finish_rollup(r);
    for (auto& [label, r] : a.by_roi_range) finish_rollup(r);

    return a;
}

void SimulationLedger::reset(double starting_bankroll) {
    if (starting_bankroll <= 0) {
        throw std::invalid_argument("Starting bankroll must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = fresh_state(starting_bankroll);
    persist_locked();
    spdlog::info("Simulation reset with bankroll {:.2f}", starting_bankroll);
}

bool SimulationLedger::export_csv(const std::string& path) const {
    auto bets = bet_history(std::numeric_limits<size_t>::max());
    std::reverse(bets.begin(), bets.end());

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        spdlog::error("Failed to open CSV export: {}", path);
        return false;
    }

    file << "ID,Placed At,Status,Event,Sport,Market,Expected ROI,Expected Profit,"
            "Total Stake,Actual Return,Actual Profit,Winning Outcome\n";

    for (const auto& b : bets) {
        file << b.id << ','
             << time_utils::to_iso8601(b.placed_at) << ','
             << bet_status_to_string(b.status) << ','
             << csv_field(b.event) << ','
             << csv_field(b.sport_title) << ','
             << market_type_to_string(b.market) << ','
             << fmt::format("{:.2f}", b.expected_roi) << ','
             << fmt::format("{:.2f}", b.expected_profit) << ','
             << fmt::format("{:.2f}", b.total_stake) << ','
             << csv_money(b.actual_return) << ','
             << csv_money(b.actual_profit) << ','
             << csv_field(b.winning_outcome.value_or("")) << '\n';
    }

    if (!file.good()) {
        spdlog::error("Failed writing CSV export: {}", path);
        return false;
    }

    spdlog::info("Exported {} bets to {}", bets.size(), path);
    return true;
}

LedgerState SimulationLedger::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void SimulationLedger::persist_locked() const {
    if (!store_) return;

    nlohmann::json j = state_;
    if (!store_->save(DOCUMENT_NAME, j.dump(2))) {
        spdlog::error("Failed to persist simulation ledger");
    }
}

} // namespace betarb
