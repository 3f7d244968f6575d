#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <memory>
#include <mutex>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "persistence/document_store.hpp"

namespace betarb {

// ============================================================================
// SIMULATION LEDGER
//
// Paper trading over detected opportunities. A bet is pending until it is
// settled exactly once; settled bets move to the settled history.
//
// Invariants (after every operation):
//   bankroll.total == bankroll.available + bankroll.in_play
//   bankroll.in_play == sum(total_stake of pending bets)
//   bet ids increase monotonically and are never reused
//
// Every mutation is computed on a copy of the state and swapped in only after
// all preconditions pass, so a rejected call changes nothing.
// ============================================================================

struct LedgerLeg {
    std::string outcome;               // Label, e.g. "Over +2.5"
    std::string name;
    std::optional<double> point;
    std::string bookmaker;
    std::string bookmaker_key;
    double odds{0.0};
    double stake{0.0};
    double potential_return{0.0};
    LegStatus status{LegStatus::PENDING};
    std::optional<double> result;
};

struct VirtualBet {
    int64_t id{0};
    WallClock placed_at;
    std::optional<WallClock> settled_at;
    BetStatus status{BetStatus::PENDING};

    std::string sport;
    std::string sport_title;
    std::string event;                 // "Home vs Away"
    std::string home_team;
    std::string away_team;
    std::optional<WallClock> commence_time;
    MarketType market{MarketType::H2H};
    std::optional<double> line;

    double expected_roi{0.0};
    double expected_profit{0.0};
    double total_stake{0.0};
    std::vector<LedgerLeg> legs;

    std::optional<std::string> winning_outcome;
    std::optional<double> actual_return;
    std::optional<double> actual_profit;
};

struct BookmakerBalance {
    double deposited{0.0};
    double balance{0.0};
    double in_play{0.0};
};

struct Bankroll {
    double total{0.0};
    double available{0.0};
    double in_play{0.0};
};

struct LedgerStatistics {
    int64_t total_bets{0};
    int64_t won{0};
    int64_t lost{0};
    int64_t pending{0};
    double total_staked{0.0};          // Accrues at placement
    double settled_staked{0.0};        // Accrues at settlement
    double total_returns{0.0};
    double profit_loss{0.0};           // total_returns - settled_staked
    double roi{0.0};                   // Percent of settled_staked
};

struct LedgerState {
    double starting_bankroll{1000.0};
    WallClock created_at;
    Bankroll bankroll;
    std::map<std::string, BookmakerBalance> bookmaker_balances;
    std::vector<VirtualBet> bets;          // Pending
    std::vector<VirtualBet> settled_bets;
    LedgerStatistics statistics;
    int64_t next_bet_id{1};
};

// Structured settlement key; point is compared only when given
struct OutcomeId {
    std::string name;
    std::optional<double> point;
};

struct PlaceResult {
    bool success{false};
    ErrorKind error{ErrorKind::NONE};
    std::string message;
    std::optional<VirtualBet> bet;
};

struct SettleResult {
    bool success{false};
    ErrorKind error{ErrorKind::NONE};
    std::string message;
    int64_t bet_id{0};
    double profit{0.0};
};

struct LedgerSummary {
    Bankroll bankroll;
    LedgerStatistics statistics;
    size_t pending_bets{0};
    std::map<std::string, BookmakerBalance> bookmaker_balances;
};

struct Rollup {
    int64_t bets{0};
    double profit{0.0};
    double staked{0.0};
    double roi{0.0};
    int64_t wins{0};
};

struct LedgerAnalytics {
    size_t total_settled{0};
    std::map<std::string, Rollup> by_sport;
    std::map<std::string, Rollup> by_market;
    std::vector<std::pair<std::string, Rollup>> by_roi_range;   // 0-1%, 1-2%, 2-5%, 5%+
    LedgerStatistics statistics;
    Bankroll bankroll;
};

// JSON
void to_json(nlohmann::json& j, const LedgerLeg& l);
void from_json(const nlohmann::json& j, LedgerLeg& l);
void to_json(nlohmann::json& j, const VirtualBet& b);
void from_json(const nlohmann::json& j, VirtualBet& b);
void to_json(nlohmann::json& j, const BookmakerBalance& b);
void from_json(const nlohmann::json& j, BookmakerBalance& b);
void to_json(nlohmann::json& j, const Bankroll& b);
void from_json(const nlohmann::json& j, Bankroll& b);
void to_json(nlohmann::json& j, const LedgerStatistics& s);
void from_json(const nlohmann::json& j, LedgerStatistics& s);
void to_json(nlohmann::json& j, const LedgerState& s);
void from_json(const nlohmann::json& j, LedgerState& s);
void to_json(nlohmann::json& j, const LedgerSummary& s);
void to_json(nlohmann::json& j, const Rollup& r);
void to_json(nlohmann::json& j, const LedgerAnalytics& a);

// Expected-ROI bucket label for analytics
std::string roi_bucket(double expected_roi);

class SimulationLedger {
public:
    static constexpr const char* DOCUMENT_NAME = "simulation";

    // Loads the persisted ledger or starts a fresh one.
    // Throws std::runtime_error if the persisted ledger is unreadable.
    explicit SimulationLedger(std::shared_ptr<DocumentStore> store,
                              double starting_bankroll = 1000.0);

    /**
     * Place one leg per opportunity outcome. With an investment override the
     * stakes are rescaled by investment / total_investment. Stakes are rounded
     * to cents.
     */
    PlaceResult place_virtual_bet(const Opportunity& opportunity,
                                  std::optional<double> investment = std::nullopt);

    // Legs whose label equals winning_outcome win; no match means every leg loses
    SettleResult settle_bet(int64_t bet_id, const std::string& winning_outcome);
    SettleResult settle_bet(int64_t bet_id, const OutcomeId& winning_outcome);

    LedgerSummary get_stats() const;
    std::vector<VirtualBet> pending_bets() const;

    // Pending and settled, newest first
    std::vector<VirtualBet> bet_history(size_t limit = 50) const;
    std::optional<VirtualBet> find_bet(int64_t bet_id) const;

    LedgerAnalytics get_analytics() const;

    void reset(double starting_bankroll);

    // Returns false on I/O failure (logged)
    bool export_csv(const std::string& path) const;

    LedgerState snapshot() const;

    // Bankroll identity and in-play consistency
    static bool check_invariants(const LedgerState& state);

private:
    std::shared_ptr<DocumentStore> store_;
    LedgerState state_;
    mutable std::mutex mutex_;

    static LedgerState fresh_state(double starting_bankroll);

    template <typename Matcher>
    SettleResult settle_impl(int64_t bet_id, const std::string& description, Matcher matches);

    void persist_locked() const;
};

} // namespace betarb
