#include "arbitrage/arbitrage_engine.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace betarb {

std::string outcome_label(const std::string& name, std::optional<double> point) {
    if (!point) return name;
    return fmt::format("{} {:+g}", name, *point);
}

std::vector<BestPrice> ArbitrageEngine::find_best_odds(const CanonicalGame& game,
                                                       MarketType market) const {
    std::vector<BestPrice> best;

    for (const auto& quote : game.quotes) {
        if (quote.market != market) continue;
        if (quote.price <= 0.0) continue;

        std::optional<double> point;
        if (market != MarketType::H2H) {
            if (!quote.point) continue;
            point = quote.point;
        }

        std::string key = outcome_label(quote.outcome_name, point);

        auto it = std::find_if(best.begin(), best.end(),
                               [&](const BestPrice& b) { return b.key == key; });
        if (it == best.end()) {
            best.push_back(BestPrice{key, quote.outcome_name, point, quote.price,
                                     quote.bookmaker_title, quote.bookmaker_key});
        } else if (quote.price > it->price) {
            it->price = quote.price;
            it->bookmaker = quote.bookmaker_title;
            it->bookmaker_key = quote.bookmaker_key;
        }
    }

    return best;
}

std::vector<LineGroup> ArbitrageEngine::group_by_line(const std::vector<BestPrice>& best) const {
    std::vector<LineGroup> groups;

    for (const auto& b : best) {
        if (!b.point) continue;
        double line = std::fabs(*b.point);

        auto it = std::find_if(groups.begin(), groups.end(),
                               [&](const LineGroup& g) { return g.line == line; });
        if (it == groups.end()) {
            groups.push_back(LineGroup{line, {b}});
        } else {
            it->outcomes.push_back(b);
        }
    }

    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [](const LineGroup& g) { return g.outcomes.size() < 2; }),
                 groups.end());
    return groups;
}

std::optional<Opportunity> ArbitrageEngine::calculate_arbitrage(const std::vector<BestPrice>& outcomes,
                                                                double investment) const {
    if (outcomes.size() < 2) {
        return std::nullopt;
    }
    if (investment <= 0.0) {
        spdlog::debug("Rejecting non-positive investment {}", investment);
        return std::nullopt;
    }

    double total_implied = 0.0;
    for (const auto& o : outcomes) {
        if (o.price <= 0.0) {
            return std::nullopt;
        }
        total_implied += 1.0 / o.price;
    }

    if (total_implied >= 1.0) {
        return std::nullopt;
    }

    Opportunity opp;
    opp.total_investment = investment;
    opp.implied_probability = total_implied;
    opp.total_return = investment / total_implied;
    opp.profit = opp.total_return - investment;
    opp.roi = 100.0 * (1.0 / total_implied - 1.0);

    for (const auto& o : outcomes) {
        StakeLeg leg;
        leg.label = o.key;
        leg.name = o.name;
        leg.point = o.point;
        leg.odds = o.price;
        leg.bookmaker = o.bookmaker;
        leg.bookmaker_key = o.bookmaker_key;
        leg.stake = investment * (1.0 / o.price) / total_implied;
        leg.potential_return = leg.stake * o.price;
        opp.legs.push_back(std::move(leg));
    }

    return opp;
}

std::vector<Opportunity> ArbitrageEngine::analyze_game(const CanonicalGame& game,
                                                       MarketType market,
                                                       double investment,
                                                       double min_roi) const {
    std::vector<Opportunity> found;

    auto best = find_best_odds(game, market);
    if (best.size() < 2) {
        return found;
    }

    auto emit = [&](const std::vector<BestPrice>& outcomes, std::optional<double> line) {
        auto opp = calculate_arbitrage(outcomes, investment);
        if (!opp || opp->roi < min_roi) return;

        opp->game_id = game.id;
        opp->sport = game.sport_key;
        opp->sport_title = game.sport_title;
        opp->home_team = game.home_team;
        opp->away_team = game.away_team;
        opp->commence_time = game.commence_time;
        opp->market = market;
        opp->line = line;

        spdlog::debug("Arbitrage: {} {} {} roi={:.2f}%", game.teams(),
                      market_type_to_string(market),
                      line ? fmt::format("@{:g}", *line) : "", opp->roi);
        found.push_back(std::move(*opp));
    };

    if (market == MarketType::H2H) {
        emit(best, std::nullopt);
    } else {
        for (const auto& group : group_by_line(best)) {
            emit(group.outcomes, group.line);
        }
    }

    return found;
}

void ArbitrageEngine::rank(std::vector<Opportunity>& opportunities) {
    std::stable_sort(opportunities.begin(), opportunities.end(),
                     [](const Opportunity& a, const Opportunity& b) { return a.roi > b.roi; });
}

} // namespace betarb
