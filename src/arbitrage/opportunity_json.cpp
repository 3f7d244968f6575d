#include "arbitrage/opportunity_json.hpp"
#include "utils/time_utils.hpp"
#include <stdexcept>

namespace betarb {

void to_json(nlohmann::json& j, const StakeLeg& l) {
    j = nlohmann::json{
        {"label", l.label},
        {"name", l.name},
        {"point", nullptr},
        {"stake", round2(l.stake)},
        {"odds", l.odds},
        {"book", l.bookmaker},
        {"book_key", l.bookmaker_key},
        {"potential_return", round2(l.potential_return)}
    };
    if (l.point) j["point"] = *l.point;
}

void from_json(const nlohmann::json& j, StakeLeg& l) {
    j.at("label").get_to(l.label);
    if (j.contains("name")) j.at("name").get_to(l.name);
    if (l.name.empty()) l.name = l.label;
    if (j.contains("point") && !j["point"].is_null()) l.point = j["point"].get<double>();
    j.at("stake").get_to(l.stake);
    j.at("odds").get_to(l.odds);
    if (j.contains("book")) j.at("book").get_to(l.bookmaker);
    if (j.contains("book_key")) j.at("book_key").get_to(l.bookmaker_key);
    if (j.contains("potential_return")) j.at("potential_return").get_to(l.potential_return);
}

void to_json(nlohmann::json& j, const Opportunity& o) {
    j = nlohmann::json{
        {"game_id", o.game_id},
        {"sport", o.sport},
        {"sport_title", o.sport_title},
        {"home_team", o.home_team},
        {"away_team", o.away_team},
        {"commence_time", o.commence_time ? time_utils::to_iso8601(*o.commence_time) : ""},
        {"market", market_type_to_string(o.market)},
        {"line", nullptr},
        {"legs", o.legs},
        {"profit", round2(o.profit)},
        {"roi", round2(o.roi)},
        {"total_return", round2(o.total_return)},
        {"total_investment", round2(o.total_investment)},
        {"implied_probability", o.implied_probability}
    };
    if (o.line) j["line"] = *o.line;
}

void from_json(const nlohmann::json& j, Opportunity& o) {
    if (j.contains("game_id")) j.at("game_id").get_to(o.game_id);
    j.at("sport").get_to(o.sport);
    if (j.contains("sport_title")) j.at("sport_title").get_to(o.sport_title);
    if (j.contains("home_team")) j.at("home_team").get_to(o.home_team);
    if (j.contains("away_team")) j.at("away_team").get_to(o.away_team);
    if (j.contains("commence_time") && j["commence_time"].is_string()) {
        o.commence_time = time_utils::parse_iso8601(j["commence_time"].get<std::string>());
    }

    auto market = market_type_from_string(j.at("market").get<std::string>());
    if (!market) {
        throw std::invalid_argument("Unknown market: " + j.at("market").get<std::string>());
    }
    o.market = *market;

    if (j.contains("line") && !j["line"].is_null()) o.line = j["line"].get<double>();
    j.at("legs").get_to(o.legs);
    if (j.contains("profit")) j.at("profit").get_to(o.profit);
    if (j.contains("roi")) j.at("roi").get_to(o.roi);
    if (j.contains("total_return")) j.at("total_return").get_to(o.total_return);
    j.at("total_investment").get_to(o.total_investment);
    if (j.contains("implied_probability")) j.at("implied_probability").get_to(o.implied_probability);
}

} // namespace betarb
