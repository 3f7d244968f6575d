#include "market_data/odds_normalizer.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace betarb {
namespace normalize {

namespace {
    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool contains(const std::string& haystack, const char* needle) {
        return haystack.find(needle) != std::string::npos;
    }

    std::optional<double> parse_double(const std::string& s) {
        if (s.empty()) return std::nullopt;
        const char* begin = s.c_str();
        char* end = nullptr;
        double value = std::strtod(begin, &end);
        if (end == begin || *end != '\0') return std::nullopt;
        return value;
    }

    std::string string_field(const nlohmann::json& j, const char* key) {
        if (!j.is_object() || !j.contains(key)) return "";
        const auto& v = j.at(key);
        if (v.is_string()) return v.get<std::string>();
        if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
        return "";
    }

    std::optional<WallClock> parse_commence(const std::string& s) {
        if (s.empty()) return std::nullopt;
        auto t = time_utils::parse_iso8601(s);
        if (!t) {
            spdlog::debug("Unparseable commence time: {}", s);
        }
        return t;
    }

    std::string bookmaker_key_from_name(const std::string& name, char separator) {
        std::string key;
        for (char c : to_lower(name)) {
            if (c == ' ') {
                if (separator) key += separator;
            } else {
                key += c;
            }
        }
        return key;
    }
}

std::optional<MarketType> classify_market(const std::string& bet_name) {
    std::string name = to_lower(bet_name);
    if (contains(name, "winner") || contains(name, "match")) return MarketType::H2H;
    if (contains(name, "spread") || contains(name, "handicap")) return MarketType::SPREADS;
    if (contains(name, "total") || contains(name, "over")) return MarketType::TOTALS;
    return std::nullopt;
}

std::optional<double> parse_point(const std::string& label) {
    if (label.find('+') == std::string::npos && label.find('-') == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream ss(label);
    std::string token;
    std::string last;
    while (ss >> token) {
        last = token;
    }
    return parse_double(last);
}

std::optional<double> parse_price(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return parse_double(value.get<std::string>());
    }
    return std::nullopt;
}

std::string title_from_key(const std::string& sport_key) {
    std::string title;
    bool word_start = true;
    for (char c : sport_key) {
        if (c == '_') {
            title += ' ';
            word_start = true;
        } else if (word_start) {
            title += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            word_start = false;
        } else {
            title += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return title;
}

// ============================================================================
// THE ODDS API
// ============================================================================

std::optional<CanonicalGame> from_odds_api_game(const nlohmann::json& game) {
    if (!game.is_object()) return std::nullopt;

    CanonicalGame g;
    g.id = string_field(game, "id");
    g.sport_key = string_field(game, "sport_key");
    g.sport_title = string_field(game, "sport_title");
    if (g.sport_title.empty()) g.sport_title = title_from_key(g.sport_key);
    g.home_team = string_field(game, "home_team");
    g.away_team = string_field(game, "away_team");
    g.commence_time = parse_commence(string_field(game, "commence_time"));

    if (!game.contains("bookmakers") || !game["bookmakers"].is_array()) {
        return g;
    }

    for (const auto& book : game["bookmakers"]) {
        std::string book_key = string_field(book, "key");
        std::string book_title = string_field(book, "title");
        if (!book.contains("markets") || !book["markets"].is_array()) continue;

        for (const auto& market : book["markets"]) {
            auto type = market_type_from_string(string_field(market, "key"));
            if (!type) continue;
            if (!market.contains("outcomes") || !market["outcomes"].is_array()) continue;

            for (const auto& outcome : market["outcomes"]) {
                if (!outcome.is_object() || !outcome.contains("price")) continue;
                auto price = parse_price(outcome["price"]);
                if (!price) continue;

                BookmakerQuote q;
                q.bookmaker_key = book_key;
                q.bookmaker_title = book_title;
                q.market = *type;
                q.outcome_name = string_field(outcome, "name");
                q.price = *price;
                if (outcome.contains("point") && outcome["point"].is_number()) {
                    q.point = outcome["point"].get<double>();
                }
                g.quotes.push_back(std::move(q));
            }
        }
    }

    return g;
}

std::vector<CanonicalGame> from_odds_api(const nlohmann::json& games) {
    std::vector<CanonicalGame> result;
    if (!games.is_array()) {
        spdlog::warn("Odds payload is not an array");
        return result;
    }

    for (const auto& game : games) {
        if (auto g = from_odds_api_game(game)) {
            result.push_back(std::move(*g));
        }
    }
    return result;
}

// ============================================================================
// API-SPORTS
// ============================================================================

std::vector<CanonicalGame> from_api_sports(const nlohmann::json& response,
                                           const std::string& sport_key) {
    std::vector<CanonicalGame> result;
    if (!response.is_array()) return result;

    for (const auto& item : response) {
        if (!item.is_object()) continue;

        CanonicalGame g;
        g.sport_key = sport_key;
        g.sport_title = title_from_key(sport_key);

        if (item.contains("fixture")) {
            const auto& fixture = item["fixture"];
            g.id = string_field(fixture, "id");
            g.commence_time = parse_commence(string_field(fixture, "date"));
        }

        const nlohmann::json* teams = nullptr;
        if (item.contains("teams")) teams = &item["teams"];
        else if (item.contains("league")) teams = &item["league"];
        if (teams && teams->is_object()) {
            if (teams->contains("home")) g.home_team = string_field((*teams)["home"], "name");
            if (teams->contains("away")) g.away_team = string_field((*teams)["away"], "name");
        }

        if (!item.contains("bookmakers") || !item["bookmakers"].is_array()) {
            result.push_back(std::move(g));
            continue;
        }

        for (const auto& book : item["bookmakers"]) {
            std::string title = string_field(book, "name");
            std::string key = bookmaker_key_from_name(title, '\0');
            if (!book.contains("bets") || !book["bets"].is_array()) continue;

            for (const auto& bet : book["bets"]) {
                auto type = classify_market(string_field(bet, "name"));
                if (!type) continue;
                if (!bet.contains("values") || !bet["values"].is_array()) continue;

                for (const auto& value : bet["values"]) {
                    if (!value.is_object() || !value.contains("odd")) continue;
                    auto price = parse_price(value["odd"]);
                    if (!price) continue;

                    BookmakerQuote q;
                    q.bookmaker_key = key;
                    q.bookmaker_title = title;
                    q.market = *type;
                    q.outcome_name = string_field(value, "value");
                    q.price = *price;
                    if (*type != MarketType::H2H) {
                        q.point = parse_point(q.outcome_name);
                    }
                    g.quotes.push_back(std::move(q));
                }
            }
        }

        result.push_back(std::move(g));
    }

    return result;
}

// ============================================================================
// FLAT SPORTSBOOK FEED
// ============================================================================

std::optional<CanonicalGame> from_sportsbook(const nlohmann::json& event) {
    if (!event.is_object() || event.empty()) return std::nullopt;

    CanonicalGame g;
    g.id = string_field(event, "id");
    g.sport_key = string_field(event, "sport");
    g.sport_title = string_field(event, "sport_name");
    if (g.sport_title.empty()) g.sport_title = title_from_key(g.sport_key);
    g.home_team = string_field(event, "home_team");
    g.away_team = string_field(event, "away_team");
    g.commence_time = parse_commence(string_field(event, "start_time"));

    if (!event.contains("odds") || !event["odds"].is_object()) {
        return g;
    }

    const auto& books = event["odds"];
    for (auto it = books.begin(); it != books.end(); ++it) {
        const std::string book_name = it.key();
        const nlohmann::json& odds = it.value();
        std::string key = bookmaker_key_from_name(book_name, '_');

        auto add = [&](const char* field, const std::string& outcome_name) {
            if (!odds.contains(field)) return;
            auto price = parse_price(odds[field]);
            if (!price) return;

            BookmakerQuote q;
            q.bookmaker_key = key;
            q.bookmaker_title = book_name;
            q.market = MarketType::H2H;
            q.outcome_name = outcome_name;
            q.price = *price;
            g.quotes.push_back(std::move(q));
        };

        add("home", g.home_team);
        add("away", g.away_team);
        add("draw", "Draw");
    }

    return g;
}

} // namespace normalize
} // namespace betarb
