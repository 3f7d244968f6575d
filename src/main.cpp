#include <iostream>
#include <iomanip>
#include <fstream>
#include <filesystem>
#include <csignal>
#include <atomic>
#include <thread>
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "common/types.hpp"
#include "common/errors.hpp"
#include "config/config.hpp"
#include "app/services.hpp"
#include "arbitrage/opportunity_json.hpp"
#include "scheduler/auto_scanner.hpp"
#include "utils/time_utils.hpp"

using namespace betarb;

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown = true;
    }
}

void setup_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.log_to_console) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);
    }

    if (config.log_to_file) {
        std::filesystem::create_directories(config.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_dir + "/betarb.log",
            config.max_log_file_size_mb * 1024 * 1024,
            config.max_log_files
        );
        if (config.json_format) {
            file_sink->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","msg":"%v"})");
        }
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("betarb", sinks.begin(), sinks.end());

    if (config.log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (config.log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (config.log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
}

// ============================================================================
// OUTPUT
// ============================================================================

std::string format_time(const std::optional<WallClock>& t) {
    return t ? time_utils::to_iso8601(*t) : "-";
}

void print_opportunity(size_t index, const Opportunity& opp) {
    std::cout << fmt::format("[{}] {} ({}) {}{}\n", index, opp.teams(), opp.sport_title,
                             market_type_to_string(opp.market),
                             opp.line ? fmt::format(" line {:g}", *opp.line) : "");
    std::cout << fmt::format("    starts {}  ROI {:.2f}%  profit {:.2f} on {:.2f}\n",
                             format_time(opp.commence_time), round2(opp.roi),
                             round2(opp.profit), round2(opp.total_investment));
    for (const auto& leg : opp.legs) {
        std::cout << fmt::format("      {:<28} @ {:<6.2f} {:<20} stake {:>9.2f}  returns {:>9.2f}\n",
                                 leg.label, leg.odds, leg.bookmaker,
                                 round2(leg.stake), round2(leg.potential_return));
    }
}

void print_bet(const VirtualBet& bet) {
    std::cout << fmt::format("#{:<5} {:<8} {:<40} {:<8} stake {:>9.2f}  exp ROI {:.2f}%",
                             bet.id, bet_status_to_string(bet.status), bet.event,
                             market_type_to_string(bet.market), bet.total_stake, bet.expected_roi);
    if (bet.actual_profit) {
        std::cout << fmt::format("  P/L {:+.2f} ({})", *bet.actual_profit,
                                 bet.winning_outcome.value_or("-"));
    }
    std::cout << "\n";
    for (const auto& leg : bet.legs) {
        std::cout << fmt::format("        {:<28} @ {:<6.2f} {:<20} {:>9.2f}  {}\n",
                                 leg.outcome, leg.odds, leg.bookmaker, leg.stake,
                                 leg_status_to_string(leg.status));
    }
}

void print_summary(const LedgerSummary& summary) {
    const auto& b = summary.bankroll;
    const auto& s = summary.statistics;

    std::cout << "┌─────────────────────────────────────────────┐\n";
    std::cout << "│ SIMULATION                                  │\n";
    std::cout << "├─────────────────────────────────────────────┤\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Bankroll:   " << b.total << " (available " << b.available
              << ", in play " << b.in_play << ")\n";
    std::cout << "  Bets:       " << s.total_bets << " total, " << s.pending << " pending, "
              << s.won << " won, " << s.lost << " lost\n";
    std::cout << "  Staked:     " << s.total_staked << " (settled " << s.settled_staked << ")\n";
    std::cout << "  Returns:    " << s.total_returns << "\n";
    std::cout << "  P/L:        " << s.profit_loss << " (ROI " << s.roi << "%)\n";
    std::cout << "└─────────────────────────────────────────────┘\n";

    for (const auto& [key, balance] : summary.bookmaker_balances) {
        std::cout << fmt::format("  {:<20} deposited {:>9.2f}  balance {:>9.2f}  in play {:>9.2f}\n",
                                 key, balance.deposited, balance.balance, balance.in_play);
    }
}

void print_rollups(const std::string& title, const std::map<std::string, Rollup>& rollups) {
    std::cout << title << "\n";
    for (const auto& [name, r] : rollups) {
        std::cout << fmt::format("  {:<30} bets {:>4}  wins {:>4}  staked {:>9.2f}  profit {:>+9.2f}  ROI {:>6.2f}%\n",
                                 name, r.bets, r.wins, r.staked, r.profit, r.roi);
    }
}

// ============================================================================
// COMMANDS
// ============================================================================

struct ScanOptions {
    std::vector<std::string> sports;
    std::vector<std::string> markets;
    std::vector<std::string> bookmakers;
    std::optional<double> min_roi;
    std::optional<double> investment;
    std::optional<double> max_hours;
    bool live_only{false};
    bool json{false};
    std::string save_path;
};

void apply_scan_options(Config& config, const ScanOptions& opts) {
    if (!opts.sports.empty()) config.scan.sports = opts.sports;
    if (!opts.markets.empty()) config.scan.markets = opts.markets;
    if (!opts.bookmakers.empty()) config.scan.bookmakers = opts.bookmakers;
    if (opts.min_roi) config.scan.min_roi = *opts.min_roi;
    if (opts.investment) config.scan.investment = *opts.investment;
    if (opts.max_hours) config.scan.max_hours = *opts.max_hours;
    if (opts.live_only) config.scan.live_only = true;
}

int run_scan(const Config& config, Services& services, const ScanOptions& opts) {
    ScanRequest request = scan_request_from(config);
    ScanReport report = services.scanner->scan(request);

    if (!opts.save_path.empty()) {
        std::ofstream out(opts.save_path);
        if (!out) {
            spdlog::error("Cannot write {}", opts.save_path);
            return 1;
        }
        out << nlohmann::json(report.opportunities).dump(2);
        spdlog::info("Saved {} opportunities to {}", report.opportunities.size(), opts.save_path);
    }

    if (opts.json) {
        nlohmann::json j = {
            {"opportunities", report.opportunities},
            {"sports_scanned", report.sports_scanned},
            {"games_scanned", report.games_scanned},
            {"failed_sports", report.failed_sports}
        };
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    std::cout << fmt::format("{} opportunities across {} games in {} sports\n",
                             report.opportunities.size(), report.games_scanned, report.sports_scanned);
    if (!report.failed_sports.empty()) {
        std::cout << "Failed: " << fmt::format("{}", fmt::join(report.failed_sports, ", ")) << "\n";
    }
    for (size_t i = 0; i < report.opportunities.size(); i++) {
        print_opportunity(i, report.opportunities[i]);
    }
    return 0;
}

int run_auto(const Config& config, Services& services, bool no_bet) {
    configure_auto_schedule(*services.schedule, config.auto_scan);

    AutoScanSettings settings = auto_settings_from(config);
    if (no_bet) settings.auto_bet = false;

    AutoScanner scanner(services.scanner, services.ledger, services.schedule, settings);
    scanner.set_cycle_callback([&](const ScanCycleResult& result) {
        if (result.failed) return;
        auto summary = services.ledger->get_stats();
        spdlog::info("Bankroll {:.2f} (available {:.2f}, in play {:.2f}), {} pending",
                     summary.bankroll.total, summary.bankroll.available,
                     summary.bankroll.in_play, summary.pending_bets);
    });

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!scanner.start()) {
        spdlog::error("Auto scanner already running");
        return 1;
    }
    spdlog::info("Auto scanning; press Ctrl+C to stop");

    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutdown signal received");
    scanner.stop();
    std::cout << scanner.status().dump(2) << "\n";
    return 0;
}

int run_place(Services& services, const std::string& path, size_t index,
              std::optional<double> investment) {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open {}", path);
        return 1;
    }

    nlohmann::json j;
    file >> j;

    Opportunity opp;
    if (j.is_array()) {
        if (index >= j.size()) {
            spdlog::error("Index {} out of range ({} opportunities)", index, j.size());
            return 1;
        }
        opp = j.at(index).get<Opportunity>();
    } else {
        opp = j.get<Opportunity>();
    }

    auto result = services.ledger->place_virtual_bet(opp, investment);
    if (!result.success) {
        std::cerr << fmt::format("Not placed: {} ({})\n", result.message,
                                 error_kind_to_string(result.error));
        return 1;
    }

    std::cout << "Placed:\n";
    print_bet(*result.bet);
    return 0;
}

int run_settle(Services& services, int64_t bet_id, const std::string& outcome,
               const std::string& name, std::optional<double> point) {
    SettleResult result;
    if (!name.empty()) {
        result = services.ledger->settle_bet(bet_id, OutcomeId{name, point});
    } else if (!outcome.empty()) {
        result = services.ledger->settle_bet(bet_id, outcome);
    } else {
        std::cerr << "Give a winning outcome label or --name\n";
        return 1;
    }

    if (!result.success) {
        std::cerr << fmt::format("Not settled: {} ({})\n", result.message,
                                 error_kind_to_string(result.error));
        return 1;
    }

    std::cout << fmt::format("Bet #{} settled, profit {:+.2f}\n", result.bet_id, result.profit);
    return 0;
}

int run_analytics(Services& services, bool json) {
    auto analytics = services.ledger->get_analytics();
    if (json) {
        std::cout << nlohmann::json(analytics).dump(2) << "\n";
        return 0;
    }

    std::cout << analytics.total_settled << " settled bets\n";
    print_rollups("By sport:", analytics.by_sport);
    print_rollups("By market:", analytics.by_market);
    std::cout << "By expected ROI:\n";
    for (const auto& [bucket, r] : analytics.by_roi_range) {
        std::cout << fmt::format("  {:<30} bets {:>4}  wins {:>4}  staked {:>9.2f}  profit {:>+9.2f}  ROI {:>6.2f}%\n",
                                 bucket, r.bets, r.wins, r.staked, r.profit, r.roi);
    }
    return 0;
}

int run_keys(Services& services, const std::string& add_key) {
    if (!add_key.empty()) {
        if (services.credentials->add_credential(add_key)) {
            std::cout << "Added " << mask_key(add_key) << "\n";
        } else {
            std::cout << "Key already registered or empty\n";
        }
    }

    for (const auto& c : services.credentials->credentials()) {
        std::cout << fmt::format("  {:<14} remaining {:<8} used {:<8} last used {}\n",
                                 mask_key(c.key),
                                 c.remaining ? std::to_string(*c.remaining) : "unknown",
                                 c.used ? std::to_string(*c.used) : "-",
                                 format_time(c.last_used));
    }
    auto total = services.credentials->total_remaining();
    std::cout << "Total remaining: " << (total ? std::to_string(*total) : "unknown") << "\n";
    return 0;
}

int run_schedule(const Config& config, Services& services, const std::string& sport, bool for_auto) {
    if (for_auto) {
        configure_auto_schedule(*services.schedule, config.auto_scan);
    }

    WallClock now = wall_now();
    nlohmann::json status = services.schedule->status(now);
    if (!sport.empty()) {
        status["sport"] = sport;
        status["sport_category"] = services.schedule->category_for(sport);
        status["sport_is_peak"] = services.schedule->is_optimal_time(now, sport);
    }
    std::cout << status.dump(2) << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"BetArb - Sports betting arbitrage scanner and paper-trading ledger"};
    app.require_subcommand(0, 1);

    std::string config_path = "configs/betarb.json";
    bool show_version = false;
    std::string log_level;

    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_option("--log-level", log_level, "Override log level (debug, info, warn, error)");
    app.add_flag("-v,--version", show_version, "Show version information");

    // scan
    ScanOptions scan_opts;
    auto* scan_cmd = app.add_subcommand("scan", "Scan for arbitrage opportunities");
    scan_cmd->add_option("-s,--sport", scan_opts.sports, "Sport key (repeatable)");
    scan_cmd->add_option("-m,--market", scan_opts.markets, "Market: h2h, spreads, totals (repeatable)");
    scan_cmd->add_option("-b,--bookmaker", scan_opts.bookmakers, "Bookmaker key (repeatable)");
    scan_cmd->add_option("--min-roi", scan_opts.min_roi, "Minimum ROI in percent");
    scan_cmd->add_option("--investment", scan_opts.investment, "Investment per opportunity");
    scan_cmd->add_option("--max-hours", scan_opts.max_hours, "Only games starting within this many hours");
    scan_cmd->add_flag("--live", scan_opts.live_only, "Only games already in progress");
    scan_cmd->add_flag("--json", scan_opts.json, "Print JSON");
    scan_cmd->add_option("--save", scan_opts.save_path, "Write opportunities to a JSON file");

    // auto
    bool auto_no_bet = false;
    auto* auto_cmd = app.add_subcommand("auto", "Run the scheduled background scanner until interrupted");
    auto_cmd->add_flag("--no-bet", auto_no_bet, "Scan only, do not place virtual bets");

    // place
    std::string place_path;
    size_t place_index = 0;
    std::optional<double> place_investment;
    auto* place_cmd = app.add_subcommand("place", "Place a virtual bet from a saved opportunity");
    place_cmd->add_option("file", place_path, "Opportunity JSON (object or array from scan --save)")
        ->required()
        ->check(CLI::ExistingFile);
    place_cmd->add_option("-i,--index", place_index, "Index into an opportunity array");
    place_cmd->add_option("--investment", place_investment, "Rescale stakes to this total");

    // settle
    int64_t settle_id = 0;
    std::string settle_outcome;
    std::string settle_name;
    std::optional<double> settle_point;
    auto* settle_cmd = app.add_subcommand("settle", "Settle a pending virtual bet");
    settle_cmd->add_option("id", settle_id, "Bet id")->required();
    settle_cmd->add_option("outcome", settle_outcome, "Winning outcome label, e.g. \"Over +2.5\"");
    settle_cmd->add_option("--name", settle_name, "Winning outcome name");
    settle_cmd->add_option("--point", settle_point, "Winning outcome point");

    // stats / pending / history / analytics
    bool stats_json = false;
    auto* stats_cmd = app.add_subcommand("stats", "Show bankroll and statistics");
    stats_cmd->add_flag("--json", stats_json, "Print JSON");

    auto* pending_cmd = app.add_subcommand("pending", "List pending virtual bets");

    size_t history_limit = 50;
    auto* history_cmd = app.add_subcommand("history", "List bets, newest first");
    history_cmd->add_option("-n,--limit", history_limit, "Maximum bets to show");

    bool analytics_json = false;
    auto* analytics_cmd = app.add_subcommand("analytics", "Settled results by sport, market and ROI range");
    analytics_cmd->add_flag("--json", analytics_json, "Print JSON");

    // reset / export
    std::optional<double> reset_bankroll;
    auto* reset_cmd = app.add_subcommand("reset", "Discard the simulation and start over");
    reset_cmd->add_option("--bankroll", reset_bankroll, "Starting bankroll");

    std::string export_path = "betarb_bets.csv";
    auto* export_cmd = app.add_subcommand("export", "Export bets to CSV");
    export_cmd->add_option("-o,--output", export_path, "Output file");

    // keys / cache / schedule
    std::string keys_add;
    auto* keys_cmd = app.add_subcommand("keys", "List API keys and their quota");
    keys_cmd->add_option("--add", keys_add, "Register a new key");

    auto* cache_cmd = app.add_subcommand("cache-clear", "Drop every cached upstream response");

    std::string schedule_sport;
    bool schedule_auto = false;
    auto* schedule_cmd = app.add_subcommand("schedule", "Show peak-hour status");
    schedule_cmd->add_option("--sport", schedule_sport, "Check a sport's own peak hours");
    schedule_cmd->add_flag("--auto", schedule_auto, "Use the background scanner's window");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
        std::cout << "BetArb v1.0.0\n";
        std::cout << "Built with C++20\n";
        return 0;
    }

    // Load config
    Config config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = Config::load(config_path);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        std::cerr << "Using default configuration.\n";
    }

    config.apply_env();
    if (!log_level.empty()) config.logging.log_level = log_level;
    if (*scan_cmd) apply_scan_options(config, scan_opts);

    setup_logging(config.logging);

    if (!config.validate()) {
        return 1;
    }

    try {
        Services services = build_services(config);

        if (*scan_cmd) return run_scan(config, services, scan_opts);
        if (*auto_cmd) return run_auto(config, services, auto_no_bet);
        if (*place_cmd) return run_place(services, place_path, place_index, place_investment);
        if (*settle_cmd) return run_settle(services, settle_id, settle_outcome, settle_name, settle_point);

        if (*stats_cmd) {
            auto summary = services.ledger->get_stats();
            if (stats_json) {
                std::cout << nlohmann::json(summary).dump(2) << "\n";
            } else {
                print_summary(summary);
            }
            return 0;
        }

        if (*pending_cmd) {
            auto bets = services.ledger->pending_bets();
            std::cout << bets.size() << " pending\n";
            for (const auto& bet : bets) print_bet(bet);
            return 0;
        }

        if (*history_cmd) {
            for (const auto& bet : services.ledger->bet_history(history_limit)) print_bet(bet);
            return 0;
        }

        if (*analytics_cmd) return run_analytics(services, analytics_json);

        if (*reset_cmd) {
            services.ledger->reset(reset_bankroll.value_or(config.simulation.starting_bankroll));
            print_summary(services.ledger->get_stats());
            return 0;
        }

        if (*export_cmd) {
            if (!services.ledger->export_csv(export_path)) return 1;
            std::cout << "Exported to " << export_path << "\n";
            return 0;
        }

        if (*keys_cmd) return run_keys(services, keys_add);

        if (*cache_cmd) {
            services.cache->clear();
            std::cout << "Cache cleared\n";
            return 0;
        }

        if (*schedule_cmd) return run_schedule(config, services, schedule_sport, schedule_auto);

        std::cout << app.help() << "\n";
        return 0;

    } catch (const ConfigurationError& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 2;
    } catch (const UpstreamError& e) {
        spdlog::error("Upstream error: {}", e.what());
        return 3;
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        return 1;
    }
}
