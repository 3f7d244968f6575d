#include "scheduler/auto_scanner.hpp"
#include "common/errors.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace betarb {

AutoScanner::AutoScanner(std::shared_ptr<ArbScanner> scanner,
                         std::shared_ptr<SimulationLedger> ledger,
                         std::shared_ptr<ScanSchedule> schedule,
                         AutoScanSettings settings,
                         Clock clock)
    : scanner_(std::move(scanner))
    , ledger_(std::move(ledger))
    , schedule_(std::move(schedule))
    , settings_(std::move(settings))
    , clock_(std::move(clock))
{
}

AutoScanner::~AutoScanner() {
    stop();
}

bool AutoScanner::start() {
    if (running_.exchange(true)) {
        return false;
    }

    if (thread_.joinable()) {
        thread_.join();
    }

    state_ = ScannerState::SCANNING;
    thread_ = std::thread(&AutoScanner::run_loop, this);
    spdlog::info("Auto scanner started");
    return true;
}

void AutoScanner::stop() {
    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        running_ = false;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
        spdlog::info("Auto scanner stopped");
    }
    state_ = ScannerState::STOPPED;
}

void AutoScanner::configure(const AutoScanSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
}

AutoScanSettings AutoScanner::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

void AutoScanner::set_cycle_callback(CycleCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_cycle_ = std::move(cb);
}

ScanCycleResult AutoScanner::scan_once() {
    AutoScanSettings settings = this->settings();

    ScanCycleResult result;
    result.started_at = clock_();

    try {
        auto opportunities = scanner_->scan_for_arbitrage(settings.request);
        result.opportunities = opportunities.size();

        if (settings.auto_bet && ledger_) {
            double investment = std::min(settings.max_investment, settings.investment_cap);

            for (const auto& opp : opportunities) {
                if (opp.roi < settings.min_roi) continue;

                auto placed = ledger_->place_virtual_bet(opp, investment);
                if (!placed.success) {
                    spdlog::warn("Auto-bet skipped for {}: {} ({})", opp.teams(),
                                 placed.message, error_kind_to_string(placed.error));
                    continue;
                }
                result.bets_placed++;
                result.invested += placed.bet->total_stake;
            }
        }
    } catch (const ConfigurationError& e) {
        result.failed = true;
        result.error = e.what();
        spdlog::error("Scan skipped, no usable credential: {}", e.what());
    } catch (const std::exception& e) {
        result.failed = true;
        result.error = e.what();
        spdlog::error("Scan failed: {}", e.what());
    }

    CycleCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.scans++;
        stats_.opportunities_found += result.opportunities;
        stats_.bets_placed += result.bets_placed;
        stats_.total_invested = round2(stats_.total_invested + result.invested);
        if (result.failed) stats_.failed_cycles++;
        stats_.last_scan = result.started_at;
        callback = on_cycle_;
    }

    spdlog::info("Scan cycle: {} opportunities, {} bets placed ({:.2f} invested)",
                 result.opportunities, result.bets_placed, result.invested);

    if (callback) {
        callback(result);
    }
    return result;
}

void AutoScanner::run_loop() {
    while (running_.load()) {
        WallClock now = clock_();
        ScheduleDecision decision = schedule_->decide(now);

        if (decision.action == ScheduleDecision::Action::SCAN) {
            state_ = ScannerState::SCANNING;
            scan_once();
        } else {
            state_ = ScannerState::SLEEPING_UNTIL_PEAK;
            spdlog::info("Off-peak, sleeping {} until next peak",
                         time_utils::format_duration_seconds(decision.wait.count()));
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.next_scan = clock_() + decision.wait;
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, decision.wait, [this] { return !running_.load(); });
    }
    state_ = ScannerState::STOPPED;
}

AutoScanner::Stats AutoScanner::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

nlohmann::json AutoScanner::status() const {
    Stats stats = get_stats();
    AutoScanSettings settings = this->settings();
    WallClock now = clock_();

    return nlohmann::json{
        {"running", is_running()},
        {"state", scanner_state_to_string(state())},
        {"schedule", schedule_->status(now)},
        {"min_roi", settings.min_roi},
        {"max_investment", settings.max_investment},
        {"auto_bet", settings.auto_bet},
        {"last_scan", stats.last_scan ? nlohmann::json(time_utils::to_iso8601(*stats.last_scan)) : nlohmann::json(nullptr)},
        {"next_scan", stats.next_scan ? nlohmann::json(time_utils::to_iso8601(*stats.next_scan)) : nlohmann::json(nullptr)},
        {"stats", {
            {"scans", stats.scans},
            {"opportunities_found", stats.opportunities_found},
            {"bets_placed", stats.bets_placed},
            {"total_invested", stats.total_invested},
            {"failed_cycles", stats.failed_cycles}
        }}
    };
}

} // namespace betarb
