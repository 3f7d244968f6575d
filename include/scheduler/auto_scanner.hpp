#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "arbitrage/arb_scanner.hpp"
#include "scheduler/scan_schedule.hpp"
#include "simulation/simulation_ledger.hpp"

namespace betarb {

enum class ScannerState {
    STOPPED,
    SCANNING,              // Running; scanning or waiting for the next interval
    SLEEPING_UNTIL_PEAK
};

inline std::string scanner_state_to_string(ScannerState s) {
    switch (s) {
        case ScannerState::STOPPED: return "stopped";
        case ScannerState::SCANNING: return "scanning";
        case ScannerState::SLEEPING_UNTIL_PEAK: return "sleeping_until_peak";
    }
    return "unknown";
}

struct AutoScanSettings {
    ScanRequest request;
    double min_roi{0.5};                 // Auto-bet threshold
    double max_investment{100.0};
    double investment_cap{100.0};        // Hard ceiling per auto-placed bet
    bool auto_bet{true};
};

struct ScanCycleResult {
    WallClock started_at;
    size_t opportunities{0};
    size_t bets_placed{0};
    double invested{0.0};
    bool failed{false};
    std::string error;
};

/**
 * Background scan loop driven by ScanSchedule.
 *
 * Each tick asks the schedule for a decision, optionally scans (placing
 * virtual bets for qualifying opportunities), then waits on a condition
 * variable so stop() returns promptly.
 */
class AutoScanner {
public:
    using Clock = std::function<WallClock()>;
    using CycleCallback = std::function<void(const ScanCycleResult&)>;

    struct Stats {
        uint64_t scans{0};
        uint64_t opportunities_found{0};
        uint64_t bets_placed{0};
        double total_invested{0.0};
        uint64_t failed_cycles{0};
        std::optional<WallClock> last_scan;
        std::optional<WallClock> next_scan;
    };

    AutoScanner(std::shared_ptr<ArbScanner> scanner,
                std::shared_ptr<SimulationLedger> ledger,
                std::shared_ptr<ScanSchedule> schedule,
                AutoScanSettings settings,
                Clock clock = wall_now);
    ~AutoScanner();

    AutoScanner(const AutoScanner&) = delete;
    AutoScanner& operator=(const AutoScanner&) = delete;

    // Returns false if already running
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

    ScannerState state() const { return state_.load(); }

    void configure(const AutoScanSettings& settings);
    AutoScanSettings settings() const;

    // One scan (and auto-bet pass) on the calling thread
    ScanCycleResult scan_once();

    void set_cycle_callback(CycleCallback cb);

    Stats get_stats() const;
    nlohmann::json status() const;

private:
    std::shared_ptr<ArbScanner> scanner_;
    std::shared_ptr<SimulationLedger> ledger_;
    std::shared_ptr<ScanSchedule> schedule_;
    AutoScanSettings settings_;
    Clock clock_;

    std::atomic<bool> running_{false};
    std::atomic<ScannerState> state_{ScannerState::STOPPED};
    std::thread thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;

    Stats stats_;
    CycleCallback on_cycle_;
    mutable std::mutex mutex_;

    void run_loop();
};

} // namespace betarb
