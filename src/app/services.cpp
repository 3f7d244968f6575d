#include "app/services.hpp"
#include "market_data/odds_api_client.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace betarb {

Services build_services(const Config& config,
                        std::shared_ptr<DocumentStore> store,
                        std::shared_ptr<OddsProvider> provider) {
    Services s;

    s.store = store ? std::move(store)
                    : make_document_store(config.persistence.backend, config.persistence.location);
    spdlog::debug("Persistence: {}", s.store->describe());

    s.credentials = std::make_shared<CredentialStore>(s.store);
    for (const auto& key : config.api_keys) {
        s.credentials->add_credential(key);
    }

    s.cache = std::make_shared<QuoteCache>(s.store,
                                           std::chrono::seconds(config.cache.odds_ttl_seconds),
                                           std::chrono::seconds(config.cache.sports_ttl_seconds));

    s.provider = provider ? std::move(provider)
                          : std::make_shared<OddsApiClient>(config.provider.base_url,
                                                            config.provider.timeout_seconds);

    s.odds = std::make_shared<OddsService>(s.provider, s.credentials, s.cache);
    s.scanner = std::make_shared<ArbScanner>(s.odds);

    s.schedule = std::make_shared<ScanSchedule>();
    configure_schedule(*s.schedule, config);

    s.ledger = std::make_shared<SimulationLedger>(s.store, config.simulation.starting_bankroll);

    return s;
}

ScanRequest scan_request_from(const Config& config) {
    const ScanConfig& scan = config.scan;
    ScanRequest request;
    if (!scan.sports.empty()) {
        request.sports = scan.sports;
    }

    request.markets.clear();
    for (const auto& m : scan.markets) {
        auto type = market_type_from_string(m);
        if (!type) {
            throw std::invalid_argument("Unknown market: " + m);
        }
        request.markets.push_back(*type);
    }

    request.bookmakers = scan.bookmakers;
    request.regions = config.provider.regions;
    request.min_roi = scan.min_roi;
    request.investment = scan.investment;
    if (scan.max_hours > 0) {
        request.max_hours = scan.max_hours;
    }
    request.live_only = scan.live_only;
    return request;
}

AutoScanSettings auto_settings_from(const Config& config) {
    AutoScanSettings settings;
    settings.request = scan_request_from(config);
    settings.min_roi = config.auto_scan.min_roi;
    settings.max_investment = config.auto_scan.max_investment;
    settings.investment_cap = config.auto_scan.investment_cap;
    settings.auto_bet = config.auto_scan.auto_bet;
    return settings;
}

void configure_schedule(ScanSchedule& schedule, const Config& config) {
    for (const auto& [name, windows] : config.schedule.categories) {
        schedule.set_category(name, windows);
    }
    schedule.set_intervals(std::chrono::seconds(config.schedule.peak_interval_seconds),
                           std::chrono::seconds(config.schedule.off_peak_interval_seconds));
}

void configure_auto_schedule(ScanSchedule& schedule, const AutoScanConfig& auto_scan) {
    schedule.set_global_window(auto_scan.peak_start, auto_scan.peak_end);
    schedule.set_intervals(std::chrono::seconds(auto_scan.peak_interval_seconds),
                           std::chrono::seconds(auto_scan.off_peak_interval_seconds));
    schedule.set_skip_off_peak(auto_scan.skip_off_peak);
}

} // namespace betarb
