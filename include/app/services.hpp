#pragma once

#include <memory>
#include "config/config.hpp"
#include "persistence/document_store.hpp"
#include "quotes/credential_store.hpp"
#include "quotes/quote_cache.hpp"
#include "market_data/odds_provider.hpp"
#include "market_data/odds_service.hpp"
#include "arbitrage/arb_scanner.hpp"
#include "scheduler/scan_schedule.hpp"
#include "scheduler/auto_scanner.hpp"
#include "simulation/simulation_ledger.hpp"

namespace betarb {

// Everything a front end needs, wired from one Config
struct Services {
    std::shared_ptr<DocumentStore> store;
    std::shared_ptr<CredentialStore> credentials;
    std::shared_ptr<QuoteCache> cache;
    std::shared_ptr<OddsProvider> provider;
    std::shared_ptr<OddsService> odds;
    std::shared_ptr<ArbScanner> scanner;
    std::shared_ptr<ScanSchedule> schedule;
    std::shared_ptr<SimulationLedger> ledger;
};

/**
 * Build the service graph. Config keys are registered with the credential
 * store. Pass a store/provider to override the configured ones (tests).
 */
Services build_services(const Config& config,
                        std::shared_ptr<DocumentStore> store = nullptr,
                        std::shared_ptr<OddsProvider> provider = nullptr);

// Throws std::invalid_argument on an unknown market name
ScanRequest scan_request_from(const Config& config);

AutoScanSettings auto_settings_from(const Config& config);

// Category overrides and recommended intervals
void configure_schedule(ScanSchedule& schedule, const Config& config);

// Background loop: one global peak window, its intervals and off-peak skipping
void configure_auto_schedule(ScanSchedule& schedule, const AutoScanConfig& auto_scan);

} // namespace betarb
