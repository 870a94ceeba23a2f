// =============================================================================
// lendcore.cpp - MoneyMarket Wiring and Bootstrap
// =============================================================================

#include "lendcore/lendcore.hpp"
#include "lendcore/log.hpp"
#include <unordered_map>

namespace lendcore {

// =============================================================================
// Constructors
// =============================================================================

MoneyMarket::MoneyMarket(uint32_t max_resolution_depth)
    : owned_clock_(std::make_unique<SystemClock>())
    , clock_(*owned_clock_)
    , authority_(std::make_unique<Authority>())
    , oracle_(std::make_unique<PriceOracle>(*authority_, max_resolution_depth))
    , markets_(std::make_unique<MarketRegistry>(*authority_, clock_))
    , positions_(std::make_unique<PositionStore>())
    , health_(std::make_unique<HealthEngine>(*oracle_, *markets_, *positions_))
    , ledger_(std::make_unique<Ledger>(*markets_, *positions_, *health_)) {}

MoneyMarket::MoneyMarket(const Clock& clock, uint32_t max_resolution_depth)
    : owned_clock_(nullptr)
    , clock_(clock)
    , authority_(std::make_unique<Authority>())
    , oracle_(std::make_unique<PriceOracle>(*authority_, max_resolution_depth))
    , markets_(std::make_unique<MarketRegistry>(*authority_, clock_))
    , positions_(std::make_unique<PositionStore>())
    , health_(std::make_unique<HealthEngine>(*oracle_, *markets_, *positions_))
    , ledger_(std::make_unique<Ledger>(*markets_, *positions_, *health_)) {}

// =============================================================================
// Initialization
// =============================================================================

int32_t MoneyMarket::initialize(const Account& owner) {
    int32_t status = authority_->initialize(owner);
    if (status == errors::OK) {
        spdlog::info("lendcore {} initialized, owner {}", version(), owner.to_string());
    }
    return status;
}

void MoneyMarket::initialize(const Config& config) {
    if (!log::set_level(config.log_level)) {
        throw ConfigError("unknown log_level: " + config.log_level);
    }

    int32_t status = initialize(config.owner);
    if (status != errors::OK) {
        throw ConfigError(std::string("initialize failed: ") + errors::to_string(status));
    }

    const Account& owner = config.owner;

    for (const auto& market : config.markets) {
        status = markets_->set_market(owner, market.asset, market.params);
        if (status != errors::OK) {
            throw ConfigError("market " + market.asset.to_string() + " rejected: " +
                              errors::to_string(status));
        }
    }

    for (const auto& entry : config.providers) {
        auto provider = std::make_shared<StaticPriceProvider>();
        for (const auto& [asset, price] : entry.prices) {
            status = provider->set_price(asset, price);
            if (status != errors::OK) {
                throw ConfigError("provider " + std::to_string(entry.reference) + " price for " +
                                  asset.to_string() + " rejected: " + errors::to_string(status));
            }
        }
        status = oracle_->register_provider(owner, entry.reference, provider);
        if (status != errors::OK) {
            throw ConfigError("provider " + std::to_string(entry.reference) + " rejected: " +
                              errors::to_string(status));
        }
    }

    for (const auto& entry : config.price_sources) {
        status = oracle_->set_price_source(owner, entry.asset, entry.source);
        if (status != errors::OK) {
            throw ConfigError("price source for " + entry.asset.to_string() + " rejected: " +
                              errors::to_string(status));
        }
    }

    spdlog::info("lendcore configured: {} markets, {} providers, {} price sources",
                 config.markets.size(), config.providers.size(), config.price_sources.size());
}

std::unique_ptr<MoneyMarket> MoneyMarket::from_config(const Config& config) {
    auto mm = std::make_unique<MoneyMarket>(config.max_resolution_depth);
    mm->initialize(config);
    return mm;
}

std::unique_ptr<MoneyMarket> MoneyMarket::from_config(const Config& config, const Clock& clock) {
    auto mm = std::make_unique<MoneyMarket>(clock, config.max_resolution_depth);
    mm->initialize(config);
    return mm;
}

// =============================================================================
// Invariants
// =============================================================================

int32_t MoneyMarket::check_invariants() const {
    std::unordered_map<AssetId, U128> deposit_sums;
    std::unordered_map<AssetId, U128> debt_sums;

    for (const auto& account : positions_->accounts()) {
        auto position = positions_->get_positions(account);
        if (!position) continue;
        for (const auto& [asset, amount] : position->deposits) deposit_sums[asset] += amount;
        for (const auto& [asset, amount] : position->borrows) debt_sums[asset] += amount;
    }

    int32_t result = errors::OK;
    for (const auto& asset : markets_->markets()) {
        auto info = markets_->get_market(asset);
        if (!info) continue;

        U128 deposits = deposit_sums[asset];
        U128 debt = debt_sums[asset];
        if (deposits != info->total_deposits || debt != info->total_debt) {
            spdlog::error("invariant: market {} totals {}/{} but positions sum to {}/{}",
                          asset.to_string(), info->total_deposits, info->total_debt,
                          to_string(deposits), to_string(debt));
            result = errors::INVARIANT_VIOLATION;
        }
    }
    return result;
}

// =============================================================================
// Statistics
// =============================================================================

MoneyMarket::GlobalStats MoneyMarket::get_stats() const {
    GlobalStats stats{};
    stats.total_markets = markets_->markets().size();
    stats.total_accounts = positions_->size();
    stats.oracle_stats = oracle_->get_stats();
    stats.ledger_stats = ledger_->get_stats();
    return stats;
}

} // namespace lendcore
