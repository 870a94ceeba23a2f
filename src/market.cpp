// =============================================================================
// market.cpp - MarketRegistry Per-Asset Ledger
// =============================================================================

#include "lendcore/market.hpp"
#include "lendcore/log.hpp"
#include <mutex>

namespace lendcore {

// =============================================================================
// Constructor
// =============================================================================

MarketRegistry::MarketRegistry(const Authority& authority, const Clock& clock)
    : authority_(authority)
    , clock_(clock) {}

// =============================================================================
// Market Management
// =============================================================================

int32_t MarketRegistry::set_market(const Account& caller, const AssetId& asset,
                                   const MarketParams& params) {
    int32_t auth = authority_.require_owner(caller);
    if (auth != errors::OK) return auth;

    if (!params.valid()) {
        return errors::INVALID_PARAMS;
    }

    std::unique_lock lock(markets_mutex_);

    auto it = markets_.find(asset);
    if (it == markets_.end()) {
        MarketInfo info{};
        info.deposit_rate = params.deposit_rate;
        info.borrow_rate = params.borrow_rate;
        info.ltv = params.ltv;
        info.liquidation_threshold = params.liquidation_threshold;
        info.total_deposits = 0;
        info.total_debt = 0;
        info.last_time_updated = 0;
        touch(info);
        markets_.emplace(asset, info);

        spdlog::info("market {} created: ltv={} lt={} rates={}/{}", asset.to_string(),
                     params.ltv, params.liquidation_threshold,
                     params.deposit_rate, params.borrow_rate);
        return errors::OK;
    }

    // Replace parameters, keep totals
    MarketInfo& info = it->second;
    info.deposit_rate = params.deposit_rate;
    info.borrow_rate = params.borrow_rate;
    info.ltv = params.ltv;
    info.liquidation_threshold = params.liquidation_threshold;
    touch(info);

    spdlog::info("market {} updated: ltv={} lt={} rates={}/{}", asset.to_string(),
                 params.ltv, params.liquidation_threshold,
                 params.deposit_rate, params.borrow_rate);
    return errors::OK;
}

int32_t MarketRegistry::set_market(const Account& caller, const AssetId& asset,
                                   uint64_t deposit_rate, uint64_t borrow_rate,
                                   uint64_t ltv, uint64_t liquidation_threshold) {
    MarketParams params{};
    params.deposit_rate = deposit_rate;
    params.borrow_rate = borrow_rate;
    params.ltv = ltv;
    params.liquidation_threshold = liquidation_threshold;
    return set_market(caller, asset, params);
}

std::optional<MarketInfo> MarketRegistry::get_market(const AssetId& asset) const {
    std::shared_lock lock(markets_mutex_);
    auto it = markets_.find(asset);
    if (it == markets_.end()) return std::nullopt;
    return it->second;
}

bool MarketRegistry::market_exists(const AssetId& asset) const {
    std::shared_lock lock(markets_mutex_);
    return markets_.find(asset) != markets_.end();
}

std::vector<AssetId> MarketRegistry::markets() const {
    std::shared_lock lock(markets_mutex_);
    std::vector<AssetId> assets;
    assets.reserve(markets_.size());
    for (const auto& [asset, info] : markets_) {
        assets.push_back(asset);
    }
    return assets;
}

// =============================================================================
// Totals
// =============================================================================

int32_t MarketRegistry::check_deposit(const AssetId& asset, uint64_t amount) const {
    return check_total(asset, amount, &MarketInfo::total_deposits);
}

int32_t MarketRegistry::check_debt(const AssetId& asset, uint64_t amount) const {
    return check_total(asset, amount, &MarketInfo::total_debt);
}

int32_t MarketRegistry::record_deposit(const AssetId& asset, uint64_t amount) {
    return record_total(asset, amount, &MarketInfo::total_deposits);
}

int32_t MarketRegistry::record_debt(const AssetId& asset, uint64_t amount) {
    return record_total(asset, amount, &MarketInfo::total_debt);
}

// =============================================================================
// Internal Helpers
// =============================================================================

void MarketRegistry::touch(MarketInfo& info) const {
    uint64_t now = clock_.now();
    if (now > info.last_time_updated) {
        info.last_time_updated = now;
    }
}

int32_t MarketRegistry::check_total(const AssetId& asset, uint64_t amount,
                                    uint64_t MarketInfo::*total) const {
    std::shared_lock lock(markets_mutex_);
    auto it = markets_.find(asset);
    if (it == markets_.end()) return errors::MARKET_NOT_FOUND;

    uint64_t sum;
    if (!checked::add(it->second.*total, amount, sum)) return errors::ARITHMETIC_OVERFLOW;
    return errors::OK;
}

int32_t MarketRegistry::record_total(const AssetId& asset, uint64_t amount,
                                     uint64_t MarketInfo::*total) {
    std::unique_lock lock(markets_mutex_);
    auto it = markets_.find(asset);
    if (it == markets_.end()) return errors::MARKET_NOT_FOUND;

    MarketInfo& info = it->second;
    uint64_t sum;
    if (!checked::add(info.*total, amount, sum)) return errors::ARITHMETIC_OVERFLOW;

    info.*total = sum;
    touch(info);
    return errors::OK;
}

} // namespace lendcore
