// =============================================================================
// oracle.cpp - PriceOracle Source Resolution
// =============================================================================

#include "lendcore/oracle.hpp"
#include "lendcore/log.hpp"
#include <mutex>

namespace lendcore {

// =============================================================================
// StaticPriceProvider
// =============================================================================

int32_t StaticPriceProvider::set_price(const AssetId& asset, uint64_t price) {
    if (price == 0) return errors::INVALID_PRICE;

    std::unique_lock lock(mutex_);
    prices_[asset] = price;
    return errors::OK;
}

void StaticPriceProvider::clear_price(const AssetId& asset) {
    std::unique_lock lock(mutex_);
    prices_.erase(asset);
}

Result<uint64_t> StaticPriceProvider::get_price(const AssetId& asset, uint32_t depth) const {
    (void)depth;  // leaf provider, never delegates
    std::shared_lock lock(mutex_);
    auto it = prices_.find(asset);
    if (it == prices_.end()) return Result<uint64_t>::failure(errors::NOT_FOUND);
    return Result<uint64_t>::success(it->second);
}

// =============================================================================
// Constructor
// =============================================================================

PriceOracle::PriceOracle(const Authority& authority, uint32_t max_resolution_depth)
    : authority_(authority)
    , max_depth_(max_resolution_depth) {}

// =============================================================================
// Configuration
// =============================================================================

int32_t PriceOracle::set_price_source(const Account& caller, const AssetId& asset,
                                      const PriceSource& source) {
    int32_t auth = authority_.require_owner(caller);
    if (auth != errors::OK) return auth;

    if (const auto* fixed = std::get_if<FixedPrice>(&source)) {
        if (fixed->price == 0) return errors::INVALID_PRICE;
    }

    std::unique_lock lock(mutex_);
    sources_[asset] = source;
    return errors::OK;
}

int32_t PriceOracle::remove_price_source(const Account& caller, const AssetId& asset) {
    int32_t auth = authority_.require_owner(caller);
    if (auth != errors::OK) return auth;

    std::unique_lock lock(mutex_);
    if (sources_.erase(asset) == 0) return errors::NOT_FOUND;
    return errors::OK;
}

int32_t PriceOracle::register_provider(const Account& caller, ProviderRef reference,
                                       std::shared_ptr<const PriceProvider> provider) {
    int32_t auth = authority_.require_owner(caller);
    if (auth != errors::OK) return auth;
    if (!provider) return errors::INVALID_PARAMS;

    std::unique_lock lock(mutex_);
    providers_[reference] = std::move(provider);
    spdlog::info("oracle: provider {} registered", reference);
    return errors::OK;
}

std::optional<PriceSource> PriceOracle::get_price_source(const AssetId& asset) const {
    std::shared_lock lock(mutex_);
    auto it = sources_.find(asset);
    if (it == sources_.end()) return std::nullopt;
    return it->second;
}

bool PriceOracle::has_provider(ProviderRef reference) const {
    std::shared_lock lock(mutex_);
    return providers_.find(reference) != providers_.end();
}

// =============================================================================
// Price Queries
// =============================================================================

Result<uint64_t> PriceOracle::get_price(const AssetId& asset) const {
    return get_price(asset, 0);
}

Result<uint64_t> PriceOracle::get_price(const AssetId& asset, uint32_t depth) const {
    total_lookups_.fetch_add(1, std::memory_order_relaxed);

    std::shared_ptr<const PriceProvider> provider;
    ProviderRef reference = 0;
    {
        std::shared_lock lock(mutex_);

        auto it = sources_.find(asset);
        if (it == sources_.end()) {
            failed_lookups_.fetch_add(1, std::memory_order_relaxed);
            return Result<uint64_t>::failure(errors::NOT_FOUND);
        }

        if (const auto* fixed = std::get_if<FixedPrice>(&it->second)) {
            return Result<uint64_t>::success(fixed->price);
        }

        const auto& external = std::get<ExternalModule>(it->second);

        if (depth >= max_depth_) {
            failed_lookups_.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("oracle: resolution of {} exceeded depth {}",
                         asset.to_string(), max_depth_);
            return Result<uint64_t>::failure(errors::RESOLUTION_DEPTH_EXCEEDED);
        }

        auto provider_it = providers_.find(external.reference);
        if (provider_it == providers_.end()) {
            failed_lookups_.fetch_add(1, std::memory_order_relaxed);
            return Result<uint64_t>::failure(errors::NOT_FOUND);
        }
        provider = provider_it->second;
        reference = external.reference;
    }

    // Lock released: the provider may be this oracle again
    auto result = provider->get_price(asset, depth + 1);
    if (!result.ok()) {
        failed_lookups_.fetch_add(1, std::memory_order_relaxed);
        return result;
    }

    // Same rule as FixedPrice, whatever the provider
    if (result.value == 0) {
        failed_lookups_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("oracle: provider {} returned a zero price for {}",
                     reference, asset.to_string());
        return Result<uint64_t>::failure(errors::INVALID_PRICE);
    }

    spdlog::debug("oracle: {} = {} via provider {} at depth {}",
                  asset.to_string(), result.value, reference, depth);
    return result;
}

// =============================================================================
// Statistics
// =============================================================================

PriceOracle::Stats PriceOracle::get_stats() const {
    std::shared_lock lock(mutex_);
    Stats stats{};
    stats.total_sources = sources_.size();
    stats.total_providers = providers_.size();
    stats.total_lookups = total_lookups_.load(std::memory_order_relaxed);
    stats.failed_lookups = failed_lookups_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace lendcore
