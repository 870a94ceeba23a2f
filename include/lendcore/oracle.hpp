#ifndef LENDCORE_ORACLE_HPP
#define LENDCORE_ORACLE_HPP

#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <variant>
#include <vector>
#include <atomic>

#include "types.hpp"
#include "auth.hpp"

namespace lendcore {

// =============================================================================
// Price Sources (closed set, one per asset)
// =============================================================================

// Static price set by configuration
struct FixedPrice {
    uint64_t price;
};

// Delegates to the provider registered under `reference`
struct ExternalModule {
    ProviderRef reference;
};

using PriceSource = std::variant<FixedPrice, ExternalModule>;

// Default bound on ExternalModule hops. Cycles always hit it.
constexpr uint32_t DEFAULT_MAX_RESOLUTION_DEPTH = 8;

// =============================================================================
// Price Provider Interface
// =============================================================================

class PriceProvider {
public:
    virtual ~PriceProvider() = default;

    // `depth` is the number of ExternalModule hops taken to reach this call.
    // Implementations that delegate further must pass it on incremented.
    // A zero price is treated by the oracle as INVALID_PRICE.
    //
    // Called from Ledger::borrow while the borrowing account's lock is held.
    // Implementations may read ledger state but must not call deposit or
    // borrow, which would wait on that lock.
    virtual Result<uint64_t> get_price(const AssetId& asset, uint32_t depth) const = 0;
};

// In-memory price table, the simplest external feed
class StaticPriceProvider : public PriceProvider {
public:
    StaticPriceProvider() = default;

    // INVALID_PRICE for zero
    int32_t set_price(const AssetId& asset, uint64_t price);
    void clear_price(const AssetId& asset);

    Result<uint64_t> get_price(const AssetId& asset, uint32_t depth) const override;

private:
    std::unordered_map<AssetId, uint64_t> prices_;
    mutable std::shared_mutex mutex_;
};

// =============================================================================
// PriceOracle - asset -> price via pluggable sources
// =============================================================================

class PriceOracle : public PriceProvider {
public:
    explicit PriceOracle(const Authority& authority,
                         uint32_t max_resolution_depth = DEFAULT_MAX_RESOLUTION_DEPTH);
    ~PriceOracle() override = default;

    // Non-copyable
    PriceOracle(const PriceOracle&) = delete;
    PriceOracle& operator=(const PriceOracle&) = delete;

    // =========================================================================
    // Configuration (owner only)
    // =========================================================================

    // Register or overwrite the source for an asset
    int32_t set_price_source(const Account& caller, const AssetId& asset,
                             const PriceSource& source);

    int32_t remove_price_source(const Account& caller, const AssetId& asset);

    // Register or replace the provider behind an ExternalModule handle.
    // Oracles registered as each other's providers own each other: replace
    // one registration before dropping them or neither is freed.
    int32_t register_provider(const Account& caller, ProviderRef reference,
                              std::shared_ptr<const PriceProvider> provider);

    std::optional<PriceSource> get_price_source(const AssetId& asset) const;
    bool has_provider(ProviderRef reference) const;

    uint32_t max_resolution_depth() const { return max_depth_; }

    // =========================================================================
    // Price Queries
    // =========================================================================

    // NOT_FOUND, RESOLUTION_DEPTH_EXCEEDED or the price
    Result<uint64_t> get_price(const AssetId& asset) const;

    Result<uint64_t> get_price(const AssetId& asset, uint32_t depth) const override;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_sources;
        uint64_t total_providers;
        uint64_t total_lookups;
        uint64_t failed_lookups;
    };
    Stats get_stats() const;

private:
    const Authority& authority_;
    const uint32_t max_depth_;

    std::unordered_map<AssetId, PriceSource> sources_;
    std::unordered_map<ProviderRef, std::shared_ptr<const PriceProvider>> providers_;
    mutable std::shared_mutex mutex_;

    mutable std::atomic<uint64_t> total_lookups_{0};
    mutable std::atomic<uint64_t> failed_lookups_{0};
};

} // namespace lendcore

#endif // LENDCORE_ORACLE_HPP
