#ifndef LENDCORE_MARKET_HPP
#define LENDCORE_MARKET_HPP

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "auth.hpp"
#include "clock.hpp"

namespace lendcore {

// =============================================================================
// Market Parameters
// =============================================================================

struct MarketParams {
    uint64_t deposit_rate;
    uint64_t borrow_rate;
    uint64_t ltv;                    // permille
    uint64_t liquidation_threshold;  // permille

    // 0 <= ltv <= liquidation_threshold <= 1000
    bool valid() const {
        return ltv <= liquidation_threshold && liquidation_threshold <= PERMILLE;
    }
};

// =============================================================================
// Market State (one per asset)
// =============================================================================

struct MarketInfo {
    uint64_t deposit_rate;
    uint64_t borrow_rate;
    uint64_t ltv;
    uint64_t liquidation_threshold;
    uint64_t total_deposits;
    uint64_t total_debt;
    uint64_t last_time_updated;
};

// =============================================================================
// MarketRegistry - per-asset aggregate ledger
// =============================================================================

class MarketRegistry {
public:
    MarketRegistry(const Authority& authority, const Clock& clock);
    ~MarketRegistry() = default;

    // Non-copyable
    MarketRegistry(const MarketRegistry&) = delete;
    MarketRegistry& operator=(const MarketRegistry&) = delete;

    // =========================================================================
    // Market Management (owner only)
    // =========================================================================

    // Create or replace. Replacing keeps the running totals.
    int32_t set_market(const Account& caller, const AssetId& asset,
                       const MarketParams& params);

    int32_t set_market(const Account& caller, const AssetId& asset,
                       uint64_t deposit_rate, uint64_t borrow_rate,
                       uint64_t ltv, uint64_t liquidation_threshold);

    std::optional<MarketInfo> get_market(const AssetId& asset) const;
    bool market_exists(const AssetId& asset) const;
    std::vector<AssetId> markets() const;

    // =========================================================================
    // Totals (driven by the Ledger inside its commit scope)
    // =========================================================================

    int32_t check_deposit(const AssetId& asset, uint64_t amount) const;
    int32_t check_debt(const AssetId& asset, uint64_t amount) const;

    int32_t record_deposit(const AssetId& asset, uint64_t amount);
    int32_t record_debt(const AssetId& asset, uint64_t amount);

private:
    const Authority& authority_;
    const Clock& clock_;

    std::unordered_map<AssetId, MarketInfo> markets_;
    mutable std::shared_mutex markets_mutex_;

    // Never moves last_time_updated backwards
    void touch(MarketInfo& info) const;

    int32_t check_total(const AssetId& asset, uint64_t amount,
                        uint64_t MarketInfo::*total) const;
    int32_t record_total(const AssetId& asset, uint64_t amount,
                         uint64_t MarketInfo::*total);
};

} // namespace lendcore

#endif // LENDCORE_MARKET_HPP
