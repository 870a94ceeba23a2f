#ifndef LENDCORE_HEALTH_HPP
#define LENDCORE_HEALTH_HPP

#include "types.hpp"
#include "oracle.hpp"
#include "market.hpp"
#include "position.hpp"

namespace lendcore {

// =============================================================================
// Position Valuation (undiscounted)
// =============================================================================

struct PositionValues {
    U128 deposit_value;
    U128 debt_value;
};

// =============================================================================
// HealthEngine - multi-asset solvency ratio
//
//   collateral = sum(amount * price * ltv / 1000)   per deposit
//   debt       = sum(amount * price)                per borrow
//   hf         = collateral * 1000 / debt           (debt == 0 -> max)
//
// All arithmetic is 128-bit and checked.
// =============================================================================

class HealthEngine {
public:
    HealthEngine(const PriceOracle& oracle, const MarketRegistry& markets,
                 const PositionStore& positions);

    // Health factor of the account's current state
    Result<U128> calculate_health_factor(const Account& account) const;

    // Health factor over an explicit snapshot
    Result<U128> calculate_health_factor(const UserPosition& position) const;

    // Health factor as it would be after borrowing `extra_borrow` of `asset`
    Result<U128> projected_health_factor(const Account& account, const AssetId& asset,
                                         uint64_t extra_borrow) const;

    Result<PositionValues> position_values(const UserPosition& position) const;

private:
    const PriceOracle& oracle_;
    const MarketRegistry& markets_;
    const PositionStore& positions_;

    // amount * price * ltv / 1000
    int32_t weighted_collateral(const AssetId& asset, uint64_t amount, U128& out) const;

    // amount * price
    int32_t notional(const AssetId& asset, uint64_t amount, U128& out) const;
};

} // namespace lendcore

#endif // LENDCORE_HEALTH_HPP
