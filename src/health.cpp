// =============================================================================
// health.cpp - HealthEngine Solvency Ratio
// =============================================================================

#include "lendcore/health.hpp"

namespace lendcore {

HealthEngine::HealthEngine(const PriceOracle& oracle, const MarketRegistry& markets,
                           const PositionStore& positions)
    : oracle_(oracle)
    , markets_(markets)
    , positions_(positions) {}

// =============================================================================
// Health Factor
// =============================================================================

Result<U128> HealthEngine::calculate_health_factor(const Account& account) const {
    auto position = positions_.get_positions(account);
    if (!position) {
        return Result<U128>::success(HEALTH_FACTOR_MAX);
    }
    return calculate_health_factor(*position);
}

Result<U128> HealthEngine::calculate_health_factor(const UserPosition& position) const {
    // Sums only; visiting order cannot change the result
    U128 collateral = 0;
    for (const auto& [asset, amount] : position.deposits) {
        U128 weighted;
        int32_t status = weighted_collateral(asset, amount, weighted);
        if (status != errors::OK) return Result<U128>::failure(status);
        if (!checked::add(collateral, weighted, collateral)) {
            return Result<U128>::failure(errors::ARITHMETIC_OVERFLOW);
        }
    }

    U128 debt = 0;
    for (const auto& [asset, amount] : position.borrows) {
        U128 value;
        int32_t status = notional(asset, amount, value);
        if (status != errors::OK) return Result<U128>::failure(status);
        if (!checked::add(debt, value, debt)) {
            return Result<U128>::failure(errors::ARITHMETIC_OVERFLOW);
        }
    }

    if (debt == 0) {
        return Result<U128>::success(HEALTH_FACTOR_MAX);
    }

    U128 scaled;
    if (!checked::mul(collateral, PERMILLE, scaled)) {
        return Result<U128>::failure(errors::ARITHMETIC_OVERFLOW);
    }
    return Result<U128>::success(scaled / debt);
}

Result<U128> HealthEngine::projected_health_factor(const Account& account, const AssetId& asset,
                                                   uint64_t extra_borrow) const {
    UserPosition position = positions_.get_positions(account).value_or(UserPosition{});

    uint64_t& owed = position.borrows[asset];
    if (!checked::add(owed, extra_borrow, owed)) {
        return Result<U128>::failure(errors::ARITHMETIC_OVERFLOW);
    }
    return calculate_health_factor(position);
}

// =============================================================================
// Valuation
// =============================================================================

Result<PositionValues> HealthEngine::position_values(const UserPosition& position) const {
    PositionValues values{0, 0};

    for (const auto& [asset, amount] : position.deposits) {
        U128 value;
        int32_t status = notional(asset, amount, value);
        if (status != errors::OK) return Result<PositionValues>::failure(status);
        if (!checked::add(values.deposit_value, value, values.deposit_value)) {
            return Result<PositionValues>::failure(errors::ARITHMETIC_OVERFLOW);
        }
    }

    for (const auto& [asset, amount] : position.borrows) {
        U128 value;
        int32_t status = notional(asset, amount, value);
        if (status != errors::OK) return Result<PositionValues>::failure(status);
        if (!checked::add(values.debt_value, value, values.debt_value)) {
            return Result<PositionValues>::failure(errors::ARITHMETIC_OVERFLOW);
        }
    }

    return Result<PositionValues>::success(values);
}

// =============================================================================
// Internal Helpers
// =============================================================================

int32_t HealthEngine::weighted_collateral(const AssetId& asset, uint64_t amount, U128& out) const {
    auto market = markets_.get_market(asset);
    if (!market) return errors::MARKET_NOT_FOUND;

    U128 value;
    int32_t status = notional(asset, amount, value);
    if (status != errors::OK) return status;

    U128 weighted;
    if (!checked::mul(value, market->ltv, weighted)) return errors::ARITHMETIC_OVERFLOW;
    out = weighted / PERMILLE;
    return errors::OK;
}

int32_t HealthEngine::notional(const AssetId& asset, uint64_t amount, U128& out) const {
    auto price = oracle_.get_price(asset);
    if (!price.ok()) return price.status;

    // 64 x 64 bits always fits in 128, checked for uniformity
    if (!checked::mul(static_cast<U128>(amount), static_cast<U128>(price.value), out)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    return errors::OK;
}

} // namespace lendcore
