// =============================================================================
// ledger.cpp - Deposit / Borrow Under the Solvency Invariant
// =============================================================================

#include "lendcore/ledger.hpp"
#include "lendcore/log.hpp"

namespace lendcore {

// =============================================================================
// Constructor
// =============================================================================

Ledger::Ledger(MarketRegistry& markets, PositionStore& positions, const HealthEngine& health)
    : markets_(markets)
    , positions_(positions)
    , health_(health) {}

// =============================================================================
// Deposit
// =============================================================================

int32_t Ledger::deposit(const Account& account, const AssetId& asset, uint64_t amount) {
    if (amount == 0) {
        return fail(errors::INVALID_AMOUNT);
    }

    std::lock_guard<std::mutex> account_lock(account_mutex(account));
    std::lock_guard<std::mutex> commit_lock(commit_mutex_);

    // Validate both stores before touching either
    int32_t status = markets_.check_deposit(asset, amount);
    if (status != errors::OK) return fail(status);

    status = positions_.check_user_deposit(account, asset, amount);
    if (status != errors::OK) return fail(status);

    // Infallible after the checks above: every writer holds commit_mutex_
    status = markets_.record_deposit(asset, amount);
    if (status != errors::OK) return fail(status);

    status = positions_.record_user_deposit(account, asset, amount);
    if (status != errors::OK) {
        spdlog::critical("ledger: deposit half-applied for {} in {}: {}",
                         account.to_string(), asset.to_string(), log::code(status));
        return fail(status);
    }

    total_deposits_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("ledger: {} deposited {} of {}", account.to_string(), amount, asset.to_string());
    return errors::OK;
}

// =============================================================================
// Borrow
// =============================================================================

int32_t Ledger::borrow(const Account& account, const AssetId& asset, uint64_t amount) {
    if (amount == 0) {
        return fail(errors::INVALID_AMOUNT);
    }

    // Held across the check and the commit
    std::lock_guard<std::mutex> account_lock(account_mutex(account));

    if (!markets_.market_exists(asset)) {
        return fail(errors::MARKET_NOT_FOUND);
    }

    auto hf = health_.projected_health_factor(account, asset, amount);
    if (!hf.ok()) {
        spdlog::warn("ledger: borrow of {} {} by {} failed: {}", amount, asset.to_string(),
                     account.to_string(), log::code(hf.status));
        return fail(hf.status);
    }

    if (hf.value < HEALTH_FACTOR_MIN) {
        rejected_borrows_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("ledger: borrow of {} {} by {} rejected, health factor {}", amount,
                     asset.to_string(), account.to_string(), to_string(hf.value));
        return fail(errors::INSUFFICIENT_COLLATERAL);
    }

    std::lock_guard<std::mutex> commit_lock(commit_mutex_);

    int32_t status = markets_.check_debt(asset, amount);
    if (status != errors::OK) return fail(status);

    status = positions_.check_user_borrow(account, asset, amount);
    if (status != errors::OK) return fail(status);

    status = markets_.record_debt(asset, amount);
    if (status != errors::OK) return fail(status);

    status = positions_.record_user_borrow(account, asset, amount);
    if (status != errors::OK) {
        spdlog::critical("ledger: borrow half-applied for {} in {}: {}",
                         account.to_string(), asset.to_string(), log::code(status));
        return fail(status);
    }

    total_borrows_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("ledger: {} borrowed {} of {}, health factor {}", account.to_string(),
                  amount, asset.to_string(), to_string(hf.value));
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

Result<PositionSummary> Ledger::get_user_position(const Account& account) const {
    std::optional<UserPosition> position;
    {
        std::lock_guard<std::mutex> commit_lock(commit_mutex_);
        position = positions_.get_positions(account);
    }

    if (!position) {
        return Result<PositionSummary>::success(PositionSummary{0, 0, HEALTH_FACTOR_MAX});
    }

    auto values = health_.position_values(*position);
    if (!values.ok()) return Result<PositionSummary>::failure(values.status);

    auto hf = health_.calculate_health_factor(*position);
    if (!hf.ok()) return Result<PositionSummary>::failure(hf.status);

    PositionSummary summary{};
    summary.total_deposit_value = values.value.deposit_value;
    summary.total_debt_value = values.value.debt_value;
    summary.health_factor = hf.value;
    return Result<PositionSummary>::success(summary);
}

Result<U128> Ledger::health_factor(const Account& account) const {
    return health_.calculate_health_factor(account);
}

Ledger::Stats Ledger::get_stats() const {
    Stats stats{};
    stats.total_deposits = total_deposits_.load(std::memory_order_relaxed);
    stats.total_borrows = total_borrows_.load(std::memory_order_relaxed);
    stats.rejected_borrows = rejected_borrows_.load(std::memory_order_relaxed);
    stats.failed_operations = failed_operations_.load(std::memory_order_relaxed);
    return stats;
}

// =============================================================================
// Internal Helpers
// =============================================================================

std::mutex& Ledger::account_mutex(const Account& account) {
    return account_locks_[std::hash<Account>{}(account) % ACCOUNT_LOCK_SLOTS];
}

int32_t Ledger::fail(int32_t code) {
    failed_operations_.fetch_add(1, std::memory_order_relaxed);
    if (code == errors::ARITHMETIC_OVERFLOW) {
        spdlog::warn("ledger: operation rejected, a balance would wrap");
    }
    return code;
}

} // namespace lendcore
