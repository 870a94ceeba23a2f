// =============================================================================
// position.cpp - PositionStore Per-Account Balances
// =============================================================================

#include "lendcore/position.hpp"
#include <mutex>

namespace lendcore {

int32_t PositionStore::check_user_deposit(const Account& account, const AssetId& asset,
                                          uint64_t amount) const {
    return check(account, asset, amount, &UserPosition::deposits);
}

int32_t PositionStore::check_user_borrow(const Account& account, const AssetId& asset,
                                         uint64_t amount) const {
    return check(account, asset, amount, &UserPosition::borrows);
}

int32_t PositionStore::record_user_deposit(const Account& account, const AssetId& asset,
                                           uint64_t amount) {
    return record(account, asset, amount, &UserPosition::deposits);
}

int32_t PositionStore::record_user_borrow(const Account& account, const AssetId& asset,
                                          uint64_t amount) {
    return record(account, asset, amount, &UserPosition::borrows);
}

std::optional<UserPosition> PositionStore::get_positions(const Account& account) const {
    std::shared_lock lock(positions_mutex_);
    auto it = positions_.find(account);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

uint64_t PositionStore::balance_of(const Account& account, const AssetId& asset) const {
    return amount_of(account, asset, &UserPosition::deposits);
}

uint64_t PositionStore::debt_of(const Account& account, const AssetId& asset) const {
    return amount_of(account, asset, &UserPosition::borrows);
}

std::vector<Account> PositionStore::accounts() const {
    std::shared_lock lock(positions_mutex_);
    std::vector<Account> result;
    result.reserve(positions_.size());
    for (const auto& [account, position] : positions_) {
        result.push_back(account);
    }
    return result;
}

size_t PositionStore::size() const {
    std::shared_lock lock(positions_mutex_);
    return positions_.size();
}

// =============================================================================
// Internal Helpers
// =============================================================================

int32_t PositionStore::check(const Account& account, const AssetId& asset, uint64_t amount,
                             Side side) const {
    std::shared_lock lock(positions_mutex_);
    auto it = positions_.find(account);
    if (it == positions_.end()) return errors::OK;

    const auto& balances = it->second.*side;
    auto entry = balances.find(asset);
    if (entry == balances.end()) return errors::OK;

    uint64_t sum;
    if (!checked::add(entry->second, amount, sum)) return errors::ARITHMETIC_OVERFLOW;
    return errors::OK;
}

int32_t PositionStore::record(const Account& account, const AssetId& asset, uint64_t amount,
                              Side side) {
    std::unique_lock lock(positions_mutex_);

    auto it = positions_.find(account);
    if (it != positions_.end()) {
        auto& balances = it->second.*side;
        auto entry = balances.find(asset);
        if (entry != balances.end()) {
            uint64_t sum;
            if (!checked::add(entry->second, amount, sum)) return errors::ARITHMETIC_OVERFLOW;
            entry->second = sum;
            return errors::OK;
        }
        balances.emplace(asset, amount);
        return errors::OK;
    }

    UserPosition position;
    (position.*side).emplace(asset, amount);
    positions_.emplace(account, std::move(position));
    return errors::OK;
}

uint64_t PositionStore::amount_of(const Account& account, const AssetId& asset,
                                  Side side) const {
    std::shared_lock lock(positions_mutex_);
    auto it = positions_.find(account);
    if (it == positions_.end()) return 0;

    const auto& balances = it->second.*side;
    auto entry = balances.find(asset);
    return (entry != balances.end()) ? entry->second : 0;
}

} // namespace lendcore
