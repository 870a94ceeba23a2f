#ifndef LENDCORE_POSITION_HPP
#define LENDCORE_POSITION_HPP

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace lendcore {

// =============================================================================
// User Position (one per account)
// =============================================================================

struct UserPosition {
    std::unordered_map<AssetId, uint64_t> deposits;  // asset -> amount
    std::unordered_map<AssetId, uint64_t> borrows;   // asset -> amount

    bool empty() const { return deposits.empty() && borrows.empty(); }
};

// =============================================================================
// PositionStore - per-account deposit and borrow balances
// =============================================================================

class PositionStore {
public:
    PositionStore() = default;
    ~PositionStore() = default;

    // Non-copyable
    PositionStore(const PositionStore&) = delete;
    PositionStore& operator=(const PositionStore&) = delete;

    // Validation only (ARITHMETIC_OVERFLOW or OK)
    int32_t check_user_deposit(const Account& account, const AssetId& asset, uint64_t amount) const;
    int32_t check_user_borrow(const Account& account, const AssetId& asset, uint64_t amount) const;

    // Increment, creating the position and entry if absent
    int32_t record_user_deposit(const Account& account, const AssetId& asset, uint64_t amount);
    int32_t record_user_borrow(const Account& account, const AssetId& asset, uint64_t amount);

    // Snapshot of both maps
    std::optional<UserPosition> get_positions(const Account& account) const;

    uint64_t balance_of(const Account& account, const AssetId& asset) const;
    uint64_t debt_of(const Account& account, const AssetId& asset) const;

    std::vector<Account> accounts() const;
    size_t size() const;

private:
    std::unordered_map<Account, UserPosition> positions_;
    mutable std::shared_mutex positions_mutex_;

    using Side = std::unordered_map<AssetId, uint64_t> UserPosition::*;

    int32_t check(const Account& account, const AssetId& asset, uint64_t amount, Side side) const;
    int32_t record(const Account& account, const AssetId& asset, uint64_t amount, Side side);
    uint64_t amount_of(const Account& account, const AssetId& asset, Side side) const;
};

} // namespace lendcore

#endif // LENDCORE_POSITION_HPP
