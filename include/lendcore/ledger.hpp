#ifndef LENDCORE_LEDGER_HPP
#define LENDCORE_LEDGER_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <mutex>

#include "types.hpp"
#include "market.hpp"
#include "position.hpp"
#include "health.hpp"

namespace lendcore {

// =============================================================================
// Aggregate view of one account
// =============================================================================

struct PositionSummary {
    U128 total_deposit_value;  // undiscounted
    U128 total_debt_value;
    U128 health_factor;        // ltv-weighted, permille
};

// =============================================================================
// Ledger - deposit and borrow under the solvency invariant
//
// Each operation runs under the account's exclusive lock, so the borrow
// check-then-commit cannot interleave with another operation on the same
// account. Locks come from a fixed table indexed by account hash; accounts
// sharing a slot are serialized with each other. Registry and position updates of one operation are committed
// together under commit_mutex_.
// =============================================================================

class Ledger {
public:
    static constexpr size_t ACCOUNT_LOCK_SLOTS = 64;

    Ledger(MarketRegistry& markets, PositionStore& positions, const HealthEngine& health);
    ~Ledger() = default;

    // Non-copyable
    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    int32_t deposit(const Account& account, const AssetId& asset, uint64_t amount);

    // Rejects with INSUFFICIENT_COLLATERAL when the post-borrow health
    // factor would fall below 1000. Rejection leaves all state untouched.
    int32_t borrow(const Account& account, const AssetId& asset, uint64_t amount);

    Result<PositionSummary> get_user_position(const Account& account) const;

    Result<U128> health_factor(const Account& account) const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_deposits;
        uint64_t total_borrows;
        uint64_t rejected_borrows;
        uint64_t failed_operations;
    };
    Stats get_stats() const;

private:
    MarketRegistry& markets_;
    PositionStore& positions_;
    const HealthEngine& health_;

    // Per-account exclusive access
    std::array<std::mutex, ACCOUNT_LOCK_SLOTS> account_locks_;

    // Serializes the two-store commit
    mutable std::mutex commit_mutex_;

    std::atomic<uint64_t> total_deposits_{0};
    std::atomic<uint64_t> total_borrows_{0};
    std::atomic<uint64_t> rejected_borrows_{0};
    std::atomic<uint64_t> failed_operations_{0};

    std::mutex& account_mutex(const Account& account);

    int32_t fail(int32_t code);
};

} // namespace lendcore

#endif // LENDCORE_LEDGER_HPP
