#ifndef LENDCORE_LENDCORE_HPP
#define LENDCORE_LENDCORE_HPP

// =============================================================================
// lendcore - Collateralized Lending Accounting Engine
//
//   PriceOracle     asset -> price (fixed or external provider)
//   MarketRegistry  per-asset rates, risk parameters and totals
//   PositionStore   per-account deposits and borrows
//   HealthEngine    risk-weighted solvency ratio
//   Ledger          deposit / borrow under the solvency invariant
//
// =============================================================================

#include <memory>

#include "types.hpp"
#include "auth.hpp"
#include "clock.hpp"
#include "oracle.hpp"
#include "market.hpp"
#include "position.hpp"
#include "health.hpp"
#include "ledger.hpp"
#include "config.hpp"

namespace lendcore {

// =============================================================================
// MoneyMarket - owns and wires every component
// =============================================================================

class MoneyMarket {
public:
    // Uses the system clock
    explicit MoneyMarket(uint32_t max_resolution_depth = DEFAULT_MAX_RESOLUTION_DEPTH);

    // Uses a caller-owned clock, which must outlive this object
    explicit MoneyMarket(const Clock& clock,
                         uint32_t max_resolution_depth = DEFAULT_MAX_RESOLUTION_DEPTH);

    ~MoneyMarket() = default;

    // Non-copyable
    MoneyMarket(const MoneyMarket&) = delete;
    MoneyMarket& operator=(const MoneyMarket&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    Authority& authority() { return *authority_; }
    const Authority& authority() const { return *authority_; }

    PriceOracle& oracle() { return *oracle_; }
    const PriceOracle& oracle() const { return *oracle_; }

    MarketRegistry& markets() { return *markets_; }
    const MarketRegistry& markets() const { return *markets_; }

    PositionStore& positions() { return *positions_; }
    const PositionStore& positions() const { return *positions_; }

    const HealthEngine& health() const { return *health_; }

    Ledger& ledger() { return *ledger_; }
    const Ledger& ledger() const { return *ledger_; }

    // =========================================================================
    // Initialization
    // =========================================================================

    // Set the owning authority. Once only.
    int32_t initialize(const Account& owner);

    // Owner, markets, providers and price sources from a config.
    // Throws ConfigError if any entry is rejected. The config's
    // max_resolution_depth is honoured by constructing from_config instead.
    void initialize(const Config& config);

    // Builds a MoneyMarket with the config's resolution depth and applies it
    static std::unique_ptr<MoneyMarket> from_config(const Config& config);
    static std::unique_ptr<MoneyMarket> from_config(const Config& config, const Clock& clock);

    // =========================================================================
    // Invariants
    // =========================================================================

    // total_deposits / total_debt equal the sums over all positions.
    // OK or INVARIANT_VIOLATION. Not a snapshot: call with no operation in flight.
    int32_t check_invariants() const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct GlobalStats {
        uint64_t total_markets;
        uint64_t total_accounts;
        PriceOracle::Stats oracle_stats;
        Ledger::Stats ledger_stats;
    };
    GlobalStats get_stats() const;

    static constexpr const char* version() { return "1.0.0"; }

private:
    std::unique_ptr<Clock> owned_clock_;
    const Clock& clock_;

    std::unique_ptr<Authority> authority_;
    std::unique_ptr<PriceOracle> oracle_;
    std::unique_ptr<MarketRegistry> markets_;
    std::unique_ptr<PositionStore> positions_;
    std::unique_ptr<HealthEngine> health_;
    std::unique_ptr<Ledger> ledger_;
};

} // namespace lendcore

#endif // LENDCORE_LENDCORE_HPP
