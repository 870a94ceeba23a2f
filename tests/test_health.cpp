// lendcore - HealthEngine Tests

#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"

#include <algorithm>
#include <limits>
#include <utility>
#include <vector>

using namespace lendcore;
using namespace lendcore::testing;

TEST_CASE("Weighted collateral against debt at the boundary", "[health]") {
    Fixture f;
    scenario_markets(f);

    UserPosition position;
    position.deposits[ASSET_X] = 10;  // 10 * 100 * 800 / 1000 = 800

    SECTION("Borrow 8 of Y: exactly 100%") {
        position.borrows[ASSET_Y] = 8;
        auto hf = f.health.calculate_health_factor(position);
        REQUIRE(hf.ok());
        REQUIRE(hf.value == 1000);
    }

    SECTION("Borrow 9 of Y: 800 * 1000 / 900 truncates to 888") {
        position.borrows[ASSET_Y] = 9;
        auto hf = f.health.calculate_health_factor(position);
        REQUIRE(hf.ok());
        REQUIRE(hf.value == 888);
    }
}

TEST_CASE("Debt-free accounts are maximally healthy", "[health]") {
    Fixture f;
    scenario_markets(f);

    SECTION("No position at all") {
        auto hf = f.health.calculate_health_factor(ALICE);
        REQUIRE(hf.ok());
        REQUIRE(hf.value == HEALTH_FACTOR_MAX);
    }

    SECTION("Deposits only") {
        REQUIRE(f.positions.record_user_deposit(ALICE, ASSET_X, 1000000) == errors::OK);
        REQUIRE(f.health.calculate_health_factor(ALICE).value == HEALTH_FACTOR_MAX);
    }

    SECTION("Zero-ltv deposits only") {
        REQUIRE(f.positions.record_user_deposit(ALICE, ASSET_Y, 1) == errors::OK);
        REQUIRE(f.health.calculate_health_factor(ALICE).value == HEALTH_FACTOR_MAX);
    }
}

TEST_CASE("Per-asset weighting truncates before summing", "[health]") {
    Fixture f;
    f.market(ASSET_X, 333, 1);
    f.market(ASSET_Y, 333, 1);
    f.market(ASSET_Z, 0, 1);

    UserPosition position;
    position.deposits[ASSET_X] = 1;  // 333 / 1000 -> 0
    position.deposits[ASSET_Y] = 2;  // 666 / 1000 -> 0
    position.borrows[ASSET_Z] = 1;

    auto hf = f.health.calculate_health_factor(position);
    REQUIRE(hf.ok());
    REQUIRE(hf.value == 0);
}

TEST_CASE("Iteration order does not change the health factor", "[health]") {
    Fixture f;

    std::vector<std::pair<AssetId, uint64_t>> deposits;
    std::vector<std::pair<AssetId, uint64_t>> borrows;
    for (uint64_t i = 1; i <= 24; ++i) {
        AssetId asset = AssetId::from_u64(0x1000 + i);
        f.market(asset, (i * 37) % 1001, 10 + i * 13);
        deposits.emplace_back(asset, i * 1000 + 7);
        if (i % 3 == 0) borrows.emplace_back(asset, i * 11);
    }

    auto build = [](const std::vector<std::pair<AssetId, uint64_t>>& d,
                    const std::vector<std::pair<AssetId, uint64_t>>& b, size_t buckets) {
        UserPosition p;
        p.deposits.reserve(buckets);
        p.borrows.reserve(buckets);
        for (const auto& [asset, amount] : d) p.deposits[asset] = amount;
        for (const auto& [asset, amount] : b) p.borrows[asset] = amount;
        return p;
    };

    auto forward = f.health.calculate_health_factor(build(deposits, borrows, 0));
    REQUIRE(forward.ok());

    std::reverse(deposits.begin(), deposits.end());
    std::reverse(borrows.begin(), borrows.end());
    auto reversed = f.health.calculate_health_factor(build(deposits, borrows, 512));
    REQUIRE(reversed.ok());

    std::rotate(deposits.begin(), deposits.begin() + 5, deposits.end());
    auto rotated = f.health.calculate_health_factor(build(deposits, borrows, 97));
    REQUIRE(rotated.ok());

    REQUIRE(forward.value == reversed.value);
    REQUIRE(forward.value == rotated.value);
}

TEST_CASE("Projected health factor includes the new borrow", "[health]") {
    Fixture f;
    scenario_markets(f);
    REQUIRE(f.positions.record_user_deposit(ALICE, ASSET_X, 10) == errors::OK);

    REQUIRE(f.health.projected_health_factor(ALICE, ASSET_Y, 8).value == 1000);
    REQUIRE(f.health.projected_health_factor(ALICE, ASSET_Y, 9).value == 888);

    // Existing debt is added to, not replaced
    REQUIRE(f.positions.record_user_borrow(ALICE, ASSET_Y, 4) == errors::OK);
    REQUIRE(f.health.projected_health_factor(ALICE, ASSET_Y, 4).value == 1000);
    REQUIRE(f.health.projected_health_factor(ALICE, ASSET_Y, 5).value == 888);

    // Projection does not mutate the store
    REQUIRE(f.positions.debt_of(ALICE, ASSET_Y) == 4);
}

TEST_CASE("Undiscounted position values", "[health]") {
    Fixture f;
    scenario_markets(f);

    UserPosition position;
    position.deposits[ASSET_X] = 10;
    position.deposits[ASSET_Y] = 3;
    position.borrows[ASSET_Y] = 8;

    auto values = f.health.position_values(position);
    REQUIRE(values.ok());
    REQUIRE(values.value.deposit_value == 1300);
    REQUIRE(values.value.debt_value == 800);
}

TEST_CASE("Missing inputs propagate as errors", "[health]") {
    Fixture f;
    scenario_markets(f);

    SECTION("Deposit asset without a price") {
        REQUIRE(f.markets.set_market(OWNER, ASSET_Z, params(500)) == errors::OK);
        UserPosition position;
        position.deposits[ASSET_Z] = 1;
        position.borrows[ASSET_Y] = 1;
        REQUIRE(f.health.calculate_health_factor(position).status == errors::NOT_FOUND);
    }

    SECTION("Borrow asset without a price") {
        UserPosition position;
        position.deposits[ASSET_X] = 1;
        position.borrows[ASSET_W] = 1;
        REQUIRE(f.health.calculate_health_factor(position).status == errors::NOT_FOUND);
    }

    SECTION("Deposit asset without a market") {
        REQUIRE(f.oracle.set_price_source(OWNER, ASSET_W, FixedPrice{1}) == errors::OK);
        UserPosition position;
        position.deposits[ASSET_W] = 1;
        REQUIRE(f.health.calculate_health_factor(position).status == errors::MARKET_NOT_FOUND);
    }
}

TEST_CASE("Wide products are checked, never wrapped", "[health]") {
    Fixture f;
    constexpr uint64_t max = std::numeric_limits<uint64_t>::max();

    SECTION("amount * price fits, times ltv does not") {
        f.market(ASSET_X, 1000, max);
        f.market(ASSET_Y, 0, 1);
        UserPosition position;
        position.deposits[ASSET_X] = max;
        position.borrows[ASSET_Y] = 1;
        REQUIRE(f.health.calculate_health_factor(position).status == errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Debt accumulation") {
        f.market(ASSET_X, 0, max);
        f.market(ASSET_Y, 0, max);
        UserPosition position;
        position.borrows[ASSET_X] = max;
        position.borrows[ASSET_Y] = max;
        REQUIRE(f.health.calculate_health_factor(position).status == errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Permille scaling of the collateral sum") {
        f.market(ASSET_X, 1, max);
        f.market(ASSET_Y, 1, max);
        f.market(ASSET_Z, 0, 1);
        UserPosition position;
        position.deposits[ASSET_X] = max;
        position.deposits[ASSET_Y] = max;
        position.borrows[ASSET_Z] = 1;
        REQUIRE(f.health.calculate_health_factor(position).status == errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Large but representable values") {
        f.market(ASSET_X, 500, 1000000000000ULL);
        f.market(ASSET_Y, 0, 1000000000000ULL);
        UserPosition position;
        position.deposits[ASSET_X] = 4000000000000ULL;  // 4e24 raw, 2e24 weighted
        position.borrows[ASSET_Y] = 1000000000000ULL;   // 1e24
        auto hf = f.health.calculate_health_factor(position);
        REQUIRE(hf.ok());
        REQUIRE(hf.value == 2000);
    }
}
