// lendcore - PriceOracle Tests

#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"

using namespace lendcore;
using namespace lendcore::testing;

TEST_CASE("Fixed price resolves directly", "[oracle]") {
    Authority authority(OWNER);
    PriceOracle oracle(authority);

    REQUIRE(oracle.set_price_source(OWNER, ASSET_Z, FixedPrice{50}) == errors::OK);

    auto price = oracle.get_price(ASSET_Z);
    REQUIRE(price.ok());
    REQUIRE(price.value == 50);

    // No other source or provider involved
    REQUIRE(oracle.get_stats().total_providers == 0);
}

TEST_CASE("Unregistered asset is NOT_FOUND", "[oracle]") {
    Authority authority(OWNER);
    PriceOracle oracle(authority);

    auto price = oracle.get_price(ASSET_X);
    REQUIRE(price.status == errors::NOT_FOUND);
    REQUIRE(oracle.get_stats().failed_lookups == 1);
}

TEST_CASE("Price sources overwrite", "[oracle]") {
    Authority authority(OWNER);
    PriceOracle oracle(authority);

    REQUIRE(oracle.set_price_source(OWNER, ASSET_X, FixedPrice{10}) == errors::OK);
    REQUIRE(oracle.set_price_source(OWNER, ASSET_X, FixedPrice{20}) == errors::OK);
    REQUIRE(oracle.get_price(ASSET_X).value == 20);

    auto provider = std::make_shared<StaticPriceProvider>();
    REQUIRE(provider->set_price(ASSET_X, 30) == errors::OK);
    REQUIRE(oracle.register_provider(OWNER, 3, provider) == errors::OK);
    REQUIRE(oracle.set_price_source(OWNER, ASSET_X, ExternalModule{3}) == errors::OK);
    REQUIRE(oracle.get_price(ASSET_X).value == 30);

    auto source = oracle.get_price_source(ASSET_X);
    REQUIRE(source.has_value());
    REQUIRE(std::holds_alternative<ExternalModule>(*source));
    REQUIRE(oracle.get_stats().total_sources == 1);
}

TEST_CASE("External module delegates to provider", "[oracle]") {
    Authority authority(OWNER);
    PriceOracle oracle(authority);
    auto provider = std::make_shared<StaticPriceProvider>();
    REQUIRE(oracle.register_provider(OWNER, 42, provider) == errors::OK);
    REQUIRE(oracle.set_price_source(OWNER, ASSET_W, ExternalModule{42}) == errors::OK);

    SECTION("Provider has no price for the asset") {
        REQUIRE(oracle.get_price(ASSET_W).status == errors::NOT_FOUND);
    }

    SECTION("Provider has a price") {
        REQUIRE(provider->set_price(ASSET_W, 1234) == errors::OK);
        auto price = oracle.get_price(ASSET_W);
        REQUIRE(price.ok());
        REQUIRE(price.value == 1234);
    }

    SECTION("Provider price follows the feed") {
        REQUIRE(provider->set_price(ASSET_W, 5) == errors::OK);
        REQUIRE(oracle.get_price(ASSET_W).value == 5);
        REQUIRE(provider->set_price(ASSET_W, 6) == errors::OK);
        REQUIRE(oracle.get_price(ASSET_W).value == 6);
        provider->clear_price(ASSET_W);
        REQUIRE(oracle.get_price(ASSET_W).status == errors::NOT_FOUND);
    }
}

TEST_CASE("External module with unknown reference is NOT_FOUND", "[oracle]") {
    Authority authority(OWNER);
    PriceOracle oracle(authority);

    REQUIRE(oracle.set_price_source(OWNER, ASSET_W, ExternalModule{99}) == errors::OK);
    REQUIRE_FALSE(oracle.has_provider(99));
    REQUIRE(oracle.get_price(ASSET_W).status == errors::NOT_FOUND);
}

TEST_CASE("Nested oracles resolve through each other", "[oracle]") {
    Authority authority(OWNER);
    PriceOracle front(authority);
    auto back = std::make_shared<PriceOracle>(authority);

    REQUIRE(back->set_price_source(OWNER, ASSET_X, FixedPrice{77}) == errors::OK);
    REQUIRE(front.register_provider(OWNER, 1, back) == errors::OK);
    REQUIRE(front.set_price_source(OWNER, ASSET_X, ExternalModule{1}) == errors::OK);

    auto price = front.get_price(ASSET_X);
    REQUIRE(price.ok());
    REQUIRE(price.value == 77);
}

TEST_CASE("Cyclic external chains stop at the depth bound", "[oracle]") {
    Authority authority(OWNER);
    auto a = std::make_shared<PriceOracle>(authority, 4);
    auto b = std::make_shared<PriceOracle>(authority, 4);

    REQUIRE(a->register_provider(OWNER, 2, b) == errors::OK);
    REQUIRE(b->register_provider(OWNER, 1, a) == errors::OK);
    REQUIRE(a->set_price_source(OWNER, ASSET_X, ExternalModule{2}) == errors::OK);
    REQUIRE(b->set_price_source(OWNER, ASSET_X, ExternalModule{1}) == errors::OK);

    REQUIRE(a->get_price(ASSET_X).status == errors::RESOLUTION_DEPTH_EXCEEDED);
    REQUIRE(b->get_price(ASSET_X).status == errors::RESOLUTION_DEPTH_EXCEEDED);

    // Break the cycle: the chain now terminates
    REQUIRE(b->set_price_source(OWNER, ASSET_X, FixedPrice{9}) == errors::OK);
    REQUIRE(a->get_price(ASSET_X).value == 9);

    // Replacing b's registration releases its reference to a
    std::weak_ptr<PriceOracle> a_watch = a;
    std::weak_ptr<PriceOracle> b_watch = b;
    REQUIRE(b->register_provider(OWNER, 1, std::make_shared<StaticPriceProvider>()) == errors::OK);
    a.reset();
    b.reset();
    REQUIRE(a_watch.expired());
    REQUIRE(b_watch.expired());
}

TEST_CASE("Chains within the depth bound resolve", "[oracle]") {
    Authority authority(OWNER);
    constexpr uint32_t depth = 3;

    // hops[0] -> hops[1] -> hops[2] -> hops[3] (fixed)
    std::vector<std::shared_ptr<PriceOracle>> hops;
    for (uint32_t i = 0; i <= depth; ++i) {
        hops.push_back(std::make_shared<PriceOracle>(authority, depth));
    }
    for (uint32_t i = 0; i < depth; ++i) {
        REQUIRE(hops[i]->register_provider(OWNER, i + 1, hops[i + 1]) == errors::OK);
        REQUIRE(hops[i]->set_price_source(OWNER, ASSET_Y, ExternalModule{i + 1}) == errors::OK);
    }
    REQUIRE(hops[depth]->set_price_source(OWNER, ASSET_Y, FixedPrice{11}) == errors::OK);

    REQUIRE(hops[0]->get_price(ASSET_Y).value == 11);

    // One more hop is too many
    auto extra = std::make_shared<PriceOracle>(authority, depth);
    REQUIRE(extra->register_provider(OWNER, 0, hops[0]) == errors::OK);
    REQUIRE(extra->set_price_source(OWNER, ASSET_Y, ExternalModule{0}) == errors::OK);
    REQUIRE(extra->get_price(ASSET_Y).status == errors::RESOLUTION_DEPTH_EXCEEDED);
}

TEST_CASE("Oracle configuration requires the owner", "[oracle]") {
    Authority authority(OWNER);
    PriceOracle oracle(authority);

    REQUIRE(oracle.set_price_source(MALLORY, ASSET_X, FixedPrice{1}) == errors::UNAUTHORIZED);
    REQUIRE(oracle.register_provider(MALLORY, 1, std::make_shared<StaticPriceProvider>()) ==
            errors::UNAUTHORIZED);
    REQUIRE_FALSE(oracle.get_price_source(ASSET_X).has_value());

    REQUIRE(oracle.set_price_source(OWNER, ASSET_X, FixedPrice{1}) == errors::OK);
    REQUIRE(oracle.remove_price_source(MALLORY, ASSET_X) == errors::UNAUTHORIZED);
    REQUIRE(oracle.remove_price_source(OWNER, ASSET_X) == errors::OK);
    REQUIRE(oracle.remove_price_source(OWNER, ASSET_X) == errors::NOT_FOUND);
}

TEST_CASE("Oracle rejects bad input", "[oracle]") {
    SECTION("Uninitialized authority") {
        Authority authority;
        PriceOracle oracle(authority);
        REQUIRE(oracle.set_price_source(OWNER, ASSET_X, FixedPrice{1}) == errors::NOT_INITIALIZED);
    }

    SECTION("Zero fixed price") {
        Authority authority(OWNER);
        PriceOracle oracle(authority);
        REQUIRE(oracle.set_price_source(OWNER, ASSET_X, FixedPrice{0}) == errors::INVALID_PRICE);
    }

    SECTION("Null provider") {
        Authority authority(OWNER);
        PriceOracle oracle(authority);
        REQUIRE(oracle.register_provider(OWNER, 1, nullptr) == errors::INVALID_PARAMS);
    }
}

TEST_CASE("Zero prices are rejected on every path", "[oracle]") {
    Authority authority(OWNER);
    PriceOracle oracle(authority);

    SECTION("Static provider table") {
        StaticPriceProvider provider;
        REQUIRE(provider.set_price(ASSET_X, 0) == errors::INVALID_PRICE);
        REQUIRE(provider.get_price(ASSET_X, 0).status == errors::NOT_FOUND);
    }

    SECTION("Provider quoting zero") {
        REQUIRE(oracle.register_provider(OWNER, 7, std::make_shared<ConstantProvider>(0)) ==
                errors::OK);
        REQUIRE(oracle.set_price_source(OWNER, ASSET_Y, ExternalModule{7}) == errors::OK);

        REQUIRE(oracle.get_price(ASSET_Y).status == errors::INVALID_PRICE);
        REQUIRE(oracle.get_stats().failed_lookups == 1);
    }

    SECTION("Zero from deeper in a chain") {
        auto back = std::make_shared<PriceOracle>(authority);
        REQUIRE(back->register_provider(OWNER, 1, std::make_shared<ConstantProvider>(0)) ==
                errors::OK);
        REQUIRE(back->set_price_source(OWNER, ASSET_Y, ExternalModule{1}) == errors::OK);
        REQUIRE(oracle.register_provider(OWNER, 2, back) == errors::OK);
        REQUIRE(oracle.set_price_source(OWNER, ASSET_Y, ExternalModule{2}) == errors::OK);

        REQUIRE(oracle.get_price(ASSET_Y).status == errors::INVALID_PRICE);
    }
}
