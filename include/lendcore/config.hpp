// lendcore - Configuration
// JSON-backed bootstrap for owner, markets, providers and price sources

#pragma once

#include <lendcore/types.hpp>
#include <lendcore/market.hpp>
#include <lendcore/oracle.hpp>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lendcore {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct MarketEntry {
    AssetId asset;
    MarketParams params;
};

// External provider backed by a fixed price table
struct ProviderEntry {
    ProviderRef reference;
    std::map<AssetId, uint64_t> prices;
};

struct PriceSourceEntry {
    AssetId asset;
    PriceSource source;
};

class Config {
public:
    std::string log_level = "info";
    Account owner;
    uint32_t max_resolution_depth = DEFAULT_MAX_RESOLUTION_DEPTH;
    std::vector<MarketEntry> markets;
    std::vector<ProviderEntry> providers;
    std::vector<PriceSourceEntry> price_sources;

    Config() = default;

    // Load from JSON file
    static Config from_file(std::string_view path);

    // Load from JSON string
    static Config from_json(std::string_view content);

    // Builder methods
    Config& with_owner(const Account& account) {
        owner = account;
        return *this;
    }

    Config& with_market(const AssetId& asset, const MarketParams& params) {
        markets.push_back({asset, params});
        return *this;
    }

    Config& with_fixed_price(const AssetId& asset, uint64_t price) {
        price_sources.push_back({asset, FixedPrice{price}});
        return *this;
    }

    Config& with_external_price(const AssetId& asset, ProviderRef reference) {
        price_sources.push_back({asset, ExternalModule{reference}});
        return *this;
    }

    Config& with_provider(ProviderRef reference, std::map<AssetId, uint64_t> prices) {
        providers.push_back({reference, std::move(prices)});
        return *this;
    }
};

}  // namespace lendcore
