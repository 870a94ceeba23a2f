// lendcore - Configuration Implementation

#include <lendcore/config.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace lendcore {

using json = nlohmann::json;

namespace {

Address parse_address(const json& j, const char* what) {
    if (!j.is_string()) {
        throw ConfigError(std::string(what) + " must be a hex string");
    }
    auto addr = addresses::from_hex(j.get<std::string>());
    if (!addr) {
        throw ConfigError(std::string("invalid ") + what + ": " + j.get<std::string>());
    }
    return *addr;
}

const json& require(const json& j, const char* key, const char* where) {
    auto it = j.find(key);
    if (it == j.end()) {
        throw ConfigError(std::string("missing '") + key + "' in " + where);
    }
    return *it;
}

uint64_t require_u64(const json& j, const char* key, const char* where) {
    const json& v = require(j, key, where);
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
        throw ConfigError(std::string("'") + key + "' in " + where +
                          " must be a non-negative integer");
    }
    return v.get<uint64_t>();
}

MarketEntry parse_market(const json& j) {
    MarketEntry entry;
    entry.asset = AssetId(parse_address(require(j, "asset", "market"), "market asset"));
    entry.params.deposit_rate = require_u64(j, "deposit_rate", "market");
    entry.params.borrow_rate = require_u64(j, "borrow_rate", "market");
    entry.params.ltv = require_u64(j, "ltv", "market");
    entry.params.liquidation_threshold = require_u64(j, "liquidation_threshold", "market");
    return entry;
}

ProviderEntry parse_provider(const json& j) {
    ProviderEntry entry;
    entry.reference = require_u64(j, "reference", "provider");

    auto prices = j.find("prices");
    if (prices != j.end()) {
        if (!prices->is_object()) {
            throw ConfigError("provider prices must be an object of asset -> price");
        }
        for (auto it = prices->begin(); it != prices->end(); ++it) {
            auto addr = addresses::from_hex(it.key());
            if (!addr) {
                throw ConfigError("invalid provider asset: " + it.key());
            }
            if (!it.value().is_number_unsigned() || it.value().get<uint64_t>() == 0) {
                throw ConfigError("provider price for " + it.key() + " must be a positive integer");
            }
            entry.prices[AssetId(*addr)] = it.value().get<uint64_t>();
        }
    }
    return entry;
}

PriceSourceEntry parse_price_source(const json& j) {
    PriceSourceEntry entry;
    entry.asset = AssetId(parse_address(require(j, "asset", "price source"), "price source asset"));

    bool has_fixed = j.contains("fixed");
    bool has_external = j.contains("external");
    if (has_fixed == has_external) {
        throw ConfigError("price source for " + entry.asset.to_string() +
                          " needs exactly one of 'fixed' or 'external'");
    }

    if (has_fixed) {
        entry.source = FixedPrice{require_u64(j, "fixed", "price source")};
    } else {
        entry.source = ExternalModule{require_u64(j, "external", "price source")};
    }
    return entry;
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("config root must be an object");
    }

    Config config;

    if (root.contains("log_level")) {
        if (!root["log_level"].is_string()) {
            throw ConfigError("log_level must be a string");
        }
        config.log_level = root["log_level"].get<std::string>();
    }

    config.owner = Account(parse_address(require(root, "owner", "config"), "owner"));

    if (root.contains("max_resolution_depth")) {
        uint64_t depth = require_u64(root, "max_resolution_depth", "config");
        if (depth == 0 || depth > 64) {
            throw ConfigError("max_resolution_depth must be in [1, 64]");
        }
        config.max_resolution_depth = static_cast<uint32_t>(depth);
    }

    if (root.contains("markets")) {
        if (!root["markets"].is_array()) {
            throw ConfigError("'markets' must be an array");
        }
        for (const auto& m : root["markets"]) {
            config.markets.push_back(parse_market(m));
        }
    }

    if (root.contains("providers")) {
        if (!root["providers"].is_array()) {
            throw ConfigError("'providers' must be an array");
        }
        for (const auto& p : root["providers"]) {
            config.providers.push_back(parse_provider(p));
        }
    }

    if (root.contains("price_sources")) {
        if (!root["price_sources"].is_array()) {
            throw ConfigError("'price_sources' must be an array");
        }
        for (const auto& s : root["price_sources"]) {
            config.price_sources.push_back(parse_price_source(s));
        }
    }

    return config;
}

}  // namespace lendcore
