// lendsim - scenario runner for the lendcore accounting engine
//
// Usage: lendsim <config.json> <scenario.json>
//
// Scenario format:
//   {
//     "start_time": 1700000000,
//     "steps": [
//       {"op": "deposit",  "account": "0x01", "asset": "0xa1", "amount": 10},
//       {"op": "borrow",   "account": "0x01", "asset": "0xb2", "amount": 8, "expect": "OK"},
//       {"op": "position", "account": "0x01"},
//       {"op": "price",    "asset": "0xa1"},
//       {"op": "advance",  "seconds": 60}
//     ]
//   }

#include <lendcore/lendcore.hpp>
#include <lendcore/log.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using json = nlohmann::json;
using namespace lendcore;

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

namespace {

json load_json(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return json::parse(buffer.str());
}

Address address_field(const json& step, const char* key) {
    if (!step.contains(key) || !step[key].is_string()) {
        throw std::runtime_error(std::string("step is missing '") + key + "'");
    }
    auto addr = addresses::from_hex(step[key].get<std::string>());
    if (!addr) {
        throw std::runtime_error(std::string("bad address in '") + key + "'");
    }
    return *addr;
}

std::string format_hf(U128 hf) {
    return hf == HEALTH_FACTOR_MAX ? std::string("max") : to_string(hf);
}

}  // namespace

//------------------------------------------------------------------------------
// Scenario Runner
//------------------------------------------------------------------------------

class Runner {
public:
    Runner(MoneyMarket& mm, ManualClock& clock) : mm_(mm), clock_(clock) {}

    // Returns true when the step's status matched its expectation
    bool run_step(size_t index, const json& step) {
        std::string op = step.value("op", "");
        std::string expect = step.value("expect", "OK");
        int32_t status = errors::OK;
        std::string detail;

        if (op == "deposit" || op == "borrow") {
            Account account(address_field(step, "account"));
            AssetId asset(address_field(step, "asset"));
            uint64_t amount = step.value("amount", uint64_t{0});

            status = (op == "deposit")
                ? mm_.ledger().deposit(account, asset, amount)
                : mm_.ledger().borrow(account, asset, amount);
            detail = account.to_string() + " " + std::to_string(amount) + " of " + asset.to_string();
        } else if (op == "position") {
            Account account(address_field(step, "account"));
            auto summary = mm_.ledger().get_user_position(account);
            status = summary.status;
            if (summary.ok()) {
                detail = "deposits=" + to_string(summary.value.total_deposit_value) +
                         " debt=" + to_string(summary.value.total_debt_value) +
                         " hf=" + format_hf(summary.value.health_factor);
            }
        } else if (op == "price") {
            AssetId asset(address_field(step, "asset"));
            auto price = mm_.oracle().get_price(asset);
            status = price.status;
            if (price.ok()) detail = asset.to_string() + " = " + std::to_string(price.value);
        } else if (op == "advance") {
            clock_.advance(step.value("seconds", uint64_t{0}));
            detail = "t=" + std::to_string(clock_.now());
        } else {
            std::cerr << "step " << index << ": unknown op '" << op << "'\n";
            return false;
        }

        bool matched = (expect == errors::to_string(status));
        std::cout << std::to_string(index) << " " << op << " " << errors::to_string(status)
                  << (matched ? "" : " (expected " + expect + ")")
                  << (detail.empty() ? "" : "  " + detail) << "\n";
        return matched;
    }

private:
    MoneyMarket& mm_;
    ManualClock& clock_;
};

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <scenario.json>\n";
        return 2;
    }

    try {
        Config config = Config::from_file(argv[1]);
        json scenario = load_json(argv[2]);

        ManualClock clock(scenario.value("start_time", uint64_t{0}));
        auto mm = MoneyMarket::from_config(config, clock);

        Runner runner(*mm, clock);
        bool all_matched = true;

        const json& steps = scenario.at("steps");
        for (size_t i = 0; i < steps.size(); ++i) {
            if (!runner.run_step(i, steps[i])) all_matched = false;
        }

        int32_t invariants = mm->check_invariants();
        std::cout << "invariants " << errors::to_string(invariants) << "\n";

        auto stats = mm->get_stats();
        std::cout << "markets=" << stats.total_markets
                  << " accounts=" << stats.total_accounts
                  << " deposits=" << stats.ledger_stats.total_deposits
                  << " borrows=" << stats.ledger_stats.total_borrows
                  << " rejected=" << stats.ledger_stats.rejected_borrows << "\n";

        return (all_matched && invariants == errors::OK) ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const ConfigError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
    } catch (const json::exception& e) {
        std::cerr << "Scenario error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
    }
    return EXIT_FAILURE;
}
