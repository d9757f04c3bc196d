// FizzDex scenario CLI
//
// Runs a JSON scenario of calls against an in-memory ledger and a manual
// clock, printing one JSON result per step.
//
//   {"steps": [
//     {"op": "credit", "asset": "USDC", "to": "alice", "amount": 1000000},
//     {"op": "initialize", "caller": "admin", "reward_asset": "CAPS"},
//     {"op": "create_pool", "caller": "alice", "asset_a": "USDC", "asset_b": "SOL"},
//     ...
//   ]}
//
// Names are mapped to 32-byte identifiers by SHA-256. A 0x-prefixed value
// is taken literally and must be exactly 64 hex digits.

#include "fizzdex/fizzdex.hpp"
#include "fizzdex/crypto.hpp"
#include "fizzdex/log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string scenario_path = "-";
    bool verbose = false;
};

//------------------------------------------------------------------------------
// Step field helpers
//------------------------------------------------------------------------------

fizzdex::Bytes32 to_id(const std::string& text) {
    if (text.rfind("0x", 0) != 0) return fizzdex::named_address(text);

    fizzdex::Bytes32 id{};
    if (!fizzdex::from_hex(text, id)) {
        throw std::runtime_error("malformed identifier '" + text + "': expected 0x and 64 hex digits");
    }
    return id;
}

const json& field(const json& step, const char* key) {
    if (!step.contains(key)) {
        throw std::runtime_error(std::string("missing field '") + key + "'");
    }
    return step.at(key);
}

fizzdex::Bytes32 get_id(const json& step, const char* key) {
    const json& v = field(step, key);
    if (!v.is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' must be a string");
    }
    return to_id(v.get<std::string>());
}

// Unsigned integers may be JSON numbers or decimal strings
uint64_t get_u64(const json& step, const char* key) {
    const json& v = field(step, key);
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (!s.empty() && s.find_first_not_of("0123456789") == std::string::npos) {
            try {
                return std::stoull(s);
            } catch (const std::out_of_range&) {
                throw std::runtime_error(std::string("field '") + key + "' out of range");
            }
        }
    }
    throw std::runtime_error(std::string("field '") + key + "' must be a non-negative integer");
}

uint64_t get_u64_or(const json& step, const char* key, uint64_t fallback) {
    return step.contains(key) ? get_u64(step, key) : fallback;
}

int64_t get_i64(const json& step, const char* key) {
    const json& v = field(step, key);
    if (!v.is_number_integer()) {
        throw std::runtime_error(std::string("field '") + key + "' must be an integer");
    }
    return v.get<int64_t>();
}

uint16_t get_fee(const json& step, const char* key) {
    uint64_t v = get_u64(step, key);
    if (v > std::numeric_limits<uint16_t>::max()) {
        throw std::runtime_error(std::string("field '") + key + "' out of range");
    }
    return static_cast<uint16_t>(v);
}

bool get_bool_or(const json& step, const char* key, bool fallback) {
    if (!step.contains(key)) return fallback;
    const json& v = step.at(key);
    if (!v.is_boolean()) {
        throw std::runtime_error(std::string("field '") + key + "' must be a boolean");
    }
    return v.get<bool>();
}

// "secret" is taken as raw UTF-8 bytes, "secret_hex" as hex
std::vector<uint8_t> get_secret(const json& step) {
    if (step.contains("secret_hex")) {
        const json& v = field(step, "secret_hex");
        std::vector<uint8_t> out;
        if (!v.is_string() || !fizzdex::from_hex(v.get<std::string>(), out)) {
            throw std::runtime_error("field 'secret_hex' must be an even-length hex string");
        }
        return out;
    }
    const std::string s = field(step, "secret").get<std::string>();
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::string hex_id(const fizzdex::Bytes32& id) {
    return "0x" + fizzdex::to_hex(id);
}

std::string hex_bytes(const std::vector<uint8_t>& bytes) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

//------------------------------------------------------------------------------
// JSON views
//------------------------------------------------------------------------------

json pool_json(const fizzdex::Pool& p) {
    return {
        {"pool_id", hex_id(p.id)},
        {"asset_a", hex_id(p.asset_a)},
        {"asset_b", hex_id(p.asset_b)},
        {"lp_asset", hex_id(p.lp_asset)},
        {"reserve_a", p.reserve_a},
        {"reserve_b", p.reserve_b},
        {"total_lp_supply", p.total_lp_supply},
        {"locked", p.locked}
    };
}

json swap_json(const fizzdex::AtomicSwap& s) {
    json j = {
        {"swap_id", hex_id(s.id)},
        {"initiator", hex_id(s.initiator)},
        {"participant", hex_id(s.participant)},
        {"asset", hex_id(s.asset)},
        {"amount", s.amount},
        {"secret_hash", hex_id(s.secret_hash)},
        {"timelock", s.timelock},
        {"status", fizzdex::swap_status_name(s.status())}
    };
    if (!s.secret.empty()) j["secret_hex"] = hex_bytes(s.secret);
    return j;
}

json player_json(const fizzdex::PlayerState& p) {
    return {
        {"total_plays", p.total_plays},
        {"fizz_count", p.fizz_count},
        {"buzz_count", p.buzz_count},
        {"fizzbuzz_count", p.fizzbuzz_count},
        {"pending_rewards", p.pending_rewards},
        {"total_claimed", p.total_claimed},
        {"last_play_time", p.last_play_time}
    };
}

//------------------------------------------------------------------------------
// Scenario Runner
//------------------------------------------------------------------------------

class ScenarioRunner {
public:
    explicit ScenarioRunner(const fizzdex::Config& config)
        : dex_(ledger_, clock_, config) {}

    // Returns false if any step was malformed
    bool run(const json& scenario, json& results) {
        if (!scenario.is_object() || !scenario.contains("steps") || !scenario["steps"].is_array()) {
            throw std::runtime_error("scenario must be an object with a 'steps' array");
        }

        bool clean = true;
        size_t index = 0;
        for (const auto& step : scenario["steps"]) {
            json out;
            try {
                out = run_step(step);
            } catch (const std::exception& e) {
                clean = false;
                out = {{"error", e.what()}};
            }
            out["step"] = index++;
            if (step.is_object() && step.contains("op")) out["op"] = step["op"];
            results.push_back(out);
        }
        return clean;
    }

private:
    fizzdex::TokenLedger ledger_;
    fizzdex::ManualClock clock_;
    fizzdex::FizzDex dex_;

    static json status(int32_t rc) {
        return {{"status", rc}, {"result", fizzdex::error_string(rc)}};
    }

    fizzdex::PoolId pool_ref(const json& step) const {
        if (step.contains("pool")) return get_id(step, "pool");
        return fizzdex::pool_keys::pool_id(get_id(step, "asset_a"), get_id(step, "asset_b"));
    }

    fizzdex::SwapId swap_ref(const json& step) const {
        if (step.contains("swap_id")) return get_id(step, "swap_id");
        return fizzdex::AtomicSwapEngine::swap_id(
            get_id(step, "initiator"), get_id(step, "participant"),
            get_id(step, "asset"), get_i64(step, "timelock"));
    }

    json run_step(const json& step) {
        if (!step.is_object()) throw std::runtime_error("step must be an object");
        const std::string op = field(step, "op").get<std::string>();

        // Ledger and clock setup
        if (op == "credit") {
            return status(ledger_.credit(get_id(step, "asset"), get_id(step, "to"),
                                         get_u64(step, "amount")));
        }
        if (op == "fund_rewards") {
            fizzdex::AssetId reward = dex_.market().reward_asset();
            return status(ledger_.credit(reward, fizzdex::RewardGame::reward_vault(reward),
                                         get_u64(step, "amount")));
        }
        if (op == "set_time") {
            clock_.set(get_i64(step, "now"));
            return status(fizzdex::errors::OK);
        }
        if (op == "advance") {
            clock_.advance(get_i64(step, "seconds"));
            return status(fizzdex::errors::OK);
        }

        // Market administration
        if (op == "initialize") {
            const fizzdex::Address caller = get_id(step, "caller");
            const fizzdex::AssetId reward = get_id(step, "reward_asset");
            if (step.contains("fee_bps")) {
                return status(dex_.initialize(caller, reward, get_fee(step, "fee_bps")));
            }
            return status(dex_.initialize(caller, reward));
        }
        if (op == "set_pause") {
            return status(dex_.set_pause(get_id(step, "caller"), get_bool_or(step, "paused", true)));
        }
        if (op == "set_fee") {
            return status(dex_.set_fee(get_id(step, "caller"), get_fee(step, "fee_bps")));
        }

        // AMM
        if (op == "create_pool") {
            fizzdex::PoolId id{};
            json out = status(dex_.create_pool(get_id(step, "caller"), get_id(step, "asset_a"),
                                               get_id(step, "asset_b"), &id));
            if (out["status"] == fizzdex::errors::OK) out["pool_id"] = hex_id(id);
            return out;
        }
        if (op == "add_liquidity") {
            auto r = dex_.add_liquidity(get_id(step, "caller"), pool_ref(step),
                                        get_u64(step, "amount_a"), get_u64(step, "amount_b"),
                                        get_u64_or(step, "min_lp_out", 0));
            json out = status(r.status);
            if (r.ok()) out["lp_minted"] = r.lp_amount;
            return out;
        }
        if (op == "remove_liquidity") {
            auto r = dex_.remove_liquidity(get_id(step, "caller"), pool_ref(step),
                                           get_u64(step, "lp_amount"),
                                           get_u64_or(step, "min_amount_a", 0),
                                           get_u64_or(step, "min_amount_b", 0));
            json out = status(r.status);
            if (r.ok()) {
                out["amount_a"] = r.amount_a;
                out["amount_b"] = r.amount_b;
            }
            return out;
        }
        if (op == "swap") {
            auto r = dex_.swap(get_id(step, "caller"), pool_ref(step), get_u64(step, "amount_in"),
                               get_u64_or(step, "min_amount_out", 0),
                               get_bool_or(step, "a_to_b", true));
            json out = status(r.status);
            if (r.ok()) out["amount_out"] = r.amount_out;
            return out;
        }
        if (op == "quote") {
            auto q = dex_.quote(pool_ref(step), get_u64(step, "amount_in"),
                                get_bool_or(step, "a_to_b", true));
            json out = status(q.status);
            if (q.ok()) {
                out["amount_out"] = q.amount_out;
                out["fee_amount"] = q.fee_amount;
                out["price_impact_bps"] = q.price_impact_bps;
            }
            return out;
        }

        // Atomic swaps
        if (op == "initiate") {
            fizzdex::Hash256 secret_hash{};
            if (step.contains("secret_hash")) {
                secret_hash = get_id(step, "secret_hash");
            } else {
                int32_t rc = dex_.swaps().hash_secret(get_secret(step), secret_hash);
                if (rc != fizzdex::errors::OK) return status(rc);
            }
            fizzdex::SwapId id{};
            json out = status(dex_.initiate_swap(get_id(step, "caller"), get_id(step, "participant"),
                                                 get_id(step, "asset"), get_u64(step, "amount"),
                                                 secret_hash, get_i64(step, "timelock"), &id));
            if (out["status"] == fizzdex::errors::OK) {
                out["swap_id"] = hex_id(id);
                out["secret_hash"] = hex_id(secret_hash);
            }
            return out;
        }
        if (op == "complete") {
            return status(dex_.complete_swap(get_id(step, "caller"), swap_ref(step), get_secret(step)));
        }
        if (op == "refund") {
            return status(dex_.refund_swap(get_id(step, "caller"), swap_ref(step)));
        }

        // Reward game
        if (op == "play") {
            const int64_t number = get_i64(step, "number");
            if (number < 0 || number > 255) return status(fizzdex::errors::INVALID_NUMBER);
            auto r = dex_.play(get_id(step, "caller"), static_cast<uint8_t>(number));
            json out = status(r.status);
            if (r.ok()) {
                out["tier"] = fizzdex::tier_name(r.tier);
                out["reward"] = r.reward;
            }
            return out;
        }
        if (op == "claim") {
            auto r = dex_.claim(get_id(step, "caller"));
            json out = status(r.status);
            if (r.ok()) out["amount"] = r.amount;
            return out;
        }

        // Queries
        if (op == "balance") {
            json out = status(fizzdex::errors::OK);
            out["balance"] = ledger_.balance_of(get_id(step, "asset"), get_id(step, "owner"));
            return out;
        }
        if (op == "pool") {
            auto p = dex_.pools().get_pool(pool_ref(step));
            if (!p) return status(fizzdex::errors::POOL_NOT_FOUND);
            json out = status(fizzdex::errors::OK);
            out["pool"] = pool_json(*p);
            return out;
        }
        if (op == "swap_info") {
            auto s = dex_.swaps().get_swap(swap_ref(step));
            if (!s) return status(fizzdex::errors::SWAP_NOT_FOUND);
            json out = status(fizzdex::errors::OK);
            out["swap"] = swap_json(*s);
            return out;
        }
        if (op == "player") {
            auto p = dex_.game().get_player(get_id(step, "player"));
            if (!p) return status(fizzdex::errors::NO_REWARDS);
            json out = status(fizzdex::errors::OK);
            out["player"] = player_json(*p);
            return out;
        }
        if (op == "stats") {
            const auto stats = dex_.get_stats();
            json out = status(fizzdex::errors::OK);
            out["market"] = {
                {"initialized", stats.market.initialized},
                {"paused", stats.market.paused},
                {"fee_bps", stats.market.fee_bps},
                {"total_volume", fizzdex::u128_to_string(stats.market.total_volume)},
                {"total_players", stats.market.total_players}
            };
            out["pools"] = {
                {"total_pools", stats.pool_stats.total_pools},
                {"total_swaps", stats.pool_stats.total_swaps},
                {"total_liquidity_ops", stats.pool_stats.total_liquidity_ops}
            };
            out["atomic_swaps"] = {
                {"total", stats.swap_stats.total_swaps},
                {"open", stats.swap_stats.open_swaps},
                {"completed", stats.swap_stats.completed_swaps},
                {"refunded", stats.swap_stats.refunded_swaps}
            };
            out["game"] = {
                {"total_players", stats.game_stats.total_players},
                {"total_plays", stats.game_stats.total_plays},
                {"total_pending", fizzdex::u128_to_string(stats.game_stats.total_pending)},
                {"total_claimed", fizzdex::u128_to_string(stats.game_stats.total_claimed)}
            };
            return out;
        }

        throw std::runtime_error("unknown op '" + op + "'");
    }
};

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "FizzDex scenario runner " << fizzdex::FizzDex::version() << "\n\n"
              << "Usage: " << prog << " [options] [scenario.json|-]\n\n"
              << "Options:\n"
              << "  -c, --config <file>  JSON config (fee_bps, hashlock_digest, game, log_level)\n"
              << "  -v, --verbose        Debug logging to stderr\n"
              << "  -h, --help           Show this help message\n\n"
              << "Ops:\n"
              << "  credit fund_rewards set_time advance\n"
              << "  initialize set_pause set_fee\n"
              << "  create_pool add_liquidity remove_liquidity swap quote\n"
              << "  initiate complete refund\n"
              << "  play claim\n"
              << "  balance pool swap_info player stats\n\n"
              << "Examples:\n"
              << "  " << prog << " scenario.json\n"
              << "  " << prog << " -c fizzdex.json -v - < scenario.json\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-" || arg[0] != '-') {
            options.scenario_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    return options;
}

json read_scenario(const std::string& path) {
    std::stringstream buffer;
    if (path == "-") {
        buffer << std::cin.rdbuf();
    } else {
        std::ifstream file{path};
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open scenario file: " + path);
        }
        buffer << file.rdbuf();
    }
    return json::parse(buffer.str());
}

}  // namespace

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);

    try {
        fizzdex::Config config;
        if (!options.config_path.empty()) {
            config = fizzdex::Config::from_file(options.config_path);
        }
        fizzdex::set_log_level(options.verbose ? fizzdex::LogLevel::DEBUG
                                               : fizzdex::parse_log_level(config.log_level));

        json scenario = read_scenario(options.scenario_path);

        ScenarioRunner runner(config);
        json results = json::array();
        bool clean = runner.run(scenario, results);

        std::cout << results.dump(2) << "\n";
        return clean ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
