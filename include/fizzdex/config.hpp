#ifndef FIZZDEX_CONFIG_HPP
#define FIZZDEX_CONFIG_HPP

#include <string>
#include <string_view>

#include "types.hpp"
#include "crypto.hpp"
#include "game.hpp"

namespace fizzdex {

// Runtime configuration. Loaded from JSON; unknown keys are ignored.
//
//   {
//     "log_level": "info",
//     "fee_bps": 30,
//     "hashlock_digest": "KECCAK-256",
//     "game": { "cooldown_seconds": 60, "fizz_reward": 10000000000,
//               "buzz_reward": 15000000000, "fizzbuzz_reward": 50000000000 }
//   }
struct Config {
    std::string log_level = "info";
    uint16_t fee_bps = fees::DEFAULT_FEE_BPS;
    std::string hashlock_digest = HashLock::KECCAK_256;
    GameRules game;

    // Throw std::runtime_error on unreadable or malformed input and
    // std::invalid_argument on out-of-range values
    static Config from_file(std::string_view path);
    static Config from_json(std::string_view content);

    Config& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    Config& with_fee_bps(uint16_t bps) {
        fee_bps = bps;
        return *this;
    }

    Config& with_hashlock_digest(std::string_view digest) {
        hashlock_digest = std::string(digest);
        return *this;
    }

    Config& with_game_rules(const GameRules& rules) {
        game = rules;
        return *this;
    }

    void validate() const;
};

} // namespace fizzdex

#endif // FIZZDEX_CONFIG_HPP
