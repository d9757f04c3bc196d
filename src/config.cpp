// =============================================================================
// config.cpp - JSON configuration
// =============================================================================

#include "fizzdex/config.hpp"
#include "fizzdex/crypto.hpp"
#include "fizzdex/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fizzdex {

namespace {

using json = nlohmann::json;

uint64_t read_unsigned(const json& j, const char* key) {
    const json& v = j.at(key);
    if (!v.is_number_unsigned()) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a non-negative integer");
    }
    return v.get<uint64_t>();
}

std::string read_string(const json& j, const char* key) {
    const json& v = j.at(key);
    if (!v.is_string()) {
        throw std::runtime_error(std::string("config: '") + key + "' must be a string");
    }
    return v.get<std::string>();
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    json doc;
    try {
        doc = json::parse(content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("config: malformed JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw std::runtime_error("config: top level must be an object");
    }

    Config config;

    if (doc.contains("log_level")) {
        config.log_level = read_string(doc, "log_level");
    }
    if (doc.contains("fee_bps")) {
        uint64_t fee = read_unsigned(doc, "fee_bps");
        if (fee > fees::MAX_FEE_BPS) {
            throw std::invalid_argument("config: fee_bps above " + std::to_string(fees::MAX_FEE_BPS));
        }
        config.fee_bps = static_cast<uint16_t>(fee);
    }
    if (doc.contains("hashlock_digest")) {
        config.hashlock_digest = read_string(doc, "hashlock_digest");
    }

    if (doc.contains("game")) {
        const json& game = doc.at("game");
        if (!game.is_object()) {
            throw std::runtime_error("config: 'game' must be an object");
        }
        if (game.contains("cooldown_seconds")) {
            uint64_t cooldown = read_unsigned(game, "cooldown_seconds");
            if (cooldown > static_cast<uint64_t>(std::numeric_limits<Timestamp>::max())) {
                throw std::invalid_argument("config: game.cooldown_seconds out of range");
            }
            config.game.cooldown_seconds = static_cast<Timestamp>(cooldown);
        }
        if (game.contains("fizz_reward")) config.game.fizz_reward = read_unsigned(game, "fizz_reward");
        if (game.contains("buzz_reward")) config.game.buzz_reward = read_unsigned(game, "buzz_reward");
        if (game.contains("fizzbuzz_reward")) config.game.fizzbuzz_reward = read_unsigned(game, "fizzbuzz_reward");
    }

    config.validate();
    return config;
}

void Config::validate() const {
    // Throws std::invalid_argument for an unknown name
    parse_log_level(log_level);

    if (fee_bps > fees::MAX_FEE_BPS) {
        throw std::invalid_argument("config: fee_bps above " + std::to_string(fees::MAX_FEE_BPS));
    }
    if (game.cooldown_seconds < 0) {
        throw std::invalid_argument("config: game.cooldown_seconds is negative");
    }
    if (!HashLock::supported(hashlock_digest)) {
        throw std::invalid_argument("config: unsupported hashlock_digest '" + hashlock_digest + "'");
    }
}

}  // namespace fizzdex
