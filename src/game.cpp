// =============================================================================
// game.cpp - Fizz Caps reward game
// =============================================================================

#include "fizzdex/game.hpp"
#include "fizzdex/crypto.hpp"
#include "fizzdex/log.hpp"

#include <mutex>

namespace fizzdex {

const char* tier_name(Tier tier) {
    switch (tier) {
        case Tier::NONE: return "none";
        case Tier::FIZZ: return "fizz";
        case Tier::BUZZ: return "buzz";
        case Tier::FIZZBUZZ: return "fizzbuzz";
    }
    return "unknown";
}

RewardGame::RewardGame(ILedger& ledger, const IClock& clock, GameRules rules)
    : ledger_(ledger)
    , clock_(clock)
    , rules_(rules) {}

Address RewardGame::reward_vault(const AssetId& reward_asset) {
    return KeyBuilder("reward_vault").add(reward_asset).finish();
}

PlayResult RewardGame::play(MarketState& market, const Address& caller, uint8_t number) {
    const Timestamp now = clock_.now();
    PlayResult result{errors::OK, Tier::NONE, 0};

    if (number < 1 || number > 100) {
        result.status = errors::INVALID_NUMBER;
        return result;
    }

    bool created = false;
    {
        std::unique_lock lock(players_mutex_);

        // A new player starts from last_play_time == 0, so the cooldown
        // applies to the first play as well
        auto it = players_.find(caller);
        PlayerState state{};
        if (it != players_.end()) {
            state = it->second;
        } else {
            state.player = caller;
            created = true;
        }

        Timestamp ready_at = 0;
        if (!checked::add(state.last_play_time, rules_.cooldown_seconds, ready_at)) {
            result.status = errors::ARITHMETIC_OVERFLOW;
            return result;
        }
        if (now < ready_at) {
            result.status = errors::COOLDOWN_ACTIVE;
            return result;
        }

        result.tier = rules_.classify(number);
        result.reward = rules_.reward_for(result.tier);

        uint64_t pending = 0;
        if (!checked::add(state.pending_rewards, result.reward, pending)) {
            result.status = errors::ARITHMETIC_OVERFLOW;
            return result;
        }

        state.pending_rewards = pending;
        state.last_play_time = now;
        ++state.total_plays;
        switch (result.tier) {
            case Tier::FIZZ: ++state.fizz_count; break;
            case Tier::BUZZ: ++state.buzz_count; break;
            case Tier::FIZZBUZZ: ++state.fizzbuzz_count; break;
            case Tier::NONE: break;
        }

        players_[caller] = state;
    }

    if (created) market.register_player();

    log_debug("play: player=", short_hex(caller), " number=", static_cast<int>(number),
              " tier=", tier_name(result.tier), " reward=", result.reward);
    if (listener_) listener_->on_played(caller, number, result.reward);
    return result;
}

ClaimResult RewardGame::claim(MarketState& market, const Address& caller) {
    ClaimResult result{errors::OK, 0};
    AssetId reward_asset{};
    uint64_t total_claimed = 0;

    {
        std::unique_lock lock(players_mutex_);
        auto it = players_.find(caller);
        if (it == players_.end() || it->second.pending_rewards == 0) {
            result.status = errors::NO_REWARDS;
            return result;
        }
        if (it->second.claiming) {
            result.status = errors::LOCKED;
            return result;
        }
        if (!market.initialized()) {
            result.status = errors::NOT_INITIALIZED;
            return result;
        }

        if (!checked::add(it->second.total_claimed, it->second.pending_rewards, total_claimed)) {
            result.status = errors::ARITHMETIC_OVERFLOW;
            return result;
        }

        reward_asset = market.reward_asset();
        result.amount = it->second.pending_rewards;
        it->second.claiming = true;
    }

    int32_t rc = ledger_.transfer(reward_asset, reward_vault(reward_asset), caller, result.amount);

    {
        std::unique_lock lock(players_mutex_);
        PlayerState& state = players_.at(caller);
        state.claiming = false;
        if (rc != errors::OK) {
            result.status = rc;
            result.amount = 0;
            return result;
        }
        // Plays that landed during the transfer keep their rewards
        state.pending_rewards -= result.amount;
        // Only the claim holding the marker writes total_claimed
        state.total_claimed = total_claimed;
    }

    log_info("rewards claimed: player=", short_hex(caller), " amount=", result.amount);
    if (listener_) listener_->on_rewards_claimed(caller, result.amount);
    return result;
}

std::optional<PlayerState> RewardGame::get_player(const Address& player) const {
    std::shared_lock lock(players_mutex_);
    auto it = players_.find(player);
    if (it == players_.end()) return std::nullopt;
    return it->second;
}

RewardGame::Stats RewardGame::get_stats() const {
    std::shared_lock lock(players_mutex_);
    Stats stats{static_cast<uint64_t>(players_.size()), 0, 0, 0};
    for (const auto& [addr, state] : players_) {
        stats.total_plays += state.total_plays;
        stats.total_pending += state.pending_rewards;
        stats.total_claimed += state.total_claimed;
    }
    return stats;
}

} // namespace fizzdex
