#ifndef FIZZDEX_GAME_HPP
#define FIZZDEX_GAME_HPP

#include <map>
#include <shared_mutex>
#include <optional>

#include "types.hpp"
#include "clock.hpp"
#include "ledger.hpp"
#include "market.hpp"
#include "events.hpp"

namespace fizzdex {

// =============================================================================
// Reward Game ("Fizz Caps")
// =============================================================================

enum class Tier : uint8_t {
    NONE = 0,
    FIZZ = 1,       // multiple of 3
    BUZZ = 2,       // multiple of 5
    FIZZBUZZ = 3    // multiple of 15
};

const char* tier_name(Tier tier);

struct GameRules {
    Timestamp cooldown_seconds = 60;
    uint64_t fizz_reward = 10'000'000'000ULL;
    uint64_t buzz_reward = 15'000'000'000ULL;
    uint64_t fizzbuzz_reward = 50'000'000'000ULL;

    Tier classify(uint8_t number) const {
        if (number % 15 == 0) return Tier::FIZZBUZZ;
        if (number % 3 == 0) return Tier::FIZZ;
        if (number % 5 == 0) return Tier::BUZZ;
        return Tier::NONE;
    }

    uint64_t reward_for(Tier tier) const {
        switch (tier) {
            case Tier::FIZZ: return fizz_reward;
            case Tier::BUZZ: return buzz_reward;
            case Tier::FIZZBUZZ: return fizzbuzz_reward;
            case Tier::NONE: break;
        }
        return 0;
    }
};

struct PlayerState {
    Address player;
    uint64_t total_plays;
    uint64_t fizz_count;
    uint64_t buzz_count;
    uint64_t fizzbuzz_count;
    uint64_t pending_rewards;
    uint64_t total_claimed;
    Timestamp last_play_time;   // 0 until the first play
    bool claiming;              // A claim transfer is in flight
};

struct PlayResult {
    int32_t status;
    Tier tier;
    uint64_t reward;

    bool ok() const { return status == errors::OK; }
};

struct ClaimResult {
    int32_t status;
    uint64_t amount;

    bool ok() const { return status == errors::OK; }
};

class RewardGame {
public:
    RewardGame(ILedger& ledger, const IClock& clock, GameRules rules = GameRules());
    ~RewardGame() = default;

    // Non-copyable
    RewardGame(const RewardGame&) = delete;
    RewardGame& operator=(const RewardGame&) = delete;

    // number must be 1..=100; one play per cooldown window
    PlayResult play(MarketState& market, const Address& caller, uint8_t number);

    // Pays pending rewards out of the reward vault
    ClaimResult claim(MarketState& market, const Address& caller);

    std::optional<PlayerState> get_player(const Address& player) const;

    static Address reward_vault(const AssetId& reward_asset);

    const GameRules& rules() const { return rules_; }

    void set_event_listener(EventListener* listener) { listener_ = listener; }

    struct Stats {
        uint64_t total_players;
        uint64_t total_plays;
        U128 total_pending;
        U128 total_claimed;
    };
    Stats get_stats() const;

private:
    ILedger& ledger_;
    const IClock& clock_;
    GameRules rules_;

    std::map<Address, PlayerState> players_;
    mutable std::shared_mutex players_mutex_;

    EventListener* listener_{nullptr};
};

} // namespace fizzdex

#endif // FIZZDEX_GAME_HPP
