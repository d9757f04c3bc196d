#ifndef FIZZDEX_FIZZDEX_HPP
#define FIZZDEX_FIZZDEX_HPP

// =============================================================================
// FizzDex - AMM, atomic swaps and Fizz Caps over one ledger
//
//   MarketState       fee, pause gate, admin, volume, player count
//   PoolEngine        constant-product pools (gated by pause)
//   AtomicSwapEngine  HTLC escrow (not gated)
//   RewardGame        Fizz Caps plays and reward claims (not gated)
//
// =============================================================================

#include <memory>
#include <vector>

#include "types.hpp"
#include "clock.hpp"
#include "ledger.hpp"
#include "events.hpp"
#include "config.hpp"
#include "market.hpp"
#include "pool.hpp"
#include "htlc.hpp"
#include "game.hpp"

namespace fizzdex {

class FizzDex {
public:
    // Throws std::invalid_argument if config does not validate
    FizzDex(ILedger& ledger, const IClock& clock, const Config& config = Config());
    ~FizzDex();

    // Non-copyable
    FizzDex(const FizzDex&) = delete;
    FizzDex& operator=(const FizzDex&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    MarketState& market() { return *market_; }
    const MarketState& market() const { return *market_; }

    PoolEngine& pools() { return *pools_; }
    const PoolEngine& pools() const { return *pools_; }

    AtomicSwapEngine& swaps() { return *swaps_; }
    const AtomicSwapEngine& swaps() const { return *swaps_; }

    RewardGame& game() { return *game_; }
    const RewardGame& game() const { return *game_; }

    const Config& config() const { return config_; }

    // =========================================================================
    // Market Administration
    // =========================================================================

    // Uses the configured fee
    int32_t initialize(const Address& caller, const AssetId& reward_asset);
    int32_t initialize(const Address& caller, const AssetId& reward_asset, uint16_t fee_bps);
    int32_t set_pause(const Address& caller, bool paused);
    int32_t set_fee(const Address& caller, uint16_t fee_bps);

    // =========================================================================
    // AMM
    // =========================================================================

    int32_t create_pool(const Address& caller, const AssetId& asset_a,
                        const AssetId& asset_b, PoolId* out_id = nullptr);
    LiquidityResult add_liquidity(const Address& caller, const PoolId& pool_id,
                                  uint64_t amount_a, uint64_t amount_b, uint64_t min_lp_out);
    LiquidityResult remove_liquidity(const Address& caller, const PoolId& pool_id,
                                     uint64_t lp_amount, uint64_t min_amount_a,
                                     uint64_t min_amount_b);
    SwapResult swap(const Address& caller, const PoolId& pool_id, uint64_t amount_in,
                    uint64_t min_amount_out, bool a_to_b);
    SwapQuote quote(const PoolId& pool_id, uint64_t amount_in, bool a_to_b) const;

    // =========================================================================
    // Atomic Swaps
    // =========================================================================

    int32_t initiate_swap(const Address& initiator, const Address& participant,
                          const AssetId& asset, uint64_t amount,
                          const Hash256& secret_hash, Timestamp timelock,
                          SwapId* out_id = nullptr);
    int32_t complete_swap(const Address& caller, const SwapId& swap_id,
                          const std::vector<uint8_t>& secret);
    int32_t refund_swap(const Address& caller, const SwapId& swap_id);

    // =========================================================================
    // Reward Game
    // =========================================================================

    PlayResult play(const Address& caller, uint8_t number);
    ClaimResult claim(const Address& caller);

    // =========================================================================
    // Events
    // =========================================================================

    // nullptr detaches; the listener must outlive this object
    void set_event_listener(EventListener* listener);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct GlobalStats {
        MarketSnapshot market;
        PoolEngine::Stats pool_stats;
        AtomicSwapEngine::Stats swap_stats;
        RewardGame::Stats game_stats;
    };
    GlobalStats get_stats() const;

    static constexpr const char* version() { return "1.0.0"; }

    struct ComponentInfo {
        const char* name;
        const char* description;
    };
    static std::vector<ComponentInfo> components() {
        return {
            {"MarketState",      "Fee, pause gate and aggregate counters"},
            {"PoolEngine",       "Constant-product AMM pools"},
            {"AtomicSwapEngine", "Hash-time-locked escrow"},
            {"RewardGame",       "Fizz Caps plays and reward claims"},
        };
    }

private:
    Config config_;

    std::unique_ptr<MarketState> market_;
    std::unique_ptr<PoolEngine> pools_;
    std::unique_ptr<AtomicSwapEngine> swaps_;
    std::unique_ptr<RewardGame> game_;

    // Logs a failed call at debug level, passes rc through
    int32_t traced(const char* op, int32_t rc) const;
};

} // namespace fizzdex

#endif // FIZZDEX_FIZZDEX_HPP
