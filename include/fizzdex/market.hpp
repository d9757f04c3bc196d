#ifndef FIZZDEX_MARKET_HPP
#define FIZZDEX_MARKET_HPP

#include <shared_mutex>

#include "types.hpp"

namespace fizzdex {

// =============================================================================
// Global Market State (singleton record)
// =============================================================================

struct MarketSnapshot {
    bool initialized;
    Address admin;
    AssetId reward_asset;
    uint16_t fee_bps;
    U128 total_volume;
    uint64_t total_players;
    bool paused;
};

// =============================================================================
// MarketState - fee, pause gate, aggregate counters
//
// Passed explicitly into every pool engine call as the market context.
// =============================================================================

class MarketState {
public:
    MarketState() = default;

    // Non-copyable
    MarketState(const MarketState&) = delete;
    MarketState& operator=(const MarketState&) = delete;

    // Once only; caller becomes administrator
    int32_t initialize(const Address& caller, const AssetId& reward_asset, uint16_t fee_bps);

    int32_t set_pause(const Address& caller, bool paused);
    int32_t set_fee(const Address& caller, uint16_t fee_bps);

    // Gate for AMM mutations: OK, NOT_INITIALIZED or CONTRACT_PAUSED.
    // fee_bps receives the fee snapshot for the call.
    int32_t check_trading(uint16_t& fee_bps) const;

    int32_t add_volume(uint64_t amount);
    void register_player();

    MarketSnapshot snapshot() const;

    bool initialized() const;
    bool paused() const;
    uint16_t fee_bps() const;
    AssetId reward_asset() const;
    U128 total_volume() const;

private:
    bool initialized_{false};
    Address admin_{};
    AssetId reward_asset_{};
    uint16_t fee_bps_{0};
    U128 total_volume_{0};
    uint64_t total_players_{0};
    bool paused_{false};
    mutable std::shared_mutex mutex_;
};

} // namespace fizzdex

#endif // FIZZDEX_MARKET_HPP
