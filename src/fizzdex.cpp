// =============================================================================
// fizzdex.cpp - Unified FizzDex Controller
// =============================================================================

#include "fizzdex/fizzdex.hpp"
#include "fizzdex/log.hpp"

namespace fizzdex {

FizzDex::FizzDex(ILedger& ledger, const IClock& clock, const Config& config)
    : config_(config) {
    config_.validate();

    market_ = std::make_unique<MarketState>();
    pools_ = std::make_unique<PoolEngine>(ledger);
    swaps_ = std::make_unique<AtomicSwapEngine>(ledger, clock, HashLock(config_.hashlock_digest));
    game_ = std::make_unique<RewardGame>(ledger, clock, config_.game);

    log_debug("fizzdex ", version(), " ready: hashlock=", config_.hashlock_digest,
              " cooldown=", config_.game.cooldown_seconds, "s");
}

FizzDex::~FizzDex() = default;

int32_t FizzDex::traced(const char* op, int32_t rc) const {
    if (rc != errors::OK) {
        log_debug(op, " failed: ", error_string(rc));
    }
    return rc;
}

// =============================================================================
// Market Administration
// =============================================================================

int32_t FizzDex::initialize(const Address& caller, const AssetId& reward_asset) {
    return initialize(caller, reward_asset, config_.fee_bps);
}

int32_t FizzDex::initialize(const Address& caller, const AssetId& reward_asset, uint16_t fee_bps) {
    return traced("initialize", market_->initialize(caller, reward_asset, fee_bps));
}

int32_t FizzDex::set_pause(const Address& caller, bool paused) {
    return traced("set_pause", market_->set_pause(caller, paused));
}

int32_t FizzDex::set_fee(const Address& caller, uint16_t fee_bps) {
    return traced("set_fee", market_->set_fee(caller, fee_bps));
}

// =============================================================================
// AMM
// =============================================================================

int32_t FizzDex::create_pool(const Address& caller, const AssetId& asset_a,
                             const AssetId& asset_b, PoolId* out_id) {
    return traced("create_pool", pools_->create_pool(*market_, caller, asset_a, asset_b, out_id));
}

LiquidityResult FizzDex::add_liquidity(const Address& caller, const PoolId& pool_id,
                                       uint64_t amount_a, uint64_t amount_b, uint64_t min_lp_out) {
    LiquidityResult r = pools_->add_liquidity(*market_, caller, pool_id, amount_a, amount_b, min_lp_out);
    traced("add_liquidity", r.status);
    return r;
}

LiquidityResult FizzDex::remove_liquidity(const Address& caller, const PoolId& pool_id,
                                          uint64_t lp_amount, uint64_t min_amount_a,
                                          uint64_t min_amount_b) {
    LiquidityResult r = pools_->remove_liquidity(*market_, caller, pool_id, lp_amount,
                                                 min_amount_a, min_amount_b);
    traced("remove_liquidity", r.status);
    return r;
}

SwapResult FizzDex::swap(const Address& caller, const PoolId& pool_id, uint64_t amount_in,
                         uint64_t min_amount_out, bool a_to_b) {
    SwapResult r = pools_->swap(*market_, caller, pool_id, amount_in, min_amount_out, a_to_b);
    traced("swap", r.status);
    return r;
}

SwapQuote FizzDex::quote(const PoolId& pool_id, uint64_t amount_in, bool a_to_b) const {
    return pools_->quote(*market_, pool_id, amount_in, a_to_b);
}

// =============================================================================
// Atomic Swaps
// =============================================================================

int32_t FizzDex::initiate_swap(const Address& initiator, const Address& participant,
                               const AssetId& asset, uint64_t amount,
                               const Hash256& secret_hash, Timestamp timelock,
                               SwapId* out_id) {
    return traced("initiate_swap", swaps_->initiate(initiator, participant, asset, amount,
                                                    secret_hash, timelock, out_id));
}

int32_t FizzDex::complete_swap(const Address& caller, const SwapId& swap_id,
                               const std::vector<uint8_t>& secret) {
    return traced("complete_swap", swaps_->complete(caller, swap_id, secret));
}

int32_t FizzDex::refund_swap(const Address& caller, const SwapId& swap_id) {
    return traced("refund_swap", swaps_->refund(caller, swap_id));
}

// =============================================================================
// Reward Game
// =============================================================================

PlayResult FizzDex::play(const Address& caller, uint8_t number) {
    PlayResult r = game_->play(*market_, caller, number);
    traced("play", r.status);
    return r;
}

ClaimResult FizzDex::claim(const Address& caller) {
    ClaimResult r = game_->claim(*market_, caller);
    traced("claim", r.status);
    return r;
}

// =============================================================================
// Events & Statistics
// =============================================================================

void FizzDex::set_event_listener(EventListener* listener) {
    pools_->set_event_listener(listener);
    swaps_->set_event_listener(listener);
    game_->set_event_listener(listener);
}

FizzDex::GlobalStats FizzDex::get_stats() const {
    return GlobalStats{
        market_->snapshot(),
        pools_->get_stats(),
        swaps_->get_stats(),
        game_->get_stats()
    };
}

} // namespace fizzdex
