// =============================================================================
// market.cpp - Global Market State
// =============================================================================

#include "fizzdex/market.hpp"
#include "fizzdex/log.hpp"

#include <mutex>

namespace fizzdex {

int32_t MarketState::initialize(const Address& caller, const AssetId& reward_asset,
                                uint16_t fee_bps) {
    if (fee_bps > fees::MAX_FEE_BPS) {
        return errors::FEE_TOO_HIGH;
    }

    std::unique_lock lock(mutex_);
    if (initialized_) {
        return errors::ALREADY_EXISTS;
    }

    initialized_ = true;
    admin_ = caller;
    reward_asset_ = reward_asset;
    fee_bps_ = fee_bps;
    total_volume_ = 0;
    total_players_ = 0;
    paused_ = false;

    log_info("market initialized: admin=", short_hex(caller), " fee_bps=", fee_bps);
    return errors::OK;
}

int32_t MarketState::set_pause(const Address& caller, bool paused) {
    std::unique_lock lock(mutex_);
    if (!initialized_) return errors::NOT_INITIALIZED;
    if (caller != admin_) return errors::UNAUTHORIZED;

    paused_ = paused;
    log_info("market ", paused ? "paused" : "unpaused", " by ", short_hex(caller));
    return errors::OK;
}

int32_t MarketState::set_fee(const Address& caller, uint16_t fee_bps) {
    std::unique_lock lock(mutex_);
    if (!initialized_) return errors::NOT_INITIALIZED;
    if (caller != admin_) return errors::UNAUTHORIZED;
    if (fee_bps > fees::MAX_FEE_BPS) return errors::FEE_TOO_HIGH;

    fee_bps_ = fee_bps;
    log_info("market fee set to ", fee_bps, " bps");
    return errors::OK;
}

int32_t MarketState::check_trading(uint16_t& fee_bps) const {
    std::shared_lock lock(mutex_);
    if (!initialized_) return errors::NOT_INITIALIZED;
    if (paused_) return errors::CONTRACT_PAUSED;
    fee_bps = fee_bps_;
    return errors::OK;
}

int32_t MarketState::add_volume(uint64_t amount) {
    std::unique_lock lock(mutex_);
    U128 updated = 0;
    if (!checked::add(total_volume_, static_cast<U128>(amount), updated)) {
        return errors::ARITHMETIC_OVERFLOW;
    }
    total_volume_ = updated;
    return errors::OK;
}

void MarketState::register_player() {
    std::unique_lock lock(mutex_);
    ++total_players_;
}

MarketSnapshot MarketState::snapshot() const {
    std::shared_lock lock(mutex_);
    return MarketSnapshot{
        initialized_, admin_, reward_asset_, fee_bps_,
        total_volume_, total_players_, paused_
    };
}

bool MarketState::initialized() const {
    std::shared_lock lock(mutex_);
    return initialized_;
}

bool MarketState::paused() const {
    std::shared_lock lock(mutex_);
    return paused_;
}

uint16_t MarketState::fee_bps() const {
    std::shared_lock lock(mutex_);
    return fee_bps_;
}

AssetId MarketState::reward_asset() const {
    std::shared_lock lock(mutex_);
    return reward_asset_;
}

U128 MarketState::total_volume() const {
    std::shared_lock lock(mutex_);
    return total_volume_;
}

} // namespace fizzdex
