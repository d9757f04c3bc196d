// =============================================================================
// pool.cpp - Constant-Product Pool Engine
// =============================================================================

#include "fizzdex/pool.hpp"
#include "fizzdex/crypto.hpp"
#include "fizzdex/log.hpp"

#include <mutex>

namespace fizzdex {

// =============================================================================
// Keys
// =============================================================================

namespace pool_keys {

PoolId pool_id(const AssetId& asset_a, const AssetId& asset_b) {
    return KeyBuilder("pool").add(asset_a).add(asset_b).finish();
}

Address vault(const PoolId& pool, const AssetId& asset) {
    return KeyBuilder("pool_vault").add(pool).add(asset).finish();
}

AssetId lp_asset(const PoolId& pool) {
    return KeyBuilder("lp_mint").add(pool).finish();
}

} // namespace pool_keys

// =============================================================================
// PoolGuard - holds a pool's reentrancy flag for the duration of a call
// =============================================================================

class PoolEngine::PoolGuard {
public:
    explicit PoolGuard(PoolEngine& engine) : engine_(engine) {}

    ~PoolGuard() {
        if (pool_ != nullptr) {
            std::unique_lock lock(engine_.pools_mutex_);
            pool_->locked = false;
        }
    }

    PoolGuard(const PoolGuard&) = delete;
    PoolGuard& operator=(const PoolGuard&) = delete;

    // Sets the flag and copies the pool. POOL_NOT_FOUND or LOCKED on failure.
    int32_t acquire(const PoolId& id, Pool& snapshot) {
        std::unique_lock lock(engine_.pools_mutex_);
        auto it = engine_.pools_.find(id);
        if (it == engine_.pools_.end()) {
            return errors::POOL_NOT_FOUND;
        }
        if (it->second.locked) {
            return errors::LOCKED;
        }
        it->second.locked = true;
        pool_ = &it->second;
        snapshot = it->second;
        return errors::OK;
    }

    // Writes the final state and clears the flag in one critical section
    template<typename Fn>
    Pool commit(Fn&& apply) {
        std::unique_lock lock(engine_.pools_mutex_);
        apply(*pool_);
        pool_->locked = false;
        Pool committed = *pool_;
        pool_ = nullptr;
        return committed;
    }

private:
    PoolEngine& engine_;
    Pool* pool_{nullptr};
};

// =============================================================================
// PoolEngine
// =============================================================================

PoolEngine::PoolEngine(ILedger& ledger) : ledger_(ledger) {}

int32_t PoolEngine::create_pool(MarketState& market, const Address& caller,
                                const AssetId& asset_a, const AssetId& asset_b,
                                PoolId* out_id) {
    uint16_t fee_bps = 0;
    int32_t rc = market.check_trading(fee_bps);
    if (rc != errors::OK) return rc;

    if (asset_a == asset_b) {
        return errors::INVALID_ASSET_PAIR;
    }

    PoolId id = pool_keys::pool_id(asset_a, asset_b);
    Pool created{};
    {
        std::unique_lock lock(pools_mutex_);
        if (pools_.count(id) > 0) {
            return errors::ALREADY_EXISTS;
        }

        created.id = id;
        created.asset_a = asset_a;
        created.asset_b = asset_b;
        created.vault_a = pool_keys::vault(id, asset_a);
        created.vault_b = pool_keys::vault(id, asset_b);
        created.lp_asset = pool_keys::lp_asset(id);
        created.reserve_a = 0;
        created.reserve_b = 0;
        created.total_lp_supply = 0;
        created.locked = false;
        pools_.emplace(id, created);
    }

    if (out_id) *out_id = id;

    log_info("pool created: ", short_hex(id), " by ", short_hex(caller));
    if (listener_) listener_->on_pool_created(created);
    return errors::OK;
}

LiquidityResult PoolEngine::add_liquidity(MarketState& market, const Address& caller,
                                          const PoolId& pool_id, uint64_t amount_a,
                                          uint64_t amount_b, uint64_t min_lp_out) {
    LiquidityResult result{errors::OK, 0, 0, 0};

    uint16_t fee_bps = 0;
    result.status = market.check_trading(fee_bps);
    if (result.status != errors::OK) return result;

    PoolGuard guard(*this);
    Pool pool{};
    result.status = guard.acquire(pool_id, pool);
    if (result.status != errors::OK) return result;

    if (amount_a == 0 || amount_b == 0) {
        result.status = errors::INVALID_AMOUNT;
        return result;
    }

    uint64_t lp_out = 0;
    result.status = amm_math::lp_for_deposit(amount_a, amount_b, pool.reserve_a,
                                             pool.reserve_b, pool.total_lp_supply, lp_out);
    if (result.status != errors::OK) return result;

    if (lp_out < min_lp_out) {
        result.status = errors::SLIPPAGE_EXCEEDED;
        return result;
    }

    uint64_t new_reserve_a = 0;
    uint64_t new_reserve_b = 0;
    uint64_t new_supply = 0;
    if (!checked::add(pool.reserve_a, amount_a, new_reserve_a) ||
        !checked::add(pool.reserve_b, amount_b, new_reserve_b) ||
        !checked::add(pool.total_lp_supply, lp_out, new_supply)) {
        result.status = errors::ARITHMETIC_OVERFLOW;
        return result;
    }

    LedgerJournal journal(ledger_);
    result.status = journal.transfer(pool.asset_a, caller, pool.vault_a, amount_a);
    if (result.status != errors::OK) return result;
    result.status = journal.transfer(pool.asset_b, caller, pool.vault_b, amount_b);
    if (result.status != errors::OK) return result;
    result.status = journal.mint(pool.lp_asset, caller, lp_out, pool.id);
    if (result.status != errors::OK) return result;

    Pool committed = guard.commit([&](Pool& p) {
        p.reserve_a = new_reserve_a;
        p.reserve_b = new_reserve_b;
        p.total_lp_supply = new_supply;
    });
    journal.commit();
    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);

    result.amount_a = amount_a;
    result.amount_b = amount_b;
    result.lp_amount = lp_out;

    log_debug("liquidity added: pool=", short_hex(pool_id), " a=", amount_a,
              " b=", amount_b, " lp=", lp_out);
    if (listener_) listener_->on_liquidity_added(committed, caller, amount_a, amount_b, lp_out);
    return result;
}

LiquidityResult PoolEngine::remove_liquidity(MarketState& market, const Address& caller,
                                             const PoolId& pool_id, uint64_t lp_amount,
                                             uint64_t min_amount_a, uint64_t min_amount_b) {
    LiquidityResult result{errors::OK, 0, 0, 0};

    uint16_t fee_bps = 0;
    result.status = market.check_trading(fee_bps);
    if (result.status != errors::OK) return result;

    PoolGuard guard(*this);
    Pool pool{};
    result.status = guard.acquire(pool_id, pool);
    if (result.status != errors::OK) return result;

    if (lp_amount == 0) {
        result.status = errors::INVALID_AMOUNT;
        return result;
    }
    if (lp_amount > pool.total_lp_supply) {
        result.status = errors::INSUFFICIENT_LIQUIDITY;
        return result;
    }

    uint64_t out_a = 0;
    uint64_t out_b = 0;
    result.status = amm_math::amounts_for_burn(lp_amount, pool.reserve_a, pool.reserve_b,
                                               pool.total_lp_supply, out_a, out_b);
    if (result.status != errors::OK) return result;

    if (out_a == 0 || out_b == 0) {
        result.status = errors::INSUFFICIENT_LIQUIDITY;
        return result;
    }
    if (out_a < min_amount_a || out_b < min_amount_b) {
        result.status = errors::SLIPPAGE_EXCEEDED;
        return result;
    }

    // out <= reserve and lp <= supply, so none of these underflow
    uint64_t new_reserve_a = pool.reserve_a - out_a;
    uint64_t new_reserve_b = pool.reserve_b - out_b;
    uint64_t new_supply = pool.total_lp_supply - lp_amount;

    LedgerJournal journal(ledger_);
    result.status = journal.burn(pool.lp_asset, caller, lp_amount, pool.id);
    if (result.status != errors::OK) return result;
    result.status = journal.transfer(pool.asset_a, pool.vault_a, caller, out_a);
    if (result.status != errors::OK) return result;
    result.status = journal.transfer(pool.asset_b, pool.vault_b, caller, out_b);
    if (result.status != errors::OK) return result;

    Pool committed = guard.commit([&](Pool& p) {
        p.reserve_a = new_reserve_a;
        p.reserve_b = new_reserve_b;
        p.total_lp_supply = new_supply;
    });
    journal.commit();
    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);

    result.amount_a = out_a;
    result.amount_b = out_b;
    result.lp_amount = lp_amount;

    log_debug("liquidity removed: pool=", short_hex(pool_id), " a=", out_a,
              " b=", out_b, " lp=", lp_amount);
    if (listener_) listener_->on_liquidity_removed(committed, caller, out_a, out_b, lp_amount);
    return result;
}

SwapResult PoolEngine::swap(MarketState& market, const Address& caller,
                            const PoolId& pool_id, uint64_t amount_in,
                            uint64_t min_amount_out, bool a_to_b) {
    SwapResult result{errors::OK, 0, 0};

    uint16_t fee_bps = 0;
    result.status = market.check_trading(fee_bps);
    if (result.status != errors::OK) return result;

    PoolGuard guard(*this);
    Pool pool{};
    result.status = guard.acquire(pool_id, pool);
    if (result.status != errors::OK) return result;

    if (amount_in == 0) {
        result.status = errors::INVALID_AMOUNT;
        return result;
    }

    const uint64_t reserve_in = a_to_b ? pool.reserve_a : pool.reserve_b;
    const uint64_t reserve_out = a_to_b ? pool.reserve_b : pool.reserve_a;
    const AssetId& asset_in = a_to_b ? pool.asset_a : pool.asset_b;
    const AssetId& asset_out = a_to_b ? pool.asset_b : pool.asset_a;
    const Address& vault_in = a_to_b ? pool.vault_a : pool.vault_b;
    const Address& vault_out = a_to_b ? pool.vault_b : pool.vault_a;

    uint64_t amount_out = 0;
    result.status = amm_math::amount_out(amount_in, reserve_in, reserve_out, fee_bps, amount_out);
    if (result.status != errors::OK) return result;

    if (amount_out < min_amount_out) {
        result.status = errors::SLIPPAGE_EXCEEDED;
        return result;
    }
    if (amount_out >= reserve_out) {
        result.status = errors::INSUFFICIENT_LIQUIDITY;
        return result;
    }

    uint64_t new_reserve_in = 0;
    if (!checked::add(reserve_in, amount_in, new_reserve_in)) {
        result.status = errors::ARITHMETIC_OVERFLOW;
        return result;
    }
    const uint64_t new_reserve_out = reserve_out - amount_out;

    LedgerJournal journal(ledger_);
    result.status = journal.transfer(asset_in, caller, vault_in, amount_in);
    if (result.status != errors::OK) return result;
    result.status = journal.transfer(asset_out, vault_out, caller, amount_out);
    if (result.status != errors::OK) return result;

    result.status = market.add_volume(amount_in);
    if (result.status != errors::OK) return result;

    Pool committed = guard.commit([&](Pool& p) {
        if (a_to_b) {
            p.reserve_a = new_reserve_in;
            p.reserve_b = new_reserve_out;
        } else {
            p.reserve_b = new_reserve_in;
            p.reserve_a = new_reserve_out;
        }
    });
    journal.commit();
    total_swaps_.fetch_add(1, std::memory_order_relaxed);

    result.amount_in = amount_in;
    result.amount_out = amount_out;

    log_debug("swap: pool=", short_hex(pool_id), a_to_b ? " a->b" : " b->a",
              " in=", amount_in, " out=", amount_out);
    if (listener_) listener_->on_swap(committed, caller, a_to_b, amount_in, amount_out);
    return result;
}

SwapQuote PoolEngine::quote(const MarketState& market, const PoolId& pool_id,
                            uint64_t amount_in, bool a_to_b) const {
    SwapQuote q{errors::OK, 0, 0, 0};

    if (!market.initialized()) {
        q.status = errors::NOT_INITIALIZED;
        return q;
    }

    auto pool = get_pool(pool_id);
    if (!pool) {
        q.status = errors::POOL_NOT_FOUND;
        return q;
    }
    if (amount_in == 0) {
        q.status = errors::INVALID_AMOUNT;
        return q;
    }

    const uint16_t fee_bps = market.fee_bps();
    const uint64_t reserve_in = a_to_b ? pool->reserve_a : pool->reserve_b;
    const uint64_t reserve_out = a_to_b ? pool->reserve_b : pool->reserve_a;

    q.status = amm_math::amount_out(amount_in, reserve_in, reserve_out, fee_bps, q.amount_out);
    if (q.status != errors::OK) return q;
    if (q.amount_out >= reserve_out) {
        q.status = errors::INSUFFICIENT_LIQUIDITY;
        q.amount_out = 0;
        return q;
    }

    q.fee_amount = static_cast<uint64_t>(
        static_cast<U128>(amount_in) * fee_bps / fees::BPS_DENOMINATOR);

    // Spot output at the current price, fee included, no curve movement
    U128 ideal_out = 0;
    if (reserve_in > 0) {
        U128 spot_numerator = 0;
        U128 after_fee = static_cast<U128>(amount_in) * (fees::BPS_DENOMINATOR - fee_bps);
        if (!checked::mul(after_fee, reserve_out, spot_numerator)) {
            q.status = errors::ARITHMETIC_OVERFLOW;
            q.amount_out = 0;
            return q;
        }
        ideal_out = spot_numerator / (static_cast<U128>(reserve_in) * fees::BPS_DENOMINATOR);
    }
    if (ideal_out > q.amount_out) {
        U128 realized_bps = static_cast<U128>(q.amount_out) * fees::BPS_DENOMINATOR / ideal_out;
        q.price_impact_bps = static_cast<uint32_t>(fees::BPS_DENOMINATOR - realized_bps);
    }
    return q;
}

// =============================================================================
// Query Operations
// =============================================================================

std::optional<Pool> PoolEngine::get_pool(const PoolId& pool_id) const {
    std::shared_lock lock(pools_mutex_);
    auto it = pools_.find(pool_id);
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

bool PoolEngine::pool_exists(const PoolId& pool_id) const {
    std::shared_lock lock(pools_mutex_);
    return pools_.count(pool_id) > 0;
}

std::vector<Pool> PoolEngine::pools() const {
    std::shared_lock lock(pools_mutex_);
    std::vector<Pool> out;
    out.reserve(pools_.size());
    for (const auto& [id, pool] : pools_) {
        out.push_back(pool);
    }
    return out;
}

PoolEngine::Stats PoolEngine::get_stats() const {
    std::shared_lock lock(pools_mutex_);
    return Stats{
        static_cast<uint64_t>(pools_.size()),
        total_swaps_.load(std::memory_order_relaxed),
        total_liquidity_ops_.load(std::memory_order_relaxed)
    };
}

} // namespace fizzdex
