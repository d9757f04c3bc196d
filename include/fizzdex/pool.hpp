#ifndef FIZZDEX_POOL_HPP
#define FIZZDEX_POOL_HPP

#include <map>
#include <shared_mutex>
#include <optional>
#include <vector>
#include <atomic>
#include <algorithm>

#include "types.hpp"
#include "ledger.hpp"
#include "market.hpp"
#include "events.hpp"

namespace fizzdex {

// =============================================================================
// Pool State (one per ordered asset pair)
// =============================================================================

struct Pool {
    PoolId id;
    AssetId asset_a;
    AssetId asset_b;
    Address vault_a;
    Address vault_b;
    AssetId lp_asset;         // Mint authority is the pool id
    uint64_t reserve_a;
    uint64_t reserve_b;
    uint64_t total_lp_supply;
    bool locked;              // Reentrancy lock

    bool empty() const { return total_lp_supply == 0; }
};

// =============================================================================
// Deterministic Keys
// (A,B) and (B,A) are distinct pools.
// =============================================================================

namespace pool_keys {

PoolId pool_id(const AssetId& asset_a, const AssetId& asset_b);
Address vault(const PoolId& pool, const AssetId& asset);
AssetId lp_asset(const PoolId& pool);

} // namespace pool_keys

// =============================================================================
// Operation Results
// =============================================================================

struct LiquidityResult {
    int32_t status;
    uint64_t amount_a;
    uint64_t amount_b;
    uint64_t lp_amount;       // Minted on add, burned on remove

    bool ok() const { return status == errors::OK; }
};

struct SwapResult {
    int32_t status;
    uint64_t amount_in;
    uint64_t amount_out;

    bool ok() const { return status == errors::OK; }
};

struct SwapQuote {
    int32_t status;
    uint64_t amount_out;
    uint64_t fee_amount;
    uint32_t price_impact_bps;

    bool ok() const { return status == errors::OK; }
};

// =============================================================================
// PoolEngine - constant-product AMM over the ledger adapter
// =============================================================================

class PoolEngine {
public:
    explicit PoolEngine(ILedger& ledger);
    ~PoolEngine() = default;

    // Non-copyable
    PoolEngine(const PoolEngine&) = delete;
    PoolEngine& operator=(const PoolEngine&) = delete;

    // =========================================================================
    // Core Operations (market is the explicit global-state context)
    // =========================================================================

    // Allocate an empty pool for (asset_a, asset_b). No ledger effect.
    int32_t create_pool(MarketState& market, const Address& caller,
                        const AssetId& asset_a, const AssetId& asset_b,
                        PoolId* out_id = nullptr);

    LiquidityResult add_liquidity(MarketState& market, const Address& caller,
                                  const PoolId& pool_id, uint64_t amount_a,
                                  uint64_t amount_b, uint64_t min_lp_out);

    LiquidityResult remove_liquidity(MarketState& market, const Address& caller,
                                     const PoolId& pool_id, uint64_t lp_amount,
                                     uint64_t min_amount_a, uint64_t min_amount_b);

    SwapResult swap(MarketState& market, const Address& caller,
                    const PoolId& pool_id, uint64_t amount_in,
                    uint64_t min_amount_out, bool a_to_b);

    // Read-only preview of swap() at the current reserves and fee
    SwapQuote quote(const MarketState& market, const PoolId& pool_id,
                    uint64_t amount_in, bool a_to_b) const;

    // =========================================================================
    // Query Operations
    // =========================================================================

    std::optional<Pool> get_pool(const PoolId& pool_id) const;
    bool pool_exists(const PoolId& pool_id) const;
    std::vector<Pool> pools() const;

    void set_event_listener(EventListener* listener) { listener_ = listener; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
    };
    Stats get_stats() const;

private:
    class PoolGuard;

    ILedger& ledger_;

    // Pool storage: pool_id -> state (node-based, addresses are stable)
    std::map<PoolId, Pool> pools_;
    mutable std::shared_mutex pools_mutex_;

    EventListener* listener_{nullptr};

    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_liquidity_ops_{0};
};

// =============================================================================
// Constant-Product Math
// All intermediates are 128-bit and checked; rounding is floor.
// =============================================================================

namespace amm_math {

// floor(sqrt(n)) by Newton's method
inline U128 isqrt(U128 n) {
    if (n < 2) return n;
    U128 x = n;
    U128 y = x / 2 + (x & 1);
    while (y < x) {
        x = y;
        y = (x + n / x) / 2;
    }
    return x;
}

// LP tokens for a deposit. First deposit mints sqrt(a*b); later deposits
// mint the smaller of the two proportional shares.
inline int32_t lp_for_deposit(uint64_t amount_a, uint64_t amount_b,
                              uint64_t reserve_a, uint64_t reserve_b,
                              uint64_t total_supply, uint64_t& lp_out) {
    U128 product = 0;
    if (total_supply == 0) {
        if (!checked::mul(amount_a, amount_b, product)) return errors::ARITHMETIC_OVERFLOW;
        if (!checked::to_u64(isqrt(product), lp_out)) return errors::ARITHMETIC_OVERFLOW;
        return errors::OK;
    }

    if (reserve_a == 0 || reserve_b == 0) return errors::DIVISION_BY_ZERO;

    uint64_t share_a = 0;
    uint64_t share_b = 0;
    if (!checked::mul(amount_a, total_supply, product)) return errors::ARITHMETIC_OVERFLOW;
    if (!checked::to_u64(product / reserve_a, share_a)) return errors::ARITHMETIC_OVERFLOW;
    if (!checked::mul(amount_b, total_supply, product)) return errors::ARITHMETIC_OVERFLOW;
    if (!checked::to_u64(product / reserve_b, share_b)) return errors::ARITHMETIC_OVERFLOW;

    lp_out = std::min(share_a, share_b);
    return errors::OK;
}

// out = in*(10000-fee)*reserve_out / (reserve_in*10000 + in*(10000-fee))
inline int32_t amount_out(uint64_t amount_in, uint64_t reserve_in, uint64_t reserve_out,
                          uint16_t fee_bps, uint64_t& out) {
    if (fee_bps > fees::BPS_DENOMINATOR) return errors::ARITHMETIC_OVERFLOW;
    U128 fee_multiplier = fees::BPS_DENOMINATOR - fee_bps;

    U128 amount_in_with_fee = 0;
    U128 numerator = 0;
    U128 scaled_reserve_in = 0;
    U128 denominator = 0;
    if (!checked::mul(amount_in, fee_multiplier, amount_in_with_fee)) return errors::ARITHMETIC_OVERFLOW;
    if (!checked::mul(amount_in_with_fee, reserve_out, numerator)) return errors::ARITHMETIC_OVERFLOW;
    if (!checked::mul(reserve_in, fees::BPS_DENOMINATOR, scaled_reserve_in)) return errors::ARITHMETIC_OVERFLOW;
    if (!checked::add(scaled_reserve_in, amount_in_with_fee, denominator)) return errors::ARITHMETIC_OVERFLOW;
    if (denominator == 0) return errors::DIVISION_BY_ZERO;

    if (!checked::to_u64(numerator / denominator, out)) return errors::ARITHMETIC_OVERFLOW;
    return errors::OK;
}

// Proportional withdrawal for burning lp_amount of total_supply
inline int32_t amounts_for_burn(uint64_t lp_amount, uint64_t reserve_a, uint64_t reserve_b,
                                uint64_t total_supply, uint64_t& out_a, uint64_t& out_b) {
    if (total_supply == 0) return errors::DIVISION_BY_ZERO;

    U128 product = 0;
    if (!checked::mul(lp_amount, reserve_a, product)) return errors::ARITHMETIC_OVERFLOW;
    if (!checked::to_u64(product / total_supply, out_a)) return errors::ARITHMETIC_OVERFLOW;
    if (!checked::mul(lp_amount, reserve_b, product)) return errors::ARITHMETIC_OVERFLOW;
    if (!checked::to_u64(product / total_supply, out_b)) return errors::ARITHMETIC_OVERFLOW;
    return errors::OK;
}

} // namespace amm_math

} // namespace fizzdex

#endif // FIZZDEX_POOL_HPP
