// FizzDex - Pool Engine Tests

#include <catch2/catch.hpp>
#include <fizzdex/pool.hpp>

#include "test_support.hpp"

using namespace fizzdex;
using namespace fizzdex::testing;

namespace {

struct PoolFixture {
    TokenLedger ledger;
    ScriptedLedger scripted{ledger};
    MarketState market;
    PoolEngine engine{scripted};

    const Address admin = addr("admin");
    const Address alice = addr("alice");
    const Address bob = addr("bob");
    const AssetId usdc = addr("USDC");
    const AssetId sol = addr("SOL");
    PoolId pool{};

    PoolFixture() {
        REQUIRE(market.initialize(admin, addr("CAPS"), 30) == errors::OK);
        REQUIRE(ledger.credit(usdc, alice, 10000000) == errors::OK);
        REQUIRE(ledger.credit(sol, alice, 10000000) == errors::OK);
        REQUIRE(engine.create_pool(market, alice, usdc, sol, &pool) == errors::OK);
    }

    Pool state() const { return *engine.get_pool(pool); }
};

} // namespace

TEST_CASE("Pool creation", "[pool]") {
    PoolFixture f;

    SECTION("New pool is empty and unlocked") {
        Pool p = f.state();
        REQUIRE(p.id == pool_keys::pool_id(f.usdc, f.sol));
        REQUIRE(p.vault_a == pool_keys::vault(f.pool, f.usdc));
        REQUIRE(p.lp_asset == pool_keys::lp_asset(f.pool));
        REQUIRE(p.reserve_a == 0);
        REQUIRE(p.reserve_b == 0);
        REQUIRE(p.total_lp_supply == 0);
        REQUIRE_FALSE(p.locked);
        REQUIRE(f.ledger.get_stats().total_transfers == 0);
    }

    SECTION("Duplicate ordered pair") {
        REQUIRE(f.engine.create_pool(f.market, f.bob, f.usdc, f.sol) == errors::ALREADY_EXISTS);
    }

    SECTION("Reverse pair is a separate pool") {
        PoolId reverse{};
        REQUIRE(f.engine.create_pool(f.market, f.bob, f.sol, f.usdc, &reverse) == errors::OK);
        REQUIRE(reverse != f.pool);
        REQUIRE(f.engine.get_stats().total_pools == 2);
    }

    SECTION("Identical assets") {
        REQUIRE(f.engine.create_pool(f.market, f.bob, f.usdc, f.usdc) == errors::INVALID_ASSET_PAIR);
    }

    SECTION("Paused market") {
        REQUIRE(f.market.set_pause(f.admin, true) == errors::OK);
        REQUIRE(f.engine.create_pool(f.market, f.bob, f.sol, f.usdc) == errors::CONTRACT_PAUSED);
    }

    SECTION("Uninitialized market") {
        MarketState fresh;
        REQUIRE(f.engine.create_pool(fresh, f.bob, f.sol, f.usdc) == errors::NOT_INITIALIZED);
    }
}

TEST_CASE("Adding liquidity", "[pool]") {
    PoolFixture f;

    SECTION("First deposit mints sqrt(a*b)") {
        auto r = f.engine.add_liquidity(f.market, f.alice, f.pool, 100, 400, 0);
        REQUIRE(r.ok());
        REQUIRE(r.lp_amount == 200);

        Pool p = f.state();
        REQUIRE(p.reserve_a == 100);
        REQUIRE(p.reserve_b == 400);
        REQUIRE(p.total_lp_supply == 200);
        REQUIRE_FALSE(p.locked);

        REQUIRE(f.ledger.balance_of(p.lp_asset, f.alice) == 200);
        REQUIRE(f.ledger.balance_of(f.usdc, p.vault_a) == 100);
        REQUIRE(f.ledger.balance_of(f.sol, p.vault_b) == 400);
        REQUIRE(f.ledger.mint_authority(p.lp_asset) == f.pool);
    }

    SECTION("Unbalanced deposit is bounded by the scarcer side") {
        REQUIRE(f.engine.add_liquidity(f.market, f.alice, f.pool, 100, 400, 0).ok());
        auto r = f.engine.add_liquidity(f.market, f.alice, f.pool, 50, 400, 0);
        REQUIRE(r.ok());
        REQUIRE(r.lp_amount == 100);

        Pool p = f.state();
        REQUIRE(p.reserve_a == 150);
        REQUIRE(p.reserve_b == 800);
        REQUIRE(p.total_lp_supply == 300);
    }

    SECTION("Slippage leaves no effect") {
        auto r = f.engine.add_liquidity(f.market, f.alice, f.pool, 100, 400, 201);
        REQUIRE(r.status == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(f.state().total_lp_supply == 0);
        REQUIRE(f.ledger.balance_of(f.usdc, f.alice) == 10000000);
    }

    SECTION("Argument checks") {
        REQUIRE(f.engine.add_liquidity(f.market, f.alice, f.pool, 0, 400, 0).status == errors::INVALID_AMOUNT);
        REQUIRE(f.engine.add_liquidity(f.market, f.alice, f.pool, 100, 0, 0).status == errors::INVALID_AMOUNT);
        REQUIRE(f.engine.add_liquidity(f.market, f.alice, addr("nope"), 1, 1, 0).status == errors::POOL_NOT_FOUND);
        REQUIRE_FALSE(f.state().locked);
    }

    SECTION("Paused market") {
        REQUIRE(f.market.set_pause(f.admin, true) == errors::OK);
        REQUIRE(f.engine.add_liquidity(f.market, f.alice, f.pool, 1, 1, 0).status == errors::CONTRACT_PAUSED);
    }

    SECTION("Provider without funds") {
        auto r = f.engine.add_liquidity(f.market, f.bob, f.pool, 100, 400, 0);
        REQUIRE(r.status == errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.state().reserve_a == 0);
        REQUIRE_FALSE(f.state().locked);
    }

    SECTION("Failing mint reverses both transfers") {
        f.scripted.fail_call(2, errors::UNAUTHORIZED);
        auto r = f.engine.add_liquidity(f.market, f.alice, f.pool, 100, 400, 0);
        REQUIRE(r.status == errors::UNAUTHORIZED);

        Pool p = f.state();
        REQUIRE(p.reserve_a == 0);
        REQUIRE(p.reserve_b == 0);
        REQUIRE(p.total_lp_supply == 0);
        REQUIRE_FALSE(p.locked);
        REQUIRE(f.ledger.balance_of(f.usdc, f.alice) == 10000000);
        REQUIRE(f.ledger.balance_of(f.sol, f.alice) == 10000000);
        REQUIRE(f.ledger.balance_of(f.usdc, p.vault_a) == 0);
        REQUIRE(f.ledger.balance_of(f.sol, p.vault_b) == 0);
    }
}

TEST_CASE("Swapping", "[pool]") {
    PoolFixture f;
    REQUIRE(f.engine.add_liquidity(f.market, f.alice, f.pool, 1000000, 1000000, 0).ok());
    REQUIRE(f.ledger.credit(f.usdc, f.bob, 5000) == errors::OK);

    SECTION("1000 A->B at 30 bps yields 996") {
        auto r = f.engine.swap(f.market, f.bob, f.pool, 1000, 996, true);
        REQUIRE(r.ok());
        REQUIRE(r.amount_out == 996);

        Pool p = f.state();
        REQUIRE(p.reserve_a == 1001000);
        REQUIRE(p.reserve_b == 999004);
        REQUIRE(static_cast<U128>(p.reserve_a) * p.reserve_b >=
                static_cast<U128>(1000000) * 1000000);

        REQUIRE(f.ledger.balance_of(f.usdc, f.bob) == 4000);
        REQUIRE(f.ledger.balance_of(f.sol, f.bob) == 996);
        REQUIRE(u128_to_string(f.market.total_volume()) == "1000");
        REQUIRE(f.engine.get_stats().total_swaps == 1);
    }

    SECTION("B->A direction") {
        auto r = f.engine.swap(f.market, f.alice, f.pool, 1000, 0, false);
        REQUIRE(r.ok());
        REQUIRE(r.amount_out == 996);
        REQUIRE(f.state().reserve_b == 1001000);
        REQUIRE(f.state().reserve_a == 999004);
    }

    SECTION("Slippage") {
        auto r = f.engine.swap(f.market, f.bob, f.pool, 1000, 997, true);
        REQUIRE(r.status == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(f.state().reserve_a == 1000000);
        REQUIRE(f.ledger.balance_of(f.usdc, f.bob) == 5000);
        REQUIRE(u128_to_string(f.market.total_volume()) == "0");
    }

    SECTION("Zero amount") {
        REQUIRE(f.engine.swap(f.market, f.bob, f.pool, 0, 0, true).status == errors::INVALID_AMOUNT);
    }

    SECTION("Paused market") {
        REQUIRE(f.market.set_pause(f.admin, true) == errors::OK);
        REQUIRE(f.engine.swap(f.market, f.bob, f.pool, 1000, 0, true).status == errors::CONTRACT_PAUSED);
        REQUIRE(f.market.set_pause(f.admin, false) == errors::OK);
        REQUIRE(f.engine.swap(f.market, f.bob, f.pool, 1000, 0, true).ok());
    }

    SECTION("Failing payout reverses the input transfer") {
        f.scripted.fail_call(1, errors::INSUFFICIENT_BALANCE);
        auto r = f.engine.swap(f.market, f.bob, f.pool, 1000, 0, true);
        REQUIRE(r.status == errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.ledger.balance_of(f.usdc, f.bob) == 5000);
        REQUIRE(f.state().reserve_a == 1000000);
        REQUIRE_FALSE(f.state().locked);
        REQUIRE(u128_to_string(f.market.total_volume()) == "0");
    }

    SECTION("Reentrant call into the same pool is locked out") {
        SwapResult inner{errors::OK, 0, 0};
        f.scripted.before_next_call([&] {
            inner = f.engine.swap(f.market, f.bob, f.pool, 10, 0, true);
        });

        auto outer = f.engine.swap(f.market, f.bob, f.pool, 1000, 0, true);
        REQUIRE(inner.status == errors::LOCKED);
        REQUIRE(outer.ok());
        REQUIRE(outer.amount_out == 996);
        REQUIRE_FALSE(f.state().locked);
    }

    SECTION("Other pools are not blocked") {
        PoolId other{};
        const AssetId eth = addr("ETH");
        REQUIRE(f.ledger.credit(eth, f.alice, 1000) == errors::OK);
        REQUIRE(f.engine.create_pool(f.market, f.alice, eth, f.sol, &other) == errors::OK);

        LiquidityResult inner{errors::OK, 0, 0, 0};
        f.scripted.before_next_call([&] {
            inner = f.engine.add_liquidity(f.market, f.alice, other, 100, 100, 0);
        });
        REQUIRE(f.engine.swap(f.market, f.bob, f.pool, 1000, 0, true).ok());
        REQUIRE(inner.ok());
    }
}

TEST_CASE("Swapping against an empty pool", "[pool]") {
    PoolFixture f;
    auto r = f.engine.swap(f.market, f.alice, f.pool, 1000, 0, true);
    REQUIRE(r.status == errors::INSUFFICIENT_LIQUIDITY);
}

TEST_CASE("Removing liquidity", "[pool]") {
    PoolFixture f;
    REQUIRE(f.engine.add_liquidity(f.market, f.alice, f.pool, 100, 400, 0).ok());
    const AssetId lp = f.state().lp_asset;

    SECTION("Full withdrawal empties the pool") {
        auto r = f.engine.remove_liquidity(f.market, f.alice, f.pool, 200, 100, 400);
        REQUIRE(r.ok());
        REQUIRE(r.amount_a == 100);
        REQUIRE(r.amount_b == 400);

        Pool p = f.state();
        REQUIRE(p.reserve_a == 0);
        REQUIRE(p.reserve_b == 0);
        REQUIRE(p.total_lp_supply == 0);
        REQUIRE(f.ledger.balance_of(lp, f.alice) == 0);
        REQUIRE(f.ledger.total_supply(lp) == 0);
        REQUIRE(f.ledger.balance_of(f.usdc, f.alice) == 10000000);
        REQUIRE(f.ledger.balance_of(f.sol, f.alice) == 10000000);
    }

    SECTION("Partial withdrawal is proportional") {
        auto r = f.engine.remove_liquidity(f.market, f.alice, f.pool, 50, 0, 0);
        REQUIRE(r.ok());
        REQUIRE(r.amount_a == 25);
        REQUIRE(r.amount_b == 100);
        REQUIRE(f.state().total_lp_supply == 150);
    }

    SECTION("More than the supply") {
        auto r = f.engine.remove_liquidity(f.market, f.alice, f.pool, 201, 0, 0);
        REQUIRE(r.status == errors::INSUFFICIENT_LIQUIDITY);
    }

    SECTION("Dust withdrawal") {
        // 1 LP of 200 on reserve_a 100 rounds to 0
        auto r = f.engine.remove_liquidity(f.market, f.alice, f.pool, 1, 0, 0);
        REQUIRE(r.status == errors::INSUFFICIENT_LIQUIDITY);
    }

    SECTION("Minimums") {
        auto r = f.engine.remove_liquidity(f.market, f.alice, f.pool, 200, 101, 0);
        REQUIRE(r.status == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(f.state().total_lp_supply == 200);
    }

    SECTION("Holder without LP tokens") {
        auto r = f.engine.remove_liquidity(f.market, f.bob, f.pool, 100, 0, 0);
        REQUIRE(r.status == errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.state().total_lp_supply == 200);
        REQUIRE_FALSE(f.state().locked);
    }

    SECTION("Failing vault transfer re-mints the burned LP") {
        f.scripted.fail_call(2, errors::INSUFFICIENT_BALANCE);
        auto r = f.engine.remove_liquidity(f.market, f.alice, f.pool, 200, 0, 0);
        REQUIRE(r.status == errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.ledger.balance_of(lp, f.alice) == 200);
        REQUIRE(f.ledger.balance_of(f.usdc, f.state().vault_a) == 100);
        REQUIRE(f.state().reserve_a == 100);
    }
}

TEST_CASE("Quotes", "[pool]") {
    PoolFixture f;
    REQUIRE(f.engine.add_liquidity(f.market, f.alice, f.pool, 1000000, 1000000, 0).ok());

    SECTION("Matches the swap") {
        auto q = f.engine.quote(f.market, f.pool, 1000, true);
        REQUIRE(q.ok());
        REQUIRE(q.amount_out == 996);
        REQUIRE(q.fee_amount == 3);
        REQUIRE(q.price_impact_bps == 11);
        REQUIRE(f.state().reserve_a == 1000000);
    }

    SECTION("Available while paused") {
        REQUIRE(f.market.set_pause(f.admin, true) == errors::OK);
        REQUIRE(f.engine.quote(f.market, f.pool, 1000, true).ok());
    }

    SECTION("Unknown pool and zero amount") {
        REQUIRE(f.engine.quote(f.market, addr("nope"), 1000, true).status == errors::POOL_NOT_FOUND);
        REQUIRE(f.engine.quote(f.market, f.pool, 0, true).status == errors::INVALID_AMOUNT);
    }
}

TEST_CASE("Pool events", "[pool]") {
    PoolFixture f;
    RecordingListener listener;
    f.engine.set_event_listener(&listener);

    REQUIRE(f.engine.create_pool(f.market, f.alice, f.sol, f.usdc) == errors::OK);
    REQUIRE(f.engine.add_liquidity(f.market, f.alice, f.pool, 1000, 1000, 0).ok());
    REQUIRE(f.engine.swap(f.market, f.alice, f.pool, 10, 0, true).ok());
    REQUIRE(f.engine.remove_liquidity(f.market, f.alice, f.pool, 100, 0, 0).ok());
    REQUIRE(f.engine.swap(f.market, f.alice, f.pool, 10, 1000, true).status == errors::SLIPPAGE_EXCEEDED);

    REQUIRE(listener.pools_created == 1);
    REQUIRE(listener.liquidity_added == 1);
    REQUIRE(listener.swaps == 1);
    REQUIRE(listener.liquidity_removed == 1);
    REQUIRE(f.engine.get_stats().total_liquidity_ops == 2);
}
