// FizzDex - Atomic Swap Engine Tests

#include <catch2/catch.hpp>
#include <fizzdex/htlc.hpp>

#include "test_support.hpp"

using namespace fizzdex;
using namespace fizzdex::testing;

namespace {

constexpr Timestamp START = 1700000000;
constexpr Timestamp TIMELOCK = START + 3600;

struct SwapFixture {
    TokenLedger ledger;
    ScriptedLedger scripted{ledger};
    ManualClock clock{START};
    AtomicSwapEngine engine{scripted, clock};

    const Address alice = addr("alice");
    const Address bob = addr("bob");
    const AssetId usdc = addr("USDC");
    const std::vector<uint8_t> secret = bytes("open sesame");
    Hash256 secret_hash{};

    SwapFixture() {
        REQUIRE(ledger.credit(usdc, alice, 10000) == errors::OK);
        REQUIRE(engine.hash_secret(secret, secret_hash) == errors::OK);
    }

    SwapId open(uint64_t amount = 1000) {
        SwapId id{};
        REQUIRE(engine.initiate(alice, bob, usdc, amount, secret_hash, TIMELOCK, &id) == errors::OK);
        return id;
    }
};

} // namespace

TEST_CASE("Initiating a swap", "[htlc]") {
    SwapFixture f;

    SECTION("Escrows the amount") {
        SwapId id = f.open();
        REQUIRE(id == AtomicSwapEngine::swap_id(f.alice, f.bob, f.usdc, TIMELOCK));

        auto swap = f.engine.get_swap(id);
        REQUIRE(swap.has_value());
        REQUIRE(swap->status() == SwapStatus::OPEN);
        REQUIRE(swap->amount == 1000);
        REQUIRE(swap->escrow != swap->id);
        REQUIRE(f.ledger.balance_of(f.usdc, f.alice) == 9000);
        REQUIRE(f.ledger.balance_of(f.usdc, swap->escrow) == 1000);
    }

    SECTION("Timelock must be in the future") {
        REQUIRE(f.engine.initiate(f.alice, f.bob, f.usdc, 1000, f.secret_hash, START)
                == errors::INVALID_TIMELOCK);
        REQUIRE(f.engine.initiate(f.alice, f.bob, f.usdc, 1000, f.secret_hash, START - 1)
                == errors::INVALID_TIMELOCK);
    }

    SECTION("Timelock is checked before amount") {
        REQUIRE(f.engine.initiate(f.alice, f.bob, f.usdc, 0, f.secret_hash, START)
                == errors::INVALID_TIMELOCK);
        REQUIRE(f.engine.initiate(f.alice, f.bob, f.usdc, 0, f.secret_hash, TIMELOCK)
                == errors::INVALID_AMOUNT);
    }

    SECTION("Same key twice") {
        f.open();
        REQUIRE(f.engine.initiate(f.alice, f.bob, f.usdc, 5, f.secret_hash, TIMELOCK)
                == errors::ALREADY_EXISTS);
        REQUIRE(f.ledger.balance_of(f.usdc, f.alice) == 9000);
    }

    SECTION("Different timelock is a different swap") {
        f.open();
        SwapId second{};
        REQUIRE(f.engine.initiate(f.alice, f.bob, f.usdc, 500, f.secret_hash, TIMELOCK + 1, &second)
                == errors::OK);
        REQUIRE(f.engine.get_stats().total_swaps == 2);
    }

    SECTION("Unfunded initiator stores nothing") {
        REQUIRE(f.engine.initiate(f.bob, f.alice, f.usdc, 1, f.secret_hash, TIMELOCK)
                == errors::INSUFFICIENT_BALANCE);
        REQUIRE_FALSE(f.engine.get_swap(AtomicSwapEngine::swap_id(f.bob, f.alice, f.usdc, TIMELOCK)));
    }

    SECTION("Concurrent initiate of the same key") {
        int32_t inner = errors::OK;
        f.scripted.before_next_call([&] {
            inner = f.engine.initiate(f.alice, f.bob, f.usdc, 1000, f.secret_hash, TIMELOCK);
        });
        f.open();
        REQUIRE(inner == errors::ALREADY_EXISTS);
        REQUIRE(f.ledger.balance_of(f.usdc, f.alice) == 9000);
    }
}

TEST_CASE("Completing a swap", "[htlc]") {
    SwapFixture f;
    SwapId id = f.open();
    const Address escrow = f.engine.get_swap(id)->escrow;

    SECTION("Participant with the secret is paid") {
        REQUIRE(f.engine.complete(f.bob, id, f.secret) == errors::OK);
        REQUIRE(f.ledger.balance_of(f.usdc, f.bob) == 1000);
        REQUIRE(f.ledger.balance_of(f.usdc, escrow) == 0);

        auto swap = f.engine.get_swap(id);
        REQUIRE(swap->status() == SwapStatus::COMPLETED);
        REQUIRE(swap->secret == f.secret);
    }

    SECTION("Wrong secret leaves the escrow untouched") {
        REQUIRE(f.engine.complete(f.bob, id, bytes("open barley")) == errors::INVALID_SECRET);
        REQUIRE(f.ledger.balance_of(f.usdc, escrow) == 1000);
        REQUIRE(f.engine.get_swap(id)->status() == SwapStatus::OPEN);
    }

    SECTION("Secret is checked before the caller") {
        REQUIRE(f.engine.complete(f.alice, id, bytes("wrong")) == errors::INVALID_SECRET);
        REQUIRE(f.engine.complete(f.alice, id, f.secret) == errors::UNAUTHORIZED);
    }

    SECTION("Repeated completion") {
        REQUIRE(f.engine.complete(f.bob, id, f.secret) == errors::OK);
        REQUIRE(f.engine.complete(f.bob, id, f.secret) == errors::ALREADY_COMPLETED);
        f.clock.set(TIMELOCK + 1);
        REQUIRE(f.engine.refund(f.alice, id) == errors::ALREADY_COMPLETED);
        REQUIRE(f.ledger.balance_of(f.usdc, f.bob) == 1000);
    }

    SECTION("Allowed after the timelock if not refunded") {
        f.clock.set(TIMELOCK + 100);
        REQUIRE(f.engine.complete(f.bob, id, f.secret) == errors::OK);
    }

    SECTION("Unknown swap") {
        REQUIRE(f.engine.complete(f.bob, addr("nope"), f.secret) == errors::SWAP_NOT_FOUND);
    }

    SECTION("Failed payout keeps the swap open") {
        f.scripted.fail_call(0, errors::INSUFFICIENT_BALANCE);
        REQUIRE(f.engine.complete(f.bob, id, f.secret) == errors::INSUFFICIENT_BALANCE);
        auto swap = f.engine.get_swap(id);
        REQUIRE(swap->status() == SwapStatus::OPEN);
        REQUIRE_FALSE(swap->settling);
        REQUIRE(swap->secret.empty());
        REQUIRE(f.engine.complete(f.bob, id, f.secret) == errors::OK);
    }

    SECTION("Terminal call in flight locks out a second one") {
        int32_t inner = errors::OK;
        f.scripted.before_next_call([&] {
            inner = f.engine.complete(f.bob, id, f.secret);
        });
        REQUIRE(f.engine.complete(f.bob, id, f.secret) == errors::OK);
        REQUIRE(inner == errors::LOCKED);
        REQUIRE(f.ledger.balance_of(f.usdc, f.bob) == 1000);
    }
}

TEST_CASE("Refunding a swap", "[htlc]") {
    SwapFixture f;
    SwapId id = f.open();

    SECTION("Not before the timelock") {
        REQUIRE(f.engine.refund(f.alice, id) == errors::TIMELOCK_NOT_EXPIRED);
        f.clock.set(TIMELOCK);
        REQUIRE(f.engine.refund(f.alice, id) == errors::TIMELOCK_NOT_EXPIRED);
        REQUIRE(f.ledger.balance_of(f.usdc, f.alice) == 9000);
    }

    SECTION("Initiator reclaims after expiry") {
        f.clock.set(TIMELOCK + 1);
        REQUIRE(f.engine.refund(f.alice, id) == errors::OK);
        REQUIRE(f.ledger.balance_of(f.usdc, f.alice) == 10000);
        REQUIRE(f.engine.get_swap(id)->status() == SwapStatus::REFUNDED);

        REQUIRE(f.engine.refund(f.alice, id) == errors::ALREADY_REFUNDED);
        REQUIRE(f.engine.complete(f.bob, id, f.secret) == errors::ALREADY_REFUNDED);
    }

    SECTION("Only the initiator") {
        f.clock.set(TIMELOCK + 1);
        REQUIRE(f.engine.refund(f.bob, id) == errors::UNAUTHORIZED);
    }

    SECTION("Caller is checked before the timelock") {
        REQUIRE(f.engine.refund(f.bob, id) == errors::UNAUTHORIZED);
    }
}

TEST_CASE("Swap queries", "[htlc]") {
    SwapFixture f;
    const AssetId sol = addr("SOL");
    REQUIRE(f.ledger.credit(sol, f.bob, 50) == errors::OK);

    SwapId leg_a = f.open();
    SwapId leg_b{};
    REQUIRE(f.engine.initiate(f.bob, f.alice, sol, 50, f.secret_hash, TIMELOCK - 1800, &leg_b)
            == errors::OK);

    SECTION("Both legs share the hashlock") {
        auto legs = f.engine.find_by_secret_hash(f.secret_hash);
        REQUIRE(legs.size() == 2);
        REQUIRE(f.engine.find_by_secret_hash(addr("other")).empty());
    }

    SECTION("Revealed secret settles the counterpart leg") {
        REQUIRE(f.engine.complete(f.alice, leg_b, f.secret) == errors::OK);
        auto revealed = f.engine.get_swap(leg_b)->secret;
        REQUIRE(f.engine.complete(f.bob, leg_a, revealed) == errors::OK);
        REQUIRE(f.ledger.balance_of(sol, f.alice) == 50);
        REQUIRE(f.ledger.balance_of(f.usdc, f.bob) == 1000);
    }

    SECTION("Stats") {
        REQUIRE(f.engine.complete(f.bob, leg_a, f.secret) == errors::OK);
        auto stats = f.engine.get_stats();
        REQUIRE(stats.total_swaps == 2);
        REQUIRE(stats.open_swaps == 1);
        REQUIRE(stats.completed_swaps == 1);
        REQUIRE(stats.refunded_swaps == 0);
        REQUIRE(u128_to_string(stats.total_escrowed) == "1050");
    }
}

TEST_CASE("Configurable hashlock", "[htlc]") {
    TokenLedger ledger;
    ManualClock clock{START};
    AtomicSwapEngine engine{ledger, clock, HashLock("SHA3-256")};
    RecordingListener listener;
    engine.set_event_listener(&listener);

    const Address alice = addr("alice");
    const Address bob = addr("bob");
    const AssetId usdc = addr("USDC");
    REQUIRE(ledger.credit(usdc, alice, 100) == errors::OK);

    const auto secret = bytes("sha3 secret");
    Hash256 sha3_hash{};
    REQUIRE(engine.hash_secret(secret, sha3_hash) == errors::OK);
    REQUIRE(sha3_hash != sha256("sha3 secret"));

    SwapId id{};
    REQUIRE(engine.initiate(alice, bob, usdc, 100, sha256("sha3 secret"), TIMELOCK, &id) == errors::OK);
    REQUIRE(engine.complete(bob, id, secret) == errors::INVALID_SECRET);

    SwapId good{};
    REQUIRE(ledger.credit(usdc, alice, 100) == errors::OK);
    REQUIRE(engine.initiate(alice, bob, usdc, 100, sha3_hash, TIMELOCK + 1, &good) == errors::OK);
    REQUIRE(engine.complete(bob, good, secret) == errors::OK);

    REQUIRE(listener.swaps_initiated == 2);
    REQUIRE(listener.swaps_completed == 1);
    REQUIRE(listener.last_secret == secret);
}

TEST_CASE("Default hashlock settles an EVM-locked leg", "[htlc]") {
    TokenLedger ledger;
    ManualClock clock{START};
    AtomicSwapEngine engine{ledger, clock};

    const Address alice = addr("alice");
    const Address bob = addr("bob");
    const AssetId usdc = addr("USDC");
    REQUIRE(ledger.credit(usdc, alice, 100) == errors::OK);

    // keccak256("hello") as computed by the counterpart EVM contract
    Hash256 evm_hash{};
    REQUIRE(from_hex("1c8aff950685c2ed4bc3174f3472287b56d9517b9c948127319a09a7a36deac8", evm_hash));
    REQUIRE(engine.hashlock().algorithm() == "KECCAK-256");

    SwapId id{};
    REQUIRE(engine.initiate(alice, bob, usdc, 100, evm_hash, TIMELOCK, &id) == errors::OK);
    REQUIRE(engine.complete(bob, id, bytes("hello")) == errors::OK);
    REQUIRE(ledger.balance_of(usdc, bob) == 100);
    REQUIRE(engine.get_swap(id)->status() == SwapStatus::COMPLETED);
}
