// FizzDex - Ledger Adapter Tests

#include <catch2/catch.hpp>
#include <fizzdex/ledger.hpp>

#include "test_support.hpp"

using namespace fizzdex;
using namespace fizzdex::testing;

TEST_CASE("TokenLedger transfers", "[ledger]") {
    TokenLedger ledger;
    const AssetId usdc = addr("USDC");
    const Address alice = addr("alice");
    const Address bob = addr("bob");

    REQUIRE(ledger.credit(usdc, alice, 1000) == errors::OK);
    REQUIRE(ledger.balance_of(usdc, alice) == 1000);
    REQUIRE(ledger.total_supply(usdc) == 1000);

    SECTION("Moves balance") {
        REQUIRE(ledger.transfer(usdc, alice, bob, 400) == errors::OK);
        REQUIRE(ledger.balance_of(usdc, alice) == 600);
        REQUIRE(ledger.balance_of(usdc, bob) == 400);
        REQUIRE(ledger.total_supply(usdc) == 1000);
    }

    SECTION("Insufficient balance has no effect") {
        REQUIRE(ledger.transfer(usdc, alice, bob, 1001) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(ledger.transfer(usdc, bob, alice, 1) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(ledger.balance_of(usdc, alice) == 1000);
        REQUIRE(ledger.balance_of(usdc, bob) == 0);
    }

    SECTION("Zero amount is a no-op") {
        REQUIRE(ledger.transfer(usdc, bob, alice, 0) == errors::OK);
        REQUIRE(ledger.balance_of(usdc, alice) == 1000);
    }

    SECTION("Credit rejects zero") {
        REQUIRE(ledger.credit(usdc, bob, 0) == errors::INVALID_AMOUNT);
    }

    SECTION("Stats") {
        REQUIRE(ledger.transfer(usdc, alice, bob, 1) == errors::OK);
        auto stats = ledger.get_stats();
        REQUIRE(stats.total_accounts == 2);
        REQUIRE(stats.total_assets == 1);
        REQUIRE(stats.total_transfers == 1);
    }
}

TEST_CASE("TokenLedger mint authority", "[ledger]") {
    TokenLedger ledger;
    const AssetId lp = addr("LP");
    const Address pool = addr("pool");
    const Address mallory = addr("mallory");
    const Address alice = addr("alice");

    SECTION("First mint binds the authority") {
        REQUIRE(ledger.mint(lp, alice, 10, pool) == errors::OK);
        REQUIRE(ledger.mint_authority(lp) == pool);
        REQUIRE(ledger.mint(lp, mallory, 10, mallory) == errors::UNAUTHORIZED);
        REQUIRE(ledger.balance_of(lp, mallory) == 0);
        REQUIRE(ledger.total_supply(lp) == 10);
    }

    SECTION("Explicit authority") {
        REQUIRE(ledger.set_mint_authority(lp, pool) == errors::OK);
        REQUIRE(ledger.set_mint_authority(lp, mallory) == errors::ALREADY_EXISTS);
        REQUIRE(ledger.mint(lp, alice, 5, mallory) == errors::UNAUTHORIZED);
        REQUIRE(ledger.mint(lp, alice, 5, pool) == errors::OK);
    }

    SECTION("Burn reduces supply") {
        REQUIRE(ledger.mint(lp, alice, 10, pool) == errors::OK);
        REQUIRE(ledger.burn(lp, alice, 4) == errors::OK);
        REQUIRE(ledger.balance_of(lp, alice) == 6);
        REQUIRE(ledger.total_supply(lp) == 6);
        REQUIRE(ledger.burn(lp, alice, 7) == errors::INSUFFICIENT_BALANCE);
    }

    SECTION("Supply overflow is rejected") {
        REQUIRE(ledger.mint(lp, alice, U64_MAX, pool) == errors::OK);
        REQUIRE(ledger.mint(lp, alice, 1, pool) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(ledger.balance_of(lp, alice) == U64_MAX);
    }
}

TEST_CASE("LedgerJournal", "[ledger]") {
    TokenLedger ledger;
    const AssetId usdc = addr("USDC");
    const AssetId lp = addr("LP");
    const Address pool = addr("pool");
    const Address alice = addr("alice");
    const Address vault = addr("vault");

    REQUIRE(ledger.credit(usdc, alice, 100) == errors::OK);

    SECTION("Destruction without commit reverses all steps") {
        {
            LedgerJournal journal(ledger);
            REQUIRE(journal.transfer(usdc, alice, vault, 60) == errors::OK);
            REQUIRE(journal.mint(lp, alice, 30, pool) == errors::OK);
            REQUIRE(journal.steps() == 2);
        }
        REQUIRE(ledger.balance_of(usdc, alice) == 100);
        REQUIRE(ledger.balance_of(usdc, vault) == 0);
        REQUIRE(ledger.balance_of(lp, alice) == 0);
        REQUIRE(ledger.total_supply(lp) == 0);
    }

    SECTION("Commit keeps the effects") {
        {
            LedgerJournal journal(ledger);
            REQUIRE(journal.transfer(usdc, alice, vault, 60) == errors::OK);
            journal.commit();
        }
        REQUIRE(ledger.balance_of(usdc, vault) == 60);
    }

    SECTION("Burn is reversed by a re-mint") {
        REQUIRE(ledger.mint(lp, alice, 50, pool) == errors::OK);
        {
            LedgerJournal journal(ledger);
            REQUIRE(journal.burn(lp, alice, 20, pool) == errors::OK);
        }
        REQUIRE(ledger.balance_of(lp, alice) == 50);
        REQUIRE(ledger.total_supply(lp) == 50);
    }

    SECTION("Failed steps are not recorded") {
        LedgerJournal journal(ledger);
        REQUIRE(journal.transfer(usdc, alice, vault, 500) == errors::INSUFFICIENT_BALANCE);
        REQUIRE(journal.steps() == 0);
    }

    SECTION("Rollback reports a failed reversal") {
        ScriptedLedger scripted(ledger);
        LedgerJournal journal(scripted);
        REQUIRE(journal.transfer(usdc, alice, vault, 10) == errors::OK);
        scripted.fail_call(0, errors::INSUFFICIENT_BALANCE);
        REQUIRE_FALSE(journal.rollback());
        REQUIRE(journal.steps() == 0);
    }
}
