#ifndef FIZZDEX_LEDGER_HPP
#define FIZZDEX_LEDGER_HPP

#include <map>
#include <shared_mutex>
#include <optional>
#include <utility>
#include <vector>

#include "types.hpp"

namespace fizzdex {

// =============================================================================
// Ledger Adapter Interface
//
// Every operation applies fully or fails with no effect. Returns
// errors::OK or a negative error code.
// =============================================================================

class ILedger {
public:
    virtual ~ILedger() = default;

    virtual int32_t transfer(const AssetId& asset, const Address& from,
                             const Address& to, uint64_t amount) = 0;

    virtual int32_t mint(const AssetId& asset, const Address& to,
                         uint64_t amount, const Address& mint_authority) = 0;

    virtual int32_t burn(const AssetId& asset, const Address& from, uint64_t amount) = 0;

    virtual uint64_t balance_of(const AssetId& asset, const Address& owner) const = 0;
};

// =============================================================================
// TokenLedger - in-memory fungible balances
// =============================================================================

class TokenLedger : public ILedger {
public:
    TokenLedger() = default;
    ~TokenLedger() override = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    int32_t transfer(const AssetId& asset, const Address& from,
                     const Address& to, uint64_t amount) override;

    // Authority is bound on the first mint of an asset unless set up front
    int32_t mint(const AssetId& asset, const Address& to,
                 uint64_t amount, const Address& mint_authority) override;

    int32_t burn(const AssetId& asset, const Address& from, uint64_t amount) override;

    uint64_t balance_of(const AssetId& asset, const Address& owner) const override;

    // Genesis / faucet issuance, bypasses mint authority
    int32_t credit(const AssetId& asset, const Address& to, uint64_t amount);

    int32_t set_mint_authority(const AssetId& asset, const Address& authority);
    std::optional<Address> mint_authority(const AssetId& asset) const;

    uint64_t total_supply(const AssetId& asset) const;

    struct Stats {
        uint64_t total_accounts;
        uint64_t total_assets;
        uint64_t total_transfers;
    };
    Stats get_stats() const;

private:
    using BalanceKey = std::pair<AssetId, Address>;

    std::map<BalanceKey, uint64_t> balances_;
    std::map<AssetId, uint64_t> supply_;
    std::map<AssetId, Address> authorities_;
    uint64_t total_transfers_{0};
    mutable std::shared_mutex mutex_;

    // Caller holds mutex_ exclusively
    int32_t issue_locked(const AssetId& asset, const Address& to, uint64_t amount);
};

// =============================================================================
// LedgerJournal - scoped all-or-nothing ledger effects
//
// Records each successful step. Unless commit() is called, destruction
// reverses the steps newest-first (transfer -> reverse transfer,
// mint -> burn, burn -> re-mint).
// =============================================================================

class LedgerJournal {
public:
    explicit LedgerJournal(ILedger& ledger) : ledger_(ledger) {}
    ~LedgerJournal();

    LedgerJournal(const LedgerJournal&) = delete;
    LedgerJournal& operator=(const LedgerJournal&) = delete;

    int32_t transfer(const AssetId& asset, const Address& from,
                     const Address& to, uint64_t amount);
    int32_t mint(const AssetId& asset, const Address& to,
                 uint64_t amount, const Address& mint_authority);
    // authority is used to re-mint on rollback
    int32_t burn(const AssetId& asset, const Address& from,
                 uint64_t amount, const Address& mint_authority);

    void commit() { committed_ = true; }

    // Reverses all recorded steps now; returns false if any reversal failed
    bool rollback();

    size_t steps() const { return entries_.size(); }

private:
    enum class Op : uint8_t { TRANSFER, MINT, BURN };

    struct Entry {
        Op op;
        AssetId asset;
        Address from;
        Address to;
        uint64_t amount;
        Address authority;
    };

    ILedger& ledger_;
    std::vector<Entry> entries_;
    bool committed_{false};
};

} // namespace fizzdex

#endif // FIZZDEX_LEDGER_HPP
