// =============================================================================
// ledger.cpp - In-memory token ledger and undo journal
// =============================================================================

#include "fizzdex/ledger.hpp"
#include "fizzdex/log.hpp"

#include <mutex>
#include <set>

namespace fizzdex {

// =============================================================================
// TokenLedger
// =============================================================================

int32_t TokenLedger::transfer(const AssetId& asset, const Address& from,
                              const Address& to, uint64_t amount) {
    if (amount == 0) return errors::OK;

    std::unique_lock lock(mutex_);

    auto from_it = balances_.find({asset, from});
    if (from_it == balances_.end() || from_it->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    if (from == to) return errors::OK;

    // Check the credit side before debiting so failure leaves no effect
    auto to_it = balances_.find({asset, to});
    uint64_t current_to = (to_it != balances_.end()) ? to_it->second : 0;
    uint64_t new_to = 0;
    if (!checked::add(current_to, amount, new_to)) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    from_it->second -= amount;
    balances_[{asset, to}] = new_to;
    ++total_transfers_;
    return errors::OK;
}

int32_t TokenLedger::mint(const AssetId& asset, const Address& to,
                          uint64_t amount, const Address& mint_authority) {
    std::unique_lock lock(mutex_);

    auto auth_it = authorities_.find(asset);
    if (auth_it == authorities_.end()) {
        authorities_.emplace(asset, mint_authority);
    } else if (auth_it->second != mint_authority) {
        return errors::UNAUTHORIZED;
    }

    if (amount == 0) return errors::OK;
    return issue_locked(asset, to, amount);
}

int32_t TokenLedger::burn(const AssetId& asset, const Address& from, uint64_t amount) {
    if (amount == 0) return errors::OK;

    std::unique_lock lock(mutex_);

    auto it = balances_.find({asset, from});
    if (it == balances_.end() || it->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    it->second -= amount;
    supply_[asset] -= amount;
    return errors::OK;
}

uint64_t TokenLedger::balance_of(const AssetId& asset, const Address& owner) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find({asset, owner});
    return (it != balances_.end()) ? it->second : 0;
}

int32_t TokenLedger::credit(const AssetId& asset, const Address& to, uint64_t amount) {
    if (amount == 0) return errors::INVALID_AMOUNT;
    std::unique_lock lock(mutex_);
    return issue_locked(asset, to, amount);
}

int32_t TokenLedger::set_mint_authority(const AssetId& asset, const Address& authority) {
    std::unique_lock lock(mutex_);
    auto it = authorities_.find(asset);
    if (it != authorities_.end()) {
        return errors::ALREADY_EXISTS;
    }
    authorities_.emplace(asset, authority);
    return errors::OK;
}

std::optional<Address> TokenLedger::mint_authority(const AssetId& asset) const {
    std::shared_lock lock(mutex_);
    auto it = authorities_.find(asset);
    if (it == authorities_.end()) return std::nullopt;
    return it->second;
}

uint64_t TokenLedger::total_supply(const AssetId& asset) const {
    std::shared_lock lock(mutex_);
    auto it = supply_.find(asset);
    return (it != supply_.end()) ? it->second : 0;
}

TokenLedger::Stats TokenLedger::get_stats() const {
    std::shared_lock lock(mutex_);
    std::set<Address> owners;
    for (const auto& [key, balance] : balances_) {
        owners.insert(key.second);
    }
    return Stats{
        static_cast<uint64_t>(owners.size()),
        static_cast<uint64_t>(supply_.size()),
        total_transfers_
    };
}

int32_t TokenLedger::issue_locked(const AssetId& asset, const Address& to, uint64_t amount) {
    uint64_t& supply = supply_[asset];
    uint64_t new_supply = 0;
    if (!checked::add(supply, amount, new_supply)) {
        return errors::ARITHMETIC_OVERFLOW;
    }

    // Balance <= supply, so the balance add cannot overflow once supply fits
    supply = new_supply;
    balances_[{asset, to}] += amount;
    return errors::OK;
}

// =============================================================================
// LedgerJournal
// =============================================================================

LedgerJournal::~LedgerJournal() {
    if (!committed_ && !entries_.empty()) {
        rollback();
    }
}

int32_t LedgerJournal::transfer(const AssetId& asset, const Address& from,
                                const Address& to, uint64_t amount) {
    int32_t rc = ledger_.transfer(asset, from, to, amount);
    if (rc == errors::OK) {
        entries_.push_back({Op::TRANSFER, asset, from, to, amount, ZERO_ADDRESS});
    }
    return rc;
}

int32_t LedgerJournal::mint(const AssetId& asset, const Address& to,
                            uint64_t amount, const Address& mint_authority) {
    int32_t rc = ledger_.mint(asset, to, amount, mint_authority);
    if (rc == errors::OK) {
        entries_.push_back({Op::MINT, asset, ZERO_ADDRESS, to, amount, mint_authority});
    }
    return rc;
}

int32_t LedgerJournal::burn(const AssetId& asset, const Address& from,
                            uint64_t amount, const Address& mint_authority) {
    int32_t rc = ledger_.burn(asset, from, amount);
    if (rc == errors::OK) {
        entries_.push_back({Op::BURN, asset, from, ZERO_ADDRESS, amount, mint_authority});
    }
    return rc;
}

bool LedgerJournal::rollback() {
    bool clean = true;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        int32_t rc = errors::OK;
        switch (it->op) {
            case Op::TRANSFER:
                rc = ledger_.transfer(it->asset, it->to, it->from, it->amount);
                break;
            case Op::MINT:
                rc = ledger_.burn(it->asset, it->to, it->amount);
                break;
            case Op::BURN:
                rc = ledger_.mint(it->asset, it->from, it->amount, it->authority);
                break;
        }
        if (rc != errors::OK) {
            clean = false;
            log_error("ledger rollback step failed: asset=", short_hex(it->asset),
                      " amount=", it->amount, " error=", error_string(rc));
        }
    }
    entries_.clear();
    committed_ = true;
    return clean;
}

} // namespace fizzdex
