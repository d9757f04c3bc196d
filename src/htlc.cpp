// =============================================================================
// htlc.cpp - Hash-Time-Locked Atomic Swaps
// =============================================================================

#include "fizzdex/htlc.hpp"
#include "fizzdex/log.hpp"

#include <mutex>
#include <utility>

namespace fizzdex {

const char* swap_status_name(SwapStatus status) {
    switch (status) {
        case SwapStatus::OPEN: return "open";
        case SwapStatus::COMPLETED: return "completed";
        case SwapStatus::REFUNDED: return "refunded";
    }
    return "unknown";
}

AtomicSwapEngine::AtomicSwapEngine(ILedger& ledger, const IClock& clock, HashLock hashlock)
    : ledger_(ledger)
    , clock_(clock)
    , hashlock_(std::move(hashlock)) {}

SwapId AtomicSwapEngine::swap_id(const Address& initiator, const Address& participant,
                                 const AssetId& asset, Timestamp timelock) {
    return KeyBuilder("atomic_swap")
        .add(initiator).add(participant).add(asset).add(timelock)
        .finish();
}

Address AtomicSwapEngine::escrow_address(const Address& initiator, const Address& participant,
                                         const AssetId& asset, Timestamp timelock) {
    return KeyBuilder("escrow_vault")
        .add(initiator).add(participant).add(asset).add(timelock)
        .finish();
}

// =============================================================================
// State Transitions
// =============================================================================

int32_t AtomicSwapEngine::initiate(const Address& initiator, const Address& participant,
                                   const AssetId& asset, uint64_t amount,
                                   const Hash256& secret_hash, Timestamp timelock,
                                   SwapId* out_id) {
    const Timestamp now = clock_.now();

    if (timelock <= now) return errors::INVALID_TIMELOCK;
    if (amount == 0) return errors::INVALID_AMOUNT;

    const SwapId id = swap_id(initiator, participant, asset, timelock);
    const Address escrow = escrow_address(initiator, participant, asset, timelock);

    {
        std::unique_lock lock(swaps_mutex_);
        if (swaps_.count(id) > 0 || pending_.count(id) > 0) {
            return errors::ALREADY_EXISTS;
        }
        pending_.insert(id);
    }

    int32_t rc = ledger_.transfer(asset, initiator, escrow, amount);

    AtomicSwap created{};
    {
        std::unique_lock lock(swaps_mutex_);
        pending_.erase(id);
        if (rc != errors::OK) return rc;

        created.id = id;
        created.escrow = escrow;
        created.initiator = initiator;
        created.participant = participant;
        created.asset = asset;
        created.amount = amount;
        created.secret_hash = secret_hash;
        created.timelock = timelock;
        created.completed = false;
        created.refunded = false;
        created.settling = false;
        swaps_.emplace(id, created);
    }

    if (out_id) *out_id = id;

    log_info("atomic swap initiated: ", short_hex(id), " amount=", amount,
             " timelock=", timelock);
    if (listener_) listener_->on_atomic_swap_initiated(created);
    return errors::OK;
}

int32_t AtomicSwapEngine::complete(const Address& caller, const SwapId& swap_id,
                                   const std::vector<uint8_t>& secret) {
    Hash256 revealed{};
    const int32_t digest_rc = hashlock_.digest(secret, revealed);

    AtomicSwap swap{};
    {
        std::unique_lock lock(swaps_mutex_);
        auto it = swaps_.find(swap_id);
        if (it == swaps_.end()) return errors::SWAP_NOT_FOUND;

        AtomicSwap& record = it->second;
        if (record.settling) return errors::LOCKED;
        if (record.completed) return errors::ALREADY_COMPLETED;
        if (record.refunded) return errors::ALREADY_REFUNDED;
        if (digest_rc != errors::OK) return digest_rc;
        if (revealed != record.secret_hash) return errors::INVALID_SECRET;
        if (caller != record.participant) return errors::UNAUTHORIZED;

        record.settling = true;
        swap = record;
    }

    int32_t rc = ledger_.transfer(swap.asset, swap.escrow, swap.participant, swap.amount);
    AtomicSwap settled = finish_settlement(swap_id, rc, SwapStatus::COMPLETED, &secret);
    if (rc != errors::OK) return rc;

    log_info("atomic swap completed: ", short_hex(swap_id));
    if (listener_) listener_->on_atomic_swap_completed(settled, settled.secret);
    return errors::OK;
}

int32_t AtomicSwapEngine::refund(const Address& caller, const SwapId& swap_id) {
    const Timestamp now = clock_.now();

    AtomicSwap swap{};
    {
        std::unique_lock lock(swaps_mutex_);
        auto it = swaps_.find(swap_id);
        if (it == swaps_.end()) return errors::SWAP_NOT_FOUND;

        AtomicSwap& record = it->second;
        if (record.settling) return errors::LOCKED;
        if (caller != record.initiator) return errors::UNAUTHORIZED;
        if (record.completed) return errors::ALREADY_COMPLETED;
        if (record.refunded) return errors::ALREADY_REFUNDED;
        if (now <= record.timelock) return errors::TIMELOCK_NOT_EXPIRED;

        record.settling = true;
        swap = record;
    }

    int32_t rc = ledger_.transfer(swap.asset, swap.escrow, swap.initiator, swap.amount);
    AtomicSwap settled = finish_settlement(swap_id, rc, SwapStatus::REFUNDED, nullptr);
    if (rc != errors::OK) return rc;

    log_info("atomic swap refunded: ", short_hex(swap_id));
    if (listener_) listener_->on_atomic_swap_refunded(settled);
    return errors::OK;
}

AtomicSwap AtomicSwapEngine::finish_settlement(const SwapId& swap_id, int32_t rc,
                                               SwapStatus outcome,
                                               const std::vector<uint8_t>* secret) {
    std::unique_lock lock(swaps_mutex_);
    AtomicSwap& record = swaps_.at(swap_id);
    record.settling = false;
    if (rc == errors::OK) {
        if (outcome == SwapStatus::COMPLETED) {
            record.completed = true;
            if (secret) record.secret = *secret;
        } else if (outcome == SwapStatus::REFUNDED) {
            record.refunded = true;
        }
    }
    return record;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<AtomicSwap> AtomicSwapEngine::get_swap(const SwapId& swap_id) const {
    std::shared_lock lock(swaps_mutex_);
    auto it = swaps_.find(swap_id);
    if (it == swaps_.end()) return std::nullopt;
    return it->second;
}

std::vector<AtomicSwap> AtomicSwapEngine::find_by_secret_hash(const Hash256& secret_hash) const {
    std::shared_lock lock(swaps_mutex_);
    std::vector<AtomicSwap> matches;
    for (const auto& [id, swap] : swaps_) {
        if (swap.secret_hash == secret_hash) {
            matches.push_back(swap);
        }
    }
    return matches;
}

AtomicSwapEngine::Stats AtomicSwapEngine::get_stats() const {
    std::shared_lock lock(swaps_mutex_);
    Stats stats{static_cast<uint64_t>(swaps_.size()), 0, 0, 0, 0};
    for (const auto& [id, swap] : swaps_) {
        switch (swap.status()) {
            case SwapStatus::OPEN: ++stats.open_swaps; break;
            case SwapStatus::COMPLETED: ++stats.completed_swaps; break;
            case SwapStatus::REFUNDED: ++stats.refunded_swaps; break;
        }
        stats.total_escrowed += swap.amount;
    }
    return stats;
}

} // namespace fizzdex
