#ifndef FIZZDEX_HTLC_HPP
#define FIZZDEX_HTLC_HPP

#include <map>
#include <set>
#include <shared_mutex>
#include <optional>
#include <vector>

#include "types.hpp"
#include "clock.hpp"
#include "crypto.hpp"
#include "ledger.hpp"
#include "events.hpp"

namespace fizzdex {

// =============================================================================
// Atomic Swap (HTLC) Record
// =============================================================================

enum class SwapStatus : uint8_t {
    OPEN = 0,
    COMPLETED = 1,
    REFUNDED = 2
};

const char* swap_status_name(SwapStatus status);

struct AtomicSwap {
    SwapId id;
    Address escrow;                // Holds the locked amount while OPEN
    Address initiator;
    Address participant;
    AssetId asset;
    uint64_t amount;
    Hash256 secret_hash;
    Timestamp timelock;            // Absolute Unix time
    bool completed;
    bool refunded;
    std::vector<uint8_t> secret;   // Revealed preimage, empty until completed
    bool settling;                 // A complete/refund is in flight

    SwapStatus status() const {
        if (completed) return SwapStatus::COMPLETED;
        if (refunded) return SwapStatus::REFUNDED;
        return SwapStatus::OPEN;
    }
};

// =============================================================================
// AtomicSwapEngine - hash-time-locked escrow
//
// OPEN -> COMPLETED  participant reveals the preimage of secret_hash
// OPEN -> REFUNDED   initiator reclaims after timelock
// Not gated by the market pause flag.
// =============================================================================

class AtomicSwapEngine {
public:
    AtomicSwapEngine(ILedger& ledger, const IClock& clock, HashLock hashlock = HashLock());
    ~AtomicSwapEngine() = default;

    // Non-copyable
    AtomicSwapEngine(const AtomicSwapEngine&) = delete;
    AtomicSwapEngine& operator=(const AtomicSwapEngine&) = delete;

    // =========================================================================
    // State Transitions
    // =========================================================================

    int32_t initiate(const Address& initiator, const Address& participant,
                     const AssetId& asset, uint64_t amount,
                     const Hash256& secret_hash, Timestamp timelock,
                     SwapId* out_id = nullptr);

    // Allowed after the timelock as long as no refund happened
    int32_t complete(const Address& caller, const SwapId& swap_id,
                     const std::vector<uint8_t>& secret);

    int32_t refund(const Address& caller, const SwapId& swap_id);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<AtomicSwap> get_swap(const SwapId& swap_id) const;

    // Every swap locked to the given hash, in key order
    std::vector<AtomicSwap> find_by_secret_hash(const Hash256& secret_hash) const;

    static SwapId swap_id(const Address& initiator, const Address& participant,
                          const AssetId& asset, Timestamp timelock);
    static Address escrow_address(const Address& initiator, const Address& participant,
                                  const AssetId& asset, Timestamp timelock);

    // Digest of the secret under this engine's hashlock
    int32_t hash_secret(const std::vector<uint8_t>& secret, Hash256& out) const {
        return hashlock_.digest(secret, out);
    }
    const HashLock& hashlock() const { return hashlock_; }

    void set_event_listener(EventListener* listener) { listener_ = listener; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_swaps;
        uint64_t open_swaps;
        uint64_t completed_swaps;
        uint64_t refunded_swaps;
        U128 total_escrowed;       // Sum of amounts over all initiated swaps
    };
    Stats get_stats() const;

private:
    ILedger& ledger_;
    const IClock& clock_;
    HashLock hashlock_;

    std::map<SwapId, AtomicSwap> swaps_;
    std::set<SwapId> pending_;     // Keys reserved by an initiate in flight
    mutable std::shared_mutex swaps_mutex_;

    EventListener* listener_{nullptr};

    // Clears the in-flight flag, applies the terminal state on success
    AtomicSwap finish_settlement(const SwapId& swap_id, int32_t rc,
                                 SwapStatus outcome, const std::vector<uint8_t>* secret);
};

} // namespace fizzdex

#endif // FIZZDEX_HTLC_HPP
