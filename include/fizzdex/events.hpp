#ifndef FIZZDEX_EVENTS_HPP
#define FIZZDEX_EVENTS_HPP

#include <cstdint>
#include <vector>

#include "types.hpp"

namespace fizzdex {

struct Pool;
struct AtomicSwap;
struct PlayerState;

// Callback interface for committed state transitions.
// Invoked after the call's state is final, outside engine locks.
class EventListener {
public:
    virtual ~EventListener() = default;

    virtual void on_pool_created(const Pool& pool) = 0;
    virtual void on_liquidity_added(const Pool& pool, const Address& provider,
                                    uint64_t amount_a, uint64_t amount_b, uint64_t lp_minted) = 0;
    virtual void on_liquidity_removed(const Pool& pool, const Address& provider,
                                      uint64_t amount_a, uint64_t amount_b, uint64_t lp_burned) = 0;
    virtual void on_swap(const Pool& pool, const Address& trader, bool a_to_b,
                         uint64_t amount_in, uint64_t amount_out) = 0;

    virtual void on_atomic_swap_initiated(const AtomicSwap& swap) = 0;
    // secret is public from this point on
    virtual void on_atomic_swap_completed(const AtomicSwap& swap,
                                          const std::vector<uint8_t>& secret) = 0;
    virtual void on_atomic_swap_refunded(const AtomicSwap& swap) = 0;

    virtual void on_played(const Address& player, uint8_t number, uint64_t reward) = 0;
    virtual void on_rewards_claimed(const Address& player, uint64_t amount) = 0;
};

// No-op listener for when notifications aren't needed
class NullEventListener : public EventListener {
public:
    void on_pool_created(const Pool&) override {}
    void on_liquidity_added(const Pool&, const Address&, uint64_t, uint64_t, uint64_t) override {}
    void on_liquidity_removed(const Pool&, const Address&, uint64_t, uint64_t, uint64_t) override {}
    void on_swap(const Pool&, const Address&, bool, uint64_t, uint64_t) override {}
    void on_atomic_swap_initiated(const AtomicSwap&) override {}
    void on_atomic_swap_completed(const AtomicSwap&, const std::vector<uint8_t>&) override {}
    void on_atomic_swap_refunded(const AtomicSwap&) override {}
    void on_played(const Address&, uint8_t, uint64_t) override {}
    void on_rewards_claimed(const Address&, uint64_t) override {}
};

} // namespace fizzdex

#endif // FIZZDEX_EVENTS_HPP
