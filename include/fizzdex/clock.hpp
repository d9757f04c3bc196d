#ifndef FIZZDEX_CLOCK_HPP
#define FIZZDEX_CLOCK_HPP

#include <atomic>
#include <chrono>

#include "types.hpp"

namespace fizzdex {

// =============================================================================
// Clock Interface (read once per call)
// =============================================================================

class IClock {
public:
    virtual ~IClock() = default;
    virtual Timestamp now() const = 0;
};

// Wall clock, Unix seconds
class SystemClock : public IClock {
public:
    Timestamp now() const override {
        return static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count()
        );
    }
};

// Externally driven clock (scenarios, tests)
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_.load(std::memory_order_relaxed); }

    void set(Timestamp t) { now_.store(t, std::memory_order_relaxed); }
    void advance(Timestamp seconds) { now_.fetch_add(seconds, std::memory_order_relaxed); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace fizzdex

#endif // FIZZDEX_CLOCK_HPP
