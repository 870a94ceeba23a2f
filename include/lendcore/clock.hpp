#ifndef LENDCORE_CLOCK_HPP
#define LENDCORE_CLOCK_HPP

#include <atomic>
#include <cstdint>

namespace lendcore {

// =============================================================================
// Clock Interface (timestamps in seconds)
// =============================================================================

class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t now() const = 0;
};

// Wall clock
class SystemClock : public Clock {
public:
    uint64_t now() const override;
};

// Settable clock for tests and scenario replay
class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t start = 0) : now_(start) {}

    uint64_t now() const override { return now_.load(std::memory_order_relaxed); }

    void set(uint64_t t) { now_.store(t, std::memory_order_relaxed); }
    void advance(uint64_t dt) { now_.fetch_add(dt, std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> now_;
};

} // namespace lendcore

#endif // LENDCORE_CLOCK_HPP
