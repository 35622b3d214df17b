// TileWorld Engine Core
// clock.hpp - Monotonic clock sources and profiling timer

#pragma once

#include <chrono>
#include <cstdint>

namespace tileworld::core {

// Monotonic millisecond clock consumed by the tick scheduler
class MonotonicClock {
public:
    virtual ~MonotonicClock() = default;

    // Milliseconds since the clock's epoch. Never decreases.
    [[nodiscard]] virtual uint64_t now_ms() const = 0;
};

// Wall-time source backed by steady_clock
class SteadyClock : public MonotonicClock {
public:
    using Clock = std::chrono::steady_clock;

    SteadyClock();

    [[nodiscard]] uint64_t now_ms() const override;

    void reset();

private:
    Clock::time_point start_time_;
};

// Virtual time source advanced explicitly by the host or by tests
class ManualClock : public MonotonicClock {
public:
    explicit ManualClock(uint64_t start_ms = 0) : now_(start_ms) {}

    [[nodiscard]] uint64_t now_ms() const override { return now_; }

    void advance(uint64_t delta_ms) { now_ += delta_ms; }

    // Moves the clock forward to `time_ms`; earlier times are ignored
    void set(uint64_t time_ms);

private:
    uint64_t now_;
};

// RAII scoped timer for profiling - logs elapsed time on destruction
class ScopedTimer {
public:
    ScopedTimer(const char* category, const char* name);
    ~ScopedTimer();

    // Non-copyable and non-movable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;
    ScopedTimer(ScopedTimer&&) = delete;
    ScopedTimer& operator=(ScopedTimer&&) = delete;

private:
    const char* category_;
    const char* name_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace tileworld::core

#define TILEWORLD_SCOPED_TIMER(category, name) \
    ::tileworld::core::ScopedTimer scoped_timer_##__LINE__(category, name)
