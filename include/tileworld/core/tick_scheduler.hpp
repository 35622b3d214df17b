// TileWorld Engine Core
// tick_scheduler.hpp - Cooperative periodic tickers driven by a monotonic clock

#pragma once

#include <tileworld/core/clock.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace tileworld::core {

using TickerId = uint32_t;
inline constexpr TickerId INVALID_TICKER = 0;

// Called once per elapsed interval with the ticker's 1-based tick number
using TickCallback = std::function<void(uint64_t tick)>;

struct TickSchedulerConfig {
    uint32_t max_catch_up_ticks = 16;  // Per ticker per run_due(); drops backlog beyond this
};

// Single-threaded scheduler. Tickers run serially from run_due(), ordered by
// their due time; tickers due at the same instant run in registration order.
class TickScheduler {
public:
    explicit TickScheduler(const MonotonicClock& clock, const TickSchedulerConfig& config = {});
    ~TickScheduler();

    // Non-copyable, non-movable
    TickScheduler(const TickScheduler&) = delete;
    TickScheduler& operator=(const TickScheduler&) = delete;
    TickScheduler(TickScheduler&&) = delete;
    TickScheduler& operator=(TickScheduler&&) = delete;

    /// Register a periodic ticker. First tick is due one interval from now.
    /// Returns INVALID_TICKER if interval_ms is zero or the callback is empty.
    TickerId add_ticker(std::string name, uint64_t interval_ms, TickCallback callback);

    /// Stop and release a ticker. A callback already running completes; no
    /// further ticks are issued and queries on the id report an unknown ticker.
    bool stop(TickerId id);
    void stop_all();

    [[nodiscard]] bool is_active(TickerId id) const;
    [[nodiscard]] uint64_t get_tick_count(TickerId id) const;
    [[nodiscard]] uint64_t get_interval(TickerId id) const;
    [[nodiscard]] std::string_view get_name(TickerId id) const;
    [[nodiscard]] size_t get_active_count() const;

    /// Run every tick that has come due up to the clock's current time.
    /// Returns the number of callbacks invoked.
    size_t run_due();

    void set_paused(bool paused);
    [[nodiscard]] bool is_paused() const;

    void set_config(const TickSchedulerConfig& config);
    [[nodiscard]] const TickSchedulerConfig& get_config() const;

    [[nodiscard]] const MonotonicClock& get_clock() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tileworld::core
