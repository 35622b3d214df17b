// TileWorld Engine Core
// clock.cpp - Monotonic clock sources implementation

#include <tileworld/core/clock.hpp>
#include <tileworld/core/logger.hpp>

namespace tileworld::core {

SteadyClock::SteadyClock() : start_time_(Clock::now()) {}

uint64_t SteadyClock::now_ms() const {
    auto elapsed = Clock::now() - start_time_;
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void SteadyClock::reset() {
    start_time_ = Clock::now();
}

void ManualClock::set(uint64_t time_ms) {
    if (time_ms > now_) {
        now_ = time_ms;
    }
}

ScopedTimer::ScopedTimer(const char* category, const char* name)
    : category_(category), name_(name), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    auto elapsed = std::chrono::steady_clock::now() - start_;
    double ms = std::chrono::duration<double, std::milli>(elapsed).count();
    TILEWORLD_LOG_DEBUG(category_, "{} took {:.3f} ms", name_, ms);
}

}  // namespace tileworld::core
