// TileWorld Engine Core
// tick_scheduler.cpp - Cooperative periodic tickers implementation

#include <tileworld/core/logger.hpp>
#include <tileworld/core/tick_scheduler.hpp>

#include <algorithm>
#include <vector>

namespace tileworld::core {

namespace {

struct Ticker {
    TickerId id = INVALID_TICKER;
    std::string name;
    uint64_t interval_ms = 0;
    uint64_t next_due_ms = 0;
    uint64_t tick_count = 0;
    TickCallback callback;
};

}  // namespace

struct TickScheduler::Impl {
    const MonotonicClock& clock;
    TickSchedulerConfig config;
    std::vector<Ticker> tickers;
    TickerId next_id = 1;
    bool paused = false;
    uint64_t paused_at_ms = 0;

    Impl(const MonotonicClock& c, const TickSchedulerConfig& cfg) : clock(c), config(cfg) {}

    Ticker* find(TickerId id) {
        auto it = std::find_if(tickers.begin(), tickers.end(), [id](const Ticker& t) { return t.id == id; });
        return it != tickers.end() ? &*it : nullptr;
    }

    const Ticker* find(TickerId id) const {
        auto it = std::find_if(tickers.begin(), tickers.end(), [id](const Ticker& t) { return t.id == id; });
        return it != tickers.end() ? &*it : nullptr;
    }

    // Earliest due ticker at or before `now`; ties resolve to registration order
    Ticker* next_due(uint64_t now) {
        Ticker* best = nullptr;
        for (auto& ticker : tickers) {
            if (ticker.next_due_ms > now) {
                continue;
            }
            if (best == nullptr || ticker.next_due_ms < best->next_due_ms) {
                best = &ticker;
            }
        }
        return best;
    }
};

TickScheduler::TickScheduler(const MonotonicClock& clock, const TickSchedulerConfig& config)
    : impl_(std::make_unique<Impl>(clock, config)) {}

TickScheduler::~TickScheduler() = default;

TickerId TickScheduler::add_ticker(std::string name, uint64_t interval_ms, TickCallback callback) {
    if (interval_ms == 0 || !callback) {
        TILEWORLD_LOG_ERROR(log_category::SCHEDULER, "Rejected ticker '{}': interval must be positive and callback set",
                            name);
        return INVALID_TICKER;
    }

    Ticker ticker;
    ticker.id = impl_->next_id++;
    ticker.name = std::move(name);
    ticker.interval_ms = interval_ms;
    ticker.next_due_ms = impl_->clock.now_ms() + interval_ms;
    ticker.callback = std::move(callback);

    TILEWORLD_LOG_DEBUG(log_category::SCHEDULER, "Ticker '{}' registered every {} ms", ticker.name, interval_ms);

    TickerId id = ticker.id;
    impl_->tickers.push_back(std::move(ticker));
    return id;
}

bool TickScheduler::stop(TickerId id) {
    auto it = std::find_if(impl_->tickers.begin(), impl_->tickers.end(),
                           [id](const Ticker& t) { return t.id == id; });
    if (it == impl_->tickers.end()) {
        return false;
    }
    TILEWORLD_LOG_DEBUG(log_category::SCHEDULER, "Ticker '{}' stopped after {} ticks", it->name, it->tick_count);
    impl_->tickers.erase(it);
    return true;
}

void TickScheduler::stop_all() {
    impl_->tickers.clear();
}

bool TickScheduler::is_active(TickerId id) const {
    return impl_->find(id) != nullptr;
}

uint64_t TickScheduler::get_tick_count(TickerId id) const {
    const Ticker* ticker = impl_->find(id);
    return ticker != nullptr ? ticker->tick_count : 0;
}

uint64_t TickScheduler::get_interval(TickerId id) const {
    const Ticker* ticker = impl_->find(id);
    return ticker != nullptr ? ticker->interval_ms : 0;
}

std::string_view TickScheduler::get_name(TickerId id) const {
    const Ticker* ticker = impl_->find(id);
    return ticker != nullptr ? std::string_view(ticker->name) : std::string_view{};
}

size_t TickScheduler::get_active_count() const {
    return impl_->tickers.size();
}

size_t TickScheduler::run_due() {
    if (impl_->paused) {
        return 0;
    }

    const uint64_t now = impl_->clock.now_ms();
    const uint64_t max_ticks = impl_->config.max_catch_up_ticks;

    // Drop backlog beyond the catch-up limit to prevent spiral of death
    for (auto& ticker : impl_->tickers) {
        if (max_ticks == 0 || ticker.next_due_ms > now) {
            continue;
        }
        uint64_t pending = (now - ticker.next_due_ms) / ticker.interval_ms + 1;
        if (pending > max_ticks) {
            uint64_t skipped = pending - max_ticks;
            ticker.next_due_ms += skipped * ticker.interval_ms;
            TILEWORLD_LOG_WARN(log_category::SCHEDULER, "Ticker '{}' fell behind, skipped {} ticks", ticker.name,
                               skipped);
        }
    }

    size_t executed = 0;
    while (Ticker* ticker = impl_->next_due(now)) {
        ticker->next_due_ms += ticker->interval_ms;
        uint64_t tick = ++ticker->tick_count;

        // Copy: the callback may add or stop tickers and reallocate the vector
        TickCallback callback = ticker->callback;
        callback(tick);
        ++executed;
    }
    return executed;
}

void TickScheduler::set_paused(bool paused) {
    if (impl_->paused == paused) {
        return;
    }
    impl_->paused = paused;

    if (paused) {
        impl_->paused_at_ms = impl_->clock.now_ms();
        TILEWORLD_LOG_DEBUG(log_category::SCHEDULER, "Scheduler paused");
    } else {
        // Shift deadlines so paused time does not produce a burst of ticks
        uint64_t paused_for = impl_->clock.now_ms() - impl_->paused_at_ms;
        for (auto& ticker : impl_->tickers) {
            ticker.next_due_ms += paused_for;
        }
        TILEWORLD_LOG_DEBUG(log_category::SCHEDULER, "Scheduler resumed");
    }
}

bool TickScheduler::is_paused() const {
    return impl_->paused;
}

void TickScheduler::set_config(const TickSchedulerConfig& config) {
    impl_->config = config;
}

const TickSchedulerConfig& TickScheduler::get_config() const {
    return impl_->config;
}

const MonotonicClock& TickScheduler::get_clock() const {
    return impl_->clock;
}

}  // namespace tileworld::core
