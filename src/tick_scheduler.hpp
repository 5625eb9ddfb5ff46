#pragma once

#include <chrono>

namespace quay {

// Paces the session tick against wall time. At most one tick is due per
// check; intervals missed while the loop was busy are dropped, so a slow
// reload never turns into a burst of catch-up ticks.
class TickScheduler {
public:
    using Clock = std::chrono::steady_clock;

    TickScheduler(std::chrono::milliseconds interval, Clock::time_point start);

    // True once a full interval has passed since the last completed tick
    [[nodiscard]] bool due(Clock::time_point now) const;

    // Records that a tick finished at `now`; the next one is an interval later
    void complete(Clock::time_point now);

    [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }

private:
    std::chrono::milliseconds interval_;
    Clock::time_point last_tick_;
};

} // namespace quay
