#include "tick_scheduler.hpp"

namespace quay {

TickScheduler::TickScheduler(std::chrono::milliseconds interval, Clock::time_point start)
    : interval_(interval)
    , last_tick_(start)
{
}

bool TickScheduler::due(Clock::time_point now) const {
    return now - last_tick_ >= interval_;
}

void TickScheduler::complete(Clock::time_point now) {
    if (now > last_tick_) {
        last_tick_ = now;
    }
}

} // namespace quay
