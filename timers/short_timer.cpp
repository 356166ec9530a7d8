#include "short_timer.hpp"
#include "timer_errors.hpp"

#include <string>

namespace polltimer {

static std::uint32_t asTicks(std::int64_t value, std::uint32_t period) {
    return ticksAdd(0, value, period);
}

ShortTimer::ShortTimer(const TimerConfig& config, const ClockSource& clock)
    : Timer(TimerKind::Short, config, clock) {
    anchor(config);
}

std::int64_t ShortTimer::now() const {
    return clock_.ticksMs();
}

std::int64_t ShortTimer::later(std::int64_t delta) const {
    return ticksAdd(clock_.ticksMs(), delta, clock_.tickPeriod());
}

bool ShortTimer::reached(std::int64_t current, std::int64_t expiration) const {
    const std::uint32_t period = clock_.tickPeriod();
    return ticksDiff(asTicks(current, period), asTicks(expiration, period), period) >= 0;
}

bool ShortTimer::passed(std::int64_t current, std::int64_t expiration) const {
    const std::uint32_t period = clock_.tickPeriod();
    return ticksDiff(asTicks(current, period), asTicks(expiration, period), period) > 0;
}

void ShortTimer::checkDelta(std::int64_t delta) const {
    const std::int64_t limit = clock_.tickPeriod() / 2;
    if (delta >= limit || delta <= -limit) {
        throw TimerError(TimerErrc::InvalidConfig,
                         "short timer delta " + std::to_string(delta) +
                         " ms exceeds the tick counter range (max " +
                         std::to_string(limit - 1) + ")");
    }
}

} // namespace polltimer
