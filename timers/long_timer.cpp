#include "long_timer.hpp"
#include "timer_errors.hpp"

#include <limits>
#include <string>

namespace polltimer {

LongTimer::LongTimer(const TimerConfig& config, const ClockSource& clock)
    : Timer(TimerKind::Long, config, clock) {
    anchor(config);
}

std::int64_t LongTimer::now() const {
    return clock_.seconds();
}

std::int64_t LongTimer::later(std::int64_t delta) const {
    using limits = std::numeric_limits<std::int64_t>;
    const std::int64_t current = clock_.seconds();
    // saturate: a restart long after setup may push now + interval past the range
    if (delta > 0 && current > limits::max() - delta) return limits::max();
    if (delta < 0 && current < limits::min() - delta) return limits::min();
    return current + delta;
}

bool LongTimer::reached(std::int64_t current, std::int64_t expiration) const {
    return current >= expiration;
}

bool LongTimer::passed(std::int64_t current, std::int64_t expiration) const {
    return current > expiration;
}

void LongTimer::checkDelta(std::int64_t delta) const {
    using limits = std::numeric_limits<std::int64_t>;
    const std::int64_t current = clock_.seconds();
    if ((delta > 0 && current > limits::max() - delta) ||
        (delta < 0 && current < limits::min() - delta)) {
        throw TimerError(TimerErrc::InvalidConfig,
                         "long timer delta " + std::to_string(delta) +
                         " s overflows the seconds clock at " + std::to_string(current));
    }
}

} // namespace polltimer
