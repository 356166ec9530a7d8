#pragma once
#include "timer.hpp"

namespace polltimer {

/// ShortTimer
/// Millisecond timer on the bounded tick counter. Expiration is compared
/// with a signed tick difference, so it keeps working when the counter
/// wraps. Intervals and override deltas must stay below half the tick
/// period; an absolute expiration more than half a period ahead reads as
/// already passed.
class ShortTimer : public Timer {
public:
    ShortTimer(const TimerConfig& config, const ClockSource& clock);

protected:
    std::int64_t now() const override;
    std::int64_t later(std::int64_t delta) const override;
    bool reached(std::int64_t current, std::int64_t expiration) const override;
    bool passed(std::int64_t current, std::int64_t expiration) const override;
    void checkDelta(std::int64_t delta) const override;
};

} // namespace polltimer
