#pragma once
#include "timer.hpp"

namespace polltimer {

/// LongTimer
/// Second-resolution timer on the seconds clock. Plain comparison, the
/// clock range is far beyond any timer lifetime.
class LongTimer : public Timer {
public:
    LongTimer(const TimerConfig& config, const ClockSource& clock);

protected:
    std::int64_t now() const override;
    std::int64_t later(std::int64_t delta) const override;
    bool reached(std::int64_t current, std::int64_t expiration) const override;
    bool passed(std::int64_t current, std::int64_t expiration) const override;
    void checkDelta(std::int64_t delta) const override;
};

} // namespace polltimer
