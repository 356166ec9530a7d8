#include "timer.hpp"
#include "timer_errors.hpp"
#include "logger.hpp"

#include <sstream>

namespace polltimer {

const char* kindName(TimerKind kind) {
    switch (kind) {
        case TimerKind::Short: return "ShortTimer";
        case TimerKind::Long:  return "LongTimer";
    }
    return "Timer";
}

Timer::Timer(TimerKind kind, const TimerConfig& config, const ClockSource& clock)
    : clock_(clock),
      kind_(kind),
      action_(config.action),
      args_(config.args),
      interval_(config.interval) {
    if (!config.interval && !config.expiration) {
        throw TimerError(TimerErrc::InvalidConfig, "timer needs an interval or an expiration");
    }
    if (!action_) {
        throw TimerError(TimerErrc::InvalidConfig, "timer needs an action");
    }
    if (interval_ && *interval_ < 0) {
        throw TimerError(TimerErrc::InvalidConfig,
                         "interval must not be negative, got " + std::to_string(*interval_));
    }
}

void Timer::anchor(const TimerConfig& config) {
    if (interval_) {
        checkDelta(*interval_);
        // computed now even though the timer may not be armed yet
        expiration_ = later(*interval_);
        if (config.expiration) {
            LOG_DEBUG("Timer", "interval and expiration both given, using interval");
        }
    } else {
        expiration_ = *config.expiration;
        stale_ = passed(now(), expiration_);
    }
    isSet_ = config.running;
}

// ------------------------------------------------------------
// Arm / disarm
// ------------------------------------------------------------
void Timer::start() {
    if (interval_ && !overridePending_) {
        expiration_ = later(*interval_);
    }
    overridePending_ = false;
    isSet_ = true;
}

void Timer::stop() {
    isSet_ = false;
}

// ------------------------------------------------------------
// Expiration check
// ------------------------------------------------------------
bool Timer::check() {
    if (!isSet_ || stale_) {
        return false;
    }
    if (!reached(now(), expiration_)) {
        return false;
    }

    // one shot: disarm first so the action may re-arm us
    isSet_ = false;
    fire();
    return true;
}

void Timer::fire() {
    overridePending_ = false;
    action_.invoke(args_);
}

void Timer::overrideExpiration(std::int64_t delta) {
    checkDelta(delta);
    expiration_ = later(delta);
    stale_ = false;
    overridePending_ = true;
}

std::string Timer::describe() const {
    std::ostringstream oss;
    oss << " Type:" << kindName(kind_) << "\n"
        << "  Is set:" << (isSet_ ? "true" : "false") << "\n"
        << "  Action:" << action_.label << "\n"
        << "  Interval:" << (interval_ ? std::to_string(*interval_) : "none") << "\n"
        << "  Expiration:" << expiration_ << (stale_ ? " (stale)" : "") << "\n";
    return oss.str();
}

} // namespace polltimer
