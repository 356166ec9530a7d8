#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "clock_source.hpp"
#include "timer_action.hpp"
#include "timer_config.hpp"

namespace polltimer {

enum class TimerKind { Short, Long };

const char* kindName(TimerKind kind);

/// Timer
/// One-shot software timer checked by polling. A timer is armed by
/// start() and disarmed by stop() or by firing; a repeating timer is
/// one whose action starts it again.
///
/// The two variants differ only in their clock domain:
///   - ShortTimer: milliseconds on the wrapping tick counter
///   - LongTimer:  seconds on the seconds clock
class Timer {
public:
    virtual ~Timer() = default;

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    /// Arm the timer. With an interval, re-anchors expiration to now +
    /// interval, unless an override is pending (the override wins once).
    void start();

    /// Disarm. Never fails.
    void stop();

    /// Fire if armed and expired. Disarms before invoking the action.
    /// Returns true if the action ran.
    bool check();

    /// Invoke the action with the bound args, ignoring armed state.
    void fire();

    /// expiration = now + delta, armed state unchanged.
    /// Throws TimerError(InvalidConfig) if delta is out of the clock's range.
    void overrideExpiration(std::int64_t delta);

    /// Multi-line description for listings.
    std::string describe() const;

    TimerKind kind() const { return kind_; }
    bool isSet() const { return isSet_; }
    bool isStale() const { return stale_; }
    bool overridePending() const { return overridePending_; }
    const std::optional<std::int64_t>& interval() const { return interval_; }
    std::int64_t expiration() const { return expiration_; }
    const TimerAction& action() const { return action_; }
    const nlohmann::json& args() const { return args_; }

protected:
    Timer(TimerKind kind, const TimerConfig& config, const ClockSource& clock);

    /// Finish construction once the derived clock hooks are usable.
    void anchor(const TimerConfig& config);

    /// Current reading of the variant's clock.
    virtual std::int64_t now() const = 0;

    /// now() + delta in the variant's clock domain.
    virtual std::int64_t later(std::int64_t delta) const = 0;

    /// Has the clock reached `expiration` (>= 0 distance)?
    virtual bool reached(std::int64_t current, std::int64_t expiration) const = 0;

    /// Strictly past, used to flag stale absolute expirations.
    virtual bool passed(std::int64_t current, std::int64_t expiration) const = 0;

    /// Throws TimerError(InvalidConfig) when later(delta) cannot be
    /// ordered against now() in the variant's clock domain.
    virtual void checkDelta(std::int64_t delta) const = 0;

    const ClockSource& clock_;

private:
    TimerKind kind_;
    TimerAction action_;
    nlohmann::json args_;
    std::optional<std::int64_t> interval_;
    std::int64_t expiration_ = 0;
    bool isSet_ = false;
    bool stale_ = false;
    bool overridePending_ = false;
};

} // namespace polltimer
