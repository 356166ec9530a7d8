#pragma once
#include <cstdint>
#include <SFML/System/Clock.hpp>

namespace polltimer {

// ------------------------------------------------------------
// Tick arithmetic
// ------------------------------------------------------------
// The tick counter counts milliseconds modulo a power-of-two period.
// Two ticks are ordered by their signed distance, which stays correct
// across the wrap as long as they are less than period/2 apart.

/// Default period of the tick counter (same as MicroPython's ticks_ms).
inline constexpr std::uint32_t kDefaultTickPeriod = 1u << 30;

/// True if period is a power of two >= 2.
bool isValidTickPeriod(std::uint32_t period);

/// (ticks + delta) mod period, delta may be negative.
std::uint32_t ticksAdd(std::uint32_t ticks, std::int64_t delta, std::uint32_t period);

/// Signed distance a - b in the range [-period/2, period/2).
std::int64_t ticksDiff(std::uint32_t a, std::uint32_t b, std::uint32_t period);

// ------------------------------------------------------------
// ClockSource: injected time capability
// ------------------------------------------------------------
class ClockSource {
public:
    virtual ~ClockSource() = default;

    /// Bounded millisecond counter in [0, tickPeriod()).
    virtual std::uint32_t ticksMs() const = 0;

    /// Wrap period of ticksMs().
    virtual std::uint32_t tickPeriod() const = 0;

    /// Seconds value used by long timers.
    virtual std::int64_t seconds() const = 0;
};

// ------------------------------------------------------------
// SystemClock: sf::Clock for ticks, wall clock for seconds
// ------------------------------------------------------------
class SystemClock : public ClockSource {
public:
    explicit SystemClock(std::uint32_t tickPeriod = kDefaultTickPeriod);

    std::uint32_t ticksMs() const override;
    std::uint32_t tickPeriod() const override { return period_; }
    std::int64_t seconds() const override;

private:
    sf::Clock clock_;
    std::uint32_t period_;
};

// ------------------------------------------------------------
// ManualClock: advanced explicitly by the caller
// ------------------------------------------------------------
class ManualClock : public ClockSource {
public:
    explicit ManualClock(std::uint32_t tickPeriod = kDefaultTickPeriod,
                         std::int64_t startSeconds = 0);

    std::uint32_t ticksMs() const override;
    std::uint32_t tickPeriod() const override { return period_; }
    std::int64_t seconds() const override;

    /// Move time forward; seconds follow the accumulated milliseconds.
    void advanceMs(std::uint64_t ms);
    void advanceSeconds(std::int64_t s);

    /// Jump the tick counter without touching the seconds clock.
    void setTicks(std::uint32_t ticks);

private:
    std::uint32_t period_;
    std::uint64_t elapsedMs_ = 0;
    std::uint32_t tickOffset_ = 0;
    std::int64_t startSeconds_;
    std::int64_t extraSeconds_ = 0;
};

} // namespace polltimer
