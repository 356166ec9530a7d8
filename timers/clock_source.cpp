#include "clock_source.hpp"
#include "timer_errors.hpp"

#include <chrono>
#include <string>

namespace polltimer {

bool isValidTickPeriod(std::uint32_t period) {
    return period >= 2 && (period & (period - 1)) == 0;
}

std::uint32_t ticksAdd(std::uint32_t ticks, std::int64_t delta, std::uint32_t period) {
    const std::uint64_t mask = static_cast<std::uint64_t>(period) - 1;
    // two's complement wrap of a negative delta is fine under the mask
    return static_cast<std::uint32_t>((static_cast<std::uint64_t>(ticks) +
                                       static_cast<std::uint64_t>(delta)) & mask);
}

std::int64_t ticksDiff(std::uint32_t a, std::uint32_t b, std::uint32_t period) {
    const std::int64_t half = static_cast<std::int64_t>(period / 2);
    const std::uint64_t mask = static_cast<std::uint64_t>(period) - 1;
    const std::uint64_t raw = static_cast<std::uint64_t>(a) - static_cast<std::uint64_t>(b) +
                              static_cast<std::uint64_t>(half);
    return static_cast<std::int64_t>(raw & mask) - half;
}

// ------------------------------------------------------------
// SystemClock
// ------------------------------------------------------------
SystemClock::SystemClock(std::uint32_t tickPeriod) : period_(tickPeriod) {
    if (!isValidTickPeriod(period_)) {
        throw TimerError(TimerErrc::InvalidConfig,
                         "tick period must be a power of two, got " + std::to_string(period_));
    }
}

std::uint32_t SystemClock::ticksMs() const {
    const auto us = clock_.getElapsedTime().asMicroseconds();
    const auto ms = static_cast<std::uint64_t>(us / 1000);
    return static_cast<std::uint32_t>(ms & (static_cast<std::uint64_t>(period_) - 1));
}

std::int64_t SystemClock::seconds() const {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

// ------------------------------------------------------------
// ManualClock
// ------------------------------------------------------------
ManualClock::ManualClock(std::uint32_t tickPeriod, std::int64_t startSeconds)
    : period_(tickPeriod), startSeconds_(startSeconds) {
    if (!isValidTickPeriod(period_)) {
        throw TimerError(TimerErrc::InvalidConfig,
                         "tick period must be a power of two, got " + std::to_string(period_));
    }
}

std::uint32_t ManualClock::ticksMs() const {
    return ticksAdd(tickOffset_, static_cast<std::int64_t>(elapsedMs_ % period_), period_);
}

std::int64_t ManualClock::seconds() const {
    return startSeconds_ + static_cast<std::int64_t>(elapsedMs_ / 1000) + extraSeconds_;
}

void ManualClock::advanceMs(std::uint64_t ms) {
    elapsedMs_ += ms;
}

void ManualClock::advanceSeconds(std::int64_t s) {
    extraSeconds_ += s;
}

void ManualClock::setTicks(std::uint32_t ticks) {
    // keep elapsedMs_ intact so seconds() does not jump
    const std::uint32_t current = ticksAdd(0, static_cast<std::int64_t>(elapsedMs_ % period_), period_);
    tickOffset_ = ticksAdd(ticks, -static_cast<std::int64_t>(current), period_);
}

} // namespace polltimer
