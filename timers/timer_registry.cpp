#include "timer_registry.hpp"
#include "timer_errors.hpp"
#include "short_timer.hpp"
#include "long_timer.hpp"
#include "logger.hpp"

#include <algorithm>

namespace polltimer {

TimerRegistry::TimerRegistry(const ClockSource& clock) : clock_(clock) {}

// ------------------------------------------------------------
// Lookup helpers
// ------------------------------------------------------------
TimerRegistry::Entry* TimerRegistry::find(const std::string& name) {
    for (auto& e : entries_) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

const TimerRegistry::Entry* TimerRegistry::find(const std::string& name) const {
    for (const auto& e : entries_) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

Timer& TimerRegistry::at(const std::string& name) {
    Entry* e = find(name);
    if (!e) {
        throw TimerError(TimerErrc::TimerNotFound, "no timer named '" + name + "'");
    }
    return *e->timer;
}

const Timer& TimerRegistry::at(const std::string& name) const {
    const Entry* e = find(name);
    if (!e) {
        throw TimerError(TimerErrc::TimerNotFound, "no timer named '" + name + "'");
    }
    return *e->timer;
}

bool TimerRegistry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

std::unique_ptr<Timer> TimerRegistry::build(const TimerConfig& config) const {
    TimerKind kind = config.isLong ? TimerKind::Long : TimerKind::Short;
    switch (kind) {
        case TimerKind::Short: return std::make_unique<ShortTimer>(config, clock_);
        case TimerKind::Long:  return std::make_unique<LongTimer>(config, clock_);
    }
    throw TimerError(TimerErrc::InvalidConfig, "unknown timer kind");
}

// ------------------------------------------------------------
// Operations
// ------------------------------------------------------------
Timer& TimerRegistry::setup(const std::string& name, const TimerConfig& config) {
    // construct first: a throwing constructor must not leave a partial entry
    std::shared_ptr<Timer> timer = build(config);

    if (Entry* e = find(name)) {
        e->timer = timer;
        LOG_DEBUG("Timers", "Replaced timer '" + name + "' (" + kindName(timer->kind()) + ")");
    } else {
        entries_.push_back({name, timer});
        LOG_DEBUG("Timers", "Registered timer '" + name + "' (" + kindName(timer->kind()) + ")");
    }
    return *timer;
}

void TimerRegistry::start(const std::string& name) {
    at(name).start();
    LOG_TRACE("Timers", "start " + name);
}

void TimerRegistry::stop(const std::string& name) {
    at(name).stop();
    LOG_TRACE("Timers", "stop " + name);
}

void TimerRegistry::trigger(const std::string& name) {
    Entry* e = find(name);
    if (!e) {
        throw TimerError(TimerErrc::TimerNotFound, "no timer named '" + name + "'");
    }
    // hold a reference: the action may replace or remove this entry
    std::shared_ptr<Timer> timer = e->timer;
    timer->stop();
    LOG_TRACE("Timers", "trigger " + name);
    timer->fire();
}

void TimerRegistry::overrideExpiration(const std::string& name, std::int64_t delta) {
    at(name).overrideExpiration(delta);
    LOG_TRACE("Timers", "override " + name + " +" + std::to_string(delta));
}

std::size_t TimerRegistry::poll() {
    // snapshot so actions can add, remove or replace entries mid-pass
    std::vector<Entry> pass = entries_;
    std::size_t fired = 0;

    for (const auto& snap : pass) {
        const Entry* live = find(snap.name);
        if (!live || live->timer != snap.timer) {
            continue; // removed or replaced by an earlier action
        }
        if (snap.timer->check()) {
            ++fired;
            LOG_TRACE("Timers", "fired " + snap.name);
        }
    }
    return fired;
}

bool TimerRegistry::remove(const std::string& name) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e){ return e.name == name; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    LOG_DEBUG("Timers", "Removed timer '" + name + "'");
    return true;
}

} // namespace polltimer
