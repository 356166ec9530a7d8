#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "timer_action.hpp"

namespace polltimer {

// ------------------------------------------------------------
// TimerConfig: typed timer definition
// ------------------------------------------------------------
// interval: ms for short timers, s for long timers. Takes precedence
// over expiration when both are present.
// expiration: absolute fire time in the variant's clock units.
struct TimerConfig {
    std::optional<std::int64_t> interval;
    std::optional<std::int64_t> expiration;
    TimerAction action;
    nlohmann::json args;        // null = no arguments
    bool isLong = false;
    bool running = false;
};

/// Normalize a JSON flag: bool as-is, number != 0, string is false when
/// empty or "false" (any case) and true otherwise, null is false.
bool parseFlag(const nlohmann::json& value);

/// Build a TimerConfig from a JSON timer definition, resolving "action"
/// (with "library" or "source") through the catalog.
/// Throws TimerError(InvalidConfig) for schema errors and
/// TimerError(ActionResolutionFailure) when the action is unknown.
TimerConfig parseTimerConfig(const nlohmann::json& def, const ActionCatalog& catalog);

} // namespace polltimer
