#include "commands_timers.hpp"
#include "error_manager.hpp"
#include "bootstrap_config.hpp"
#include "console_history.hpp"
#include "logger.hpp"
#include "timers/timer_registry.hpp"
#include "timers/timer_config.hpp"
#include "timers/timer_errors.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

using polltimer::TimerError;
using polltimer::TimerErrc;

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static std::pair<std::string, std::string> splitFirst(const std::string& arg) {
    auto pos = arg.find_first_of(" \t");
    if (pos == std::string::npos) {
        return {arg, ""};
    }
    auto rest = arg.find_first_not_of(" \t", pos);
    return {arg.substr(0, pos), rest == std::string::npos ? "" : arg.substr(rest)};
}

static bool parseInteger(const std::string& text, long long& out) {
    try {
        size_t used = 0;
        out = std::stoll(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

static CommandResult ok(const std::string& msg, sf::Color color = sf::Color::Green) {
    return { msg, true, color, "ERR_NONE", "routine" };
}

// ------------------------------------------------------------
// [Timer] setup <name> <json>
// ------------------------------------------------------------
CommandResult cmdSetupTimer(CommandContext& ctx, const std::string& arg) {
    auto [name, body] = splitFirst(arg);
    if (name.empty() || body.empty()) {
        return ErrorManager::report("ERR_TIMER_USAGE", "setup <name> <json>");
    }

    nlohmann::json def;
    try {
        def = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw TimerError(TimerErrc::InvalidConfig, std::string("bad JSON: ") + e.what());
    }

    auto cfg = polltimer::parseTimerConfig(def, ctx.actions);
    auto& timer = ctx.registry.setup(name, cfg);
    return ok("[Timer] " + name + " set up as " + polltimer::kindName(timer.kind()) +
              (timer.isSet() ? " (running)" : ""));
}

// ------------------------------------------------------------
// [Timer] start / stop / trigger / remove <name>
// ------------------------------------------------------------
CommandResult cmdStartTimer(CommandContext& ctx, const std::string& arg) {
    if (arg.empty()) return ErrorManager::report("ERR_TIMER_USAGE", "start <name>");
    ctx.registry.start(arg);
    return ok("[Timer] " + arg + " started.");
}

CommandResult cmdStopTimer(CommandContext& ctx, const std::string& arg) {
    if (arg.empty()) return ErrorManager::report("ERR_TIMER_USAGE", "stop <name>");
    ctx.registry.stop(arg);
    return ok("[Timer] " + arg + " stopped.");
}

CommandResult cmdTriggerTimer(CommandContext& ctx, const std::string& arg) {
    if (arg.empty()) return ErrorManager::report("ERR_TIMER_USAGE", "trigger <name>");
    ctx.registry.trigger(arg);
    return ok("[Timer] " + arg + " triggered.", sf::Color::Yellow);
}

CommandResult cmdRemoveTimer(CommandContext& ctx, const std::string& arg) {
    if (arg.empty()) return ErrorManager::report("ERR_TIMER_USAGE", "remove <name>");
    if (!ctx.registry.remove(arg)) {
        throw TimerError(TimerErrc::TimerNotFound, "no timer named '" + arg + "'");
    }
    return ok("[Timer] " + arg + " removed.");
}

// ------------------------------------------------------------
// [Timer] override <name> <delta>
// ------------------------------------------------------------
CommandResult cmdOverrideTimer(CommandContext& ctx, const std::string& arg) {
    auto [name, deltaText] = splitFirst(arg);
    long long delta = 0;
    if (name.empty() || !parseInteger(deltaText, delta)) {
        return ErrorManager::report("ERR_TIMER_USAGE", "override <name> <delta>");
    }
    ctx.registry.overrideExpiration(name, delta);
    return ok("[Timer] " + name + " now expires in " + std::to_string(delta) +
              (ctx.registry.at(name).kind() == polltimer::TimerKind::Long ? " s." : " ms."));
}

// ------------------------------------------------------------
// [Timer] timers (listing)
// ------------------------------------------------------------
CommandResult cmdShowTimers(CommandContext& ctx, [[maybe_unused]] const std::string& arg) {
    auto listing = ctx.registry.list();
    if (listing.size() == 0) {
        return ok("[Timer] No timers registered.", sf::Color::Cyan);
    }

    std::ostringstream oss;
    oss << "[Timer] " << listing.size() << " timer(s):";
    for (const auto& item : listing) {
        oss << "\n" << item.name << ":\n" << item.state;
    }
    CommandResult result = ok(oss.str(), sf::Color::Cyan);
    result.category = "summary";
    return result;
}

// ------------------------------------------------------------
// [Timer] poll / run <ms>
// ------------------------------------------------------------
CommandResult cmdPollTimers(CommandContext& ctx, [[maybe_unused]] const std::string& arg) {
    std::size_t fired = ctx.registry.poll();
    return ok("[Timer] Poll pass fired " + std::to_string(fired) + " timer(s).");
}

std::size_t runPollLoop(CommandContext& ctx, long long durationMs) {
    using clock = std::chrono::steady_clock;
    const auto until = clock::now() + std::chrono::milliseconds(durationMs);
    const auto pause = std::chrono::milliseconds(std::max(ctx.pollIntervalMs, 1));

    std::size_t fired = 0;
    do {
        fired += ctx.registry.poll();
        ctx.history.flush(std::cout);
        std::this_thread::sleep_for(pause);
    } while (clock::now() < until);
    return fired;
}

CommandResult cmdRunTimers(CommandContext& ctx, const std::string& arg) {
    long long durationMs = 0;
    if (!parseInteger(arg, durationMs) || durationMs <= 0) {
        return ErrorManager::report("ERR_TIMER_USAGE", "run <milliseconds>");
    }
    LOG_DEBUG("Timers", "Polling for " + std::to_string(durationMs) + " ms");
    std::size_t fired = runPollLoop(ctx, durationMs);
    return ok("[Timer] Ran " + std::to_string(durationMs) + " ms, " +
              std::to_string(fired) + " timer(s) fired.");
}

// ------------------------------------------------------------
// [Timer] load <file>
// ------------------------------------------------------------
CommandResult cmdLoadTimers(CommandContext& ctx, const std::string& arg) {
    if (arg.empty()) return ErrorManager::report("ERR_TIMER_USAGE", "load <file>");

    auto report = bootstrap_config::loadTimerDefinitions(arg, ctx.registry, ctx.actions);
    if (!report.opened) {
        return ErrorManager::report("ERR_TIMERS_FILE_INVALID", arg);
    }

    std::string msg = "[Timer] Loaded " + std::to_string(report.loaded) + " timer(s) from " + arg;
    if (!report.failed.empty()) {
        msg += ", skipped:";
        for (const auto& name : report.failed) msg += " " + name;
        return { msg, true, sf::Color::Yellow, "ERR_NONE", "routine" };
    }
    return ok(msg);
}

// ------------------------------------------------------------
// [Timer] actions
// ------------------------------------------------------------
CommandResult cmdListActions(CommandContext& ctx, [[maybe_unused]] const std::string& arg) {
    std::string msg = "[Timer] Registered actions:";
    for (const auto& name : ctx.actions.names()) {
        msg += "\n- " + name;
    }
    return ok(msg, sf::Color::Cyan);
}
