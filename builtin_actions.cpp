#include "builtin_actions.hpp"
#include "console_history.hpp"
#include "logger.hpp"
#include "timers/timer_action.hpp"
#include "timers/timer_errors.hpp"
#include "timers/timer_registry.hpp"

#include <SFML/Graphics/Color.hpp>
#include <string>

using polltimer::ActionArgs;
using polltimer::TimerErrc;
using polltimer::TimerError;

// ------------------------------------------------------------
// Argument helpers
// ------------------------------------------------------------
static std::string argText(const nlohmann::json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

static std::string timerNameArg(const ActionArgs& args, const char* action) {
    if (args.empty() || !args[0].is_string()) {
        throw TimerError(TimerErrc::InvalidConfig,
                         std::string(action) + " expects a timer name as first argument");
    }
    return args[0].get<std::string>();
}

// ------------------------------------------------------------
// Registration
// ------------------------------------------------------------
void registerBuiltinActions(polltimer::ActionCatalog& catalog,
                            polltimer::TimerRegistry& registry,
                            ConsoleHistory& history) {
    catalog.add("print", [&history](const ActionArgs& args) {
        std::string line;
        for (const auto& a : args) {
            if (!line.empty()) line += ' ';
            line += argText(a);
        }
        LOG_INFO("Action", "print: " + line);
        history.push(line, sf::Color::Yellow);
    });

    catalog.add("start_timer", [&registry](const ActionArgs& args) {
        registry.start(timerNameArg(args, "start_timer"));
    });

    catalog.add("stop_timer", [&registry](const ActionArgs& args) {
        registry.stop(timerNameArg(args, "stop_timer"));
    });

    catalog.add("trigger_timer", [&registry](const ActionArgs& args) {
        registry.trigger(timerNameArg(args, "trigger_timer"));
    });

    catalog.add("override_timer", [&registry](const ActionArgs& args) {
        const std::string name = timerNameArg(args, "override_timer");
        if (args.size() < 2 || !args[1].is_number_integer()) {
            throw TimerError(TimerErrc::InvalidConfig, "override_timer expects [name, delta]");
        }
        registry.overrideExpiration(name, args[1].get<std::int64_t>());
    });

    LOG_DEBUG("Actions", "Built-in actions registered");
}
