#include "commands_interface.hpp"
#include "console_history.hpp"

#include <SFML/Graphics/Color.hpp>
#include <string>

// ------------------------------------------------------------
// [Utility] Clear console history
// ------------------------------------------------------------
CommandResult cmdClean(CommandContext& ctx, [[maybe_unused]] const std::string& arg) {
    ctx.history.clear();
    return {
        "[Utility] Console cleared.",
        true,
        sf::Color::Green,
        "ERR_NONE",
        "routine"
    };
}

// ------------------------------------------------------------
// [Utility] Show help text
// ------------------------------------------------------------
CommandResult cmdShowHelp([[maybe_unused]] CommandContext& ctx,
                          [[maybe_unused]] const std::string& arg) {
    std::string helpText =
        "[Help] Available commands:\n"
        "- setup <name> <json>      e.g. setup blink {\"interval\":500,\"action\":\"print\",\"args\":\"tick\"}\n"
        "- start <name>\n"
        "- stop <name>\n"
        "- trigger <name>\n"
        "- override <name> <delta>\n"
        "- remove <name>\n"
        "- timers\n"
        "- poll\n"
        "- run <ms>\n"
        "- load <file>\n"
        "- actions\n"
        "- clean\n"
        "- help\n"
        "- quit";

    return {
        helpText,
        true,
        sf::Color::Cyan,
        "ERR_NONE",
        "summary"
    };
}
