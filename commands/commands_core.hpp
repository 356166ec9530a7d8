#pragma once
#include <string>
#include <unordered_map>
#include <utility>
#include <SFML/Graphics/Color.hpp>

// Forward declarations
class ConsoleHistory;
namespace polltimer {
class TimerRegistry;
class ActionCatalog;
}

// ------------------------------------------------------------
// CommandResult: unified return type for all commands
// ------------------------------------------------------------
struct CommandResult {
    std::string message;                    // user-facing text
    bool success = true;                    // true if command succeeded
    sf::Color color = sf::Color::White;     // console display color
    std::string errorCode = "ERR_NONE";     // code for ErrorManager/Logger
    std::string category = "routine";       // routine | summary | error
};

// ------------------------------------------------------------
// CommandContext: what every command works on
// ------------------------------------------------------------
struct CommandContext {
    polltimer::TimerRegistry& registry;
    polltimer::ActionCatalog& actions;
    ConsoleHistory& history;
    int pollIntervalMs = 10;    // sleep between passes for `run`
};

// ------------------------------------------------------------
// Function pointer type for commands
// ------------------------------------------------------------
using CommandFunc = CommandResult(*)(CommandContext& ctx, const std::string& arg);

// Name -> handler table (filled on first dispatch)
extern std::unordered_map<std::string, CommandFunc> commandMap;

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input);
CommandResult dispatchCommand(CommandContext& ctx, const std::string& cmd, const std::string& arg);

// Parse, dispatch, log, and push the result into the console history.
CommandResult handleCommand(CommandContext& ctx, const std::string& line);
