#include "commands_core.hpp"
#include "commands_timers.hpp"
#include "commands_interface.hpp"

#include "console_history.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "timers/timer_errors.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

// ------------------------------------------------------------
// Globals
// ------------------------------------------------------------
std::unordered_map<std::string, CommandFunc> commandMap;

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static int levenshteinDistance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.size(), n = s2.size();
    std::vector<int> prev(n + 1), curr(n + 1);

    for (size_t j = 0; j <= n; j++) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= m; i++) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= n; j++) {
            int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
            curr[j] = std::min({ prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost });
        }
        prev.swap(curr);
    }
    return prev[n];
}

static std::string fuzzyMatch(const std::string& input) {
    std::string best = input;
    int bestDist = 2; // only allow corrections within distance 1

    for (const auto& [key, _] : commandMap) {
        int dist = levenshteinDistance(input, key);
        if (dist < bestDist) {
            bestDist = dist;
            best = key;
        }
    }
    return best;
}

static std::string normalizeCommand(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (commandMap.count(out)) {
        return out;
    }
    return fuzzyMatch(out);
}

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    auto end   = s.find_last_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

// ------------------------------------------------------------
// Command Registration
// ------------------------------------------------------------
static void initCommands() {
    if (!commandMap.empty()) return; // already initialized

    commandMap = {
        // --- Timers ---
        {"setup",    cmdSetupTimer},
        {"start",    cmdStartTimer},
        {"stop",     cmdStopTimer},
        {"trigger",  cmdTriggerTimer},
        {"override", cmdOverrideTimer},
        {"remove",   cmdRemoveTimer},
        {"timers",   cmdShowTimers},
        {"poll",     cmdPollTimers},
        {"run",      cmdRunTimers},
        {"load",     cmdLoadTimers},
        {"actions",  cmdListActions},

        // --- Interface ---
        {"clean",    cmdClean},
        {"help",     cmdShowHelp}
    };
}

// ------------------------------------------------------------
// Core Dispatch
// ------------------------------------------------------------
std::pair<std::string, std::string> parseInput(const std::string& input) {
    const std::string line = trim(input);
    auto pos = line.find(' ');
    if (pos == std::string::npos) {
        return {line, ""};
    }
    return {line.substr(0, pos), trim(line.substr(pos + 1))};
}

CommandResult dispatchCommand(CommandContext& ctx, const std::string& cmd, const std::string& arg) {
    initCommands();

    auto it = commandMap.find(cmd);
    if (it == commandMap.end()) {
        LOG_DEBUG("Dispatch", "Unknown command: \"" + cmd + "\"");
        return ErrorManager::report("ERR_CORE_UNKNOWN_COMMAND", cmd);
    }

    LOG_TRACE("Dispatch", "Found handler for cmd=\"" + cmd + "\" arg=\"" + arg + "\"");
    try {
        return it->second(ctx, arg);
    } catch (const polltimer::TimerError& e) {
        return ErrorManager::report(e.errorCode(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Dispatch", "Exception in command \"" + cmd + "\": " + e.what());
        return ErrorManager::report("ERR_CMD_EXCEPTION", e.what());
    }
}

// ------------------------------------------------------------
// handleCommand: parse -> dispatch -> log -> history
// ------------------------------------------------------------
CommandResult handleCommand(CommandContext& ctx, const std::string& line) {
    initCommands();

    auto [cmdRaw, arg] = parseInput(line);
    ctx.history.push("> " + line, sf::Color::White);

    const std::string cmd = normalizeCommand(cmdRaw);
    if (cmd != cmdRaw) {
        LOG_DEBUG("Dispatch", "Corrected \"" + cmdRaw + "\" -> \"" + cmd + "\"");
    }

    CommandResult result = dispatchCommand(ctx, cmd, arg);

    if (result.message.empty()) {
        result.message = "[no response configured]";
        result.success = false;
    }

    Logger::logResult(result);
    ctx.history.push(result.message, result.color);
    return result;
}
