#pragma once
#include "commands_core.hpp"

#include <cstddef>
#include <string>

// Timer commands. `arg` is the rest of the input line after the command.
CommandResult cmdSetupTimer(CommandContext& ctx, const std::string& arg);     // <name> <json>
CommandResult cmdStartTimer(CommandContext& ctx, const std::string& arg);     // <name>
CommandResult cmdStopTimer(CommandContext& ctx, const std::string& arg);      // <name>
CommandResult cmdTriggerTimer(CommandContext& ctx, const std::string& arg);   // <name>
CommandResult cmdOverrideTimer(CommandContext& ctx, const std::string& arg);  // <name> <delta>
CommandResult cmdRemoveTimer(CommandContext& ctx, const std::string& arg);    // <name>
CommandResult cmdShowTimers(CommandContext& ctx, const std::string& arg);
CommandResult cmdPollTimers(CommandContext& ctx, const std::string& arg);
CommandResult cmdRunTimers(CommandContext& ctx, const std::string& arg);      // <ms>
CommandResult cmdLoadTimers(CommandContext& ctx, const std::string& arg);     // <file>
CommandResult cmdListActions(CommandContext& ctx, const std::string& arg);

// Poll `registry` every `pollIntervalMs` for `durationMs`, returns fires.
std::size_t runPollLoop(CommandContext& ctx, long long durationMs);
