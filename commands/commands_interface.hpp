#pragma once
#include "commands_core.hpp"

// Utility commands
CommandResult cmdClean(CommandContext& ctx, const std::string& arg);
CommandResult cmdShowHelp(CommandContext& ctx, const std::string& arg);
