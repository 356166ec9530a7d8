#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "commands/commands_core.hpp"

// ------------------------------------------------------------
// Logger (command results)
// ------------------------------------------------------------
namespace Logger {
    // INFO line for successes, ERROR line with the debug text for failures
    void logResult(const CommandResult& result);
}

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Install an error catalog ({"errors": {...}} or a flat object)
    void init(const nlohmann::json& catalog);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Report an error (returns a failed CommandResult). `detail` is
    // appended to both the user and the logged message when present.
    CommandResult report(const std::string& code, const std::string& detail = "");

    // Internal storage
    extern nlohmann::json root;
}
