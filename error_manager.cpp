#include "error_manager.hpp"
#include "logger.hpp"


// ------------------------------------------------------------
// Logger implementation
// ------------------------------------------------------------
namespace Logger {

    void logResult(const CommandResult& result) {
        if (result.success) {
            LOG_INFO("Command", result.message);
            return;
        }
        if (!result.errorCode.empty() && result.errorCode != "ERR_NONE") {
            LOG_ERROR("Command", result.errorCode + " -> " +
                                 ErrorManager::getDebugMessage(result.errorCode));
        } else {
            LOG_ERROR("Command", result.message);
        }
    }

} // namespace Logger

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
nlohmann::json ErrorManager::root = nlohmann::json::object();

void ErrorManager::init(const nlohmann::json& catalog) {
    if (catalog.contains("errors") && catalog["errors"].is_object()) {
        root = catalog["errors"];
    } else if (catalog.is_object()) {
        root = catalog;
    } else {
        root = nlohmann::json::object();
    }

    std::string codes;
    for (auto& [key, val] : root.items()) {
        codes += key + " ";
    }
    LOG_DEBUG("ErrorManager", "Available error codes: " + codes);
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    if (root.contains(code) && root[code].contains("user")) {
        return root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    if (root.contains(code) && root[code].contains("debug")) {
        return root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

CommandResult ErrorManager::report(const std::string& code, const std::string& detail) {
    std::string userMsg  = getUserMessage(code);
    std::string debugMsg = getDebugMessage(code);
    if (!detail.empty()) {
        userMsg  += ": " + detail;
        debugMsg += " (" + detail + ")";
    }

    CommandResult result;
    result.success   = false;
    result.message   = userMsg;
    result.color     = sf::Color::Red;
    result.errorCode = code;
    result.category  = "error";

    LOG_ERROR("ErrorManager", code + " -> " + debugMsg);
    return result;
}
