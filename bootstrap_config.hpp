#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>
#include "logger.hpp"

namespace polltimer {
class TimerRegistry;
class ActionCatalog;
}

// Centralized settings + error catalog + timer definitions bootstrap
namespace bootstrap_config {

    // Runtime settings (polltimer_config.json)
    struct Settings {
        std::string logFile = "polltimer.log";
        LogLevel logLevel = LogLevel::Debug;
        int pollIntervalMs = 10;
        std::uint32_t tickPeriod = 1u << 30;
        std::string timersFile = "timers.json";
        std::string errorsFile = "errors.json";
    };

    // Outcome of loading a timer definitions file
    struct TimerLoadReport {
        bool opened = false;                 // file read and parsed as an object
        std::size_t loaded = 0;              // entries registered
        std::vector<std::string> failed;     // names skipped because of errors
    };

    // Load settings and the error catalog; creates missing files from
    // defaults next to `configPath`.
    Settings initAll(const std::filesystem::path& configPath);

    // Generic loader: ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Typed view of a settings object (invalid values fall back to defaults)
    Settings parseSettings(const nlohmann::json& cfg);

    // Register every { "<name>": {<timer definition>} } entry. Broken
    // entries are reported and skipped; the others still load.
    TimerLoadReport applyTimerDefinitions(const nlohmann::json& defs,
                                          polltimer::TimerRegistry& registry,
                                          const polltimer::ActionCatalog& catalog);

    TimerLoadReport loadTimerDefinitions(const std::filesystem::path& path,
                                         polltimer::TimerRegistry& registry,
                                         const polltimer::ActionCatalog& catalog);

    // Canonical defaults
    nlohmann::json defaultSettings();
    nlohmann::json defaultErrors();
}
