#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "timers/clock_source.hpp"
#include "timers/timer_config.hpp"
#include "timers/timer_errors.hpp"
#include "timers/timer_registry.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
static bool mergeDefaults(nlohmann::json& cfg,
                          const nlohmann::json& defs,
                          const std::string& prefix = "",
                          int* patchedCount = nullptr) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal,
                              prefix.empty() ? key : prefix + "." + key,
                              patchedCount))
                patched = true;
        } else if (cfg[key].type() != defVal.type() &&
                   !(cfg[key].is_number() && defVal.is_number())) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

static void writeJson(const fs::path& path, const nlohmann::json& j) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        LOG_ERROR("Config", "Could not write " + path.string());
        return;
    }
    out << j.dump(2) << "\n";
}

// ----------------- defaults -----------------
namespace bootstrap_config {

nlohmann::json defaultSettings() {
    Settings s;
    return {
        {"log_file", s.logFile},
        {"log_level", "debug"},
        {"poll_interval_ms", s.pollIntervalMs},
        {"tick_period", s.tickPeriod},
        {"timers_file", s.timersFile},
        {"errors_file", s.errorsFile}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_TIMER_INVALID_CONFIG", {
            {"user", "[Timer] Invalid timer definition"},
            {"debug", "Timer definition lacks interval/expiration/action or has a bad field."}
        }},
        {"ERR_TIMER_NOT_FOUND", {
            {"user", "[Timer] No such timer"},
            {"debug", "Registry lookup failed for the requested timer name."}
        }},
        {"ERR_TIMER_ACTION_UNRESOLVED", {
            {"user", "[Timer] Unknown action"},
            {"debug", "Action name not registered in the action catalog."}
        }},
        {"ERR_TIMER_USAGE", {
            {"user", "[Timer] Usage"},
            {"debug", "Timer command called with missing or malformed arguments."}
        }},
        {"ERR_TIMERS_FILE_INVALID", {
            {"user", "[Timer] Could not load timer definitions"},
            {"debug", "Timer definitions file missing, unreadable, or not a JSON object."}
        }},
        {"ERR_CORE_UNKNOWN_COMMAND", {
            {"user", "[Core] Unknown command"},
            {"debug", "No handler registered for the command name."}
        }},
        {"ERR_CMD_EXCEPTION", {
            {"user", "[Core] Command failed"},
            {"debug", "A command handler threw an exception."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Settings file invalid, reset to defaults."},
            {"debug", "polltimer_config.json failed parsing."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        writeJson(path, outConfig);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;
        if (!outConfig.is_object()) {
            throw std::runtime_error("top-level value is not an object");
        }

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, "", &patchedCount)) {
            writeJson(path, outConfig);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid (" + e.what() + ") -> reset to defaults");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode);

        outConfig = defaults;
        writeJson(path, outConfig);
        return false;
    }
}

Settings parseSettings(const nlohmann::json& cfg) {
    Settings s;
    if (!cfg.is_object()) return s;

    if (cfg.contains("log_file") && cfg["log_file"].is_string())
        s.logFile = cfg["log_file"].get<std::string>();
    if (cfg.contains("log_level") && cfg["log_level"].is_string())
        s.logLevel = parseLogLevel(cfg["log_level"].get<std::string>(), s.logLevel);
    if (cfg.contains("poll_interval_ms") && cfg["poll_interval_ms"].is_number_integer()) {
        int ms = cfg["poll_interval_ms"].get<int>();
        if (ms > 0) s.pollIntervalMs = ms;
    }
    if (cfg.contains("tick_period") && cfg["tick_period"].is_number_integer()) {
        auto period = cfg["tick_period"].get<std::int64_t>();
        if (period > 0 && period <= UINT32_MAX &&
            polltimer::isValidTickPeriod(static_cast<std::uint32_t>(period))) {
            s.tickPeriod = static_cast<std::uint32_t>(period);
        } else {
            LOG_ERROR("Config", "tick_period " + std::to_string(period) +
                                " is not a power of two, using default");
        }
    }
    if (cfg.contains("timers_file") && cfg["timers_file"].is_string())
        s.timersFile = cfg["timers_file"].get<std::string>();
    if (cfg.contains("errors_file") && cfg["errors_file"].is_string())
        s.errorsFile = cfg["errors_file"].get<std::string>();
    return s;
}

// ----------------- timer definitions -----------------
TimerLoadReport applyTimerDefinitions(const nlohmann::json& defs,
                                      polltimer::TimerRegistry& registry,
                                      const polltimer::ActionCatalog& catalog) {
    TimerLoadReport report;
    if (!defs.is_object()) {
        LOG_ERROR("Config", "Timer definitions must be a JSON object of name -> definition");
        return report;
    }
    report.opened = true;

    for (auto& [name, def] : defs.items()) {
        try {
            registry.setup(name, polltimer::parseTimerConfig(def, catalog));
            report.loaded++;
        } catch (const polltimer::TimerError& e) {
            ErrorManager::report(e.errorCode(), name + ": " + e.what());
            report.failed.push_back(name);
        }
    }
    return report;
}

TimerLoadReport loadTimerDefinitions(const fs::path& path,
                                     polltimer::TimerRegistry& registry,
                                     const polltimer::ActionCatalog& catalog) {
    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("Config", "Could not open timer definitions: " + path.string());
        LOG_PHASE("Timer definitions load", false);
        return {};
    }

    nlohmann::json defs;
    try {
        in >> defs;
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("Config", "Failed to parse " + path.string() + " -> " + e.what());
        LOG_PHASE("Timer definitions load", false);
        return {};
    }

    TimerLoadReport report = applyTimerDefinitions(defs, registry, catalog);
    LOG_PHASE("Timer definitions load", report.opened && report.failed.empty());
    LOG_DEBUG("Config", "Loaded " + std::to_string(report.loaded) + " timer(s) from " + path.string());
    return report;
}

// ----------------- entry -----------------
Settings initAll(const fs::path& configPath) {
    // polltimer_config.json
    nlohmann::json settingsCfg;
    loadConfig(configPath, defaultSettings(), settingsCfg, "Settings", "ERR_CONFIG_INVALID");
    Settings settings = parseSettings(settingsCfg);
    setLogLevel(settings.logLevel);

    // errors.json (relative paths resolve next to the settings file)
    fs::path errPath = settings.errorsFile;
    if (errPath.is_relative()) {
        errPath = configPath.parent_path() / errPath;
    }
    nlohmann::json errorsCfg;
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config");
    ErrorManager::init(errorsCfg);

    return settings;
}

} // namespace bootstrap_config
