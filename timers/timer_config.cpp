#include "timer_config.hpp"
#include "timer_errors.hpp"

#include <algorithm>
#include <cctype>

namespace polltimer {

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::optional<std::int64_t> readTime(const nlohmann::json& def, const char* key) {
    if (!def.contains(key) || def[key].is_null()) {
        return std::nullopt;
    }
    const auto& v = def[key];
    if (!v.is_number_integer()) {
        throw TimerError(TimerErrc::InvalidConfig,
                         std::string("'") + key + "' must be an integer, got " + v.dump());
    }
    return v.get<std::int64_t>();
}

static std::string readString(const nlohmann::json& def, const char* key) {
    if (!def.contains(key) || def[key].is_null()) {
        return "";
    }
    if (!def[key].is_string()) {
        throw TimerError(TimerErrc::InvalidConfig,
                         std::string("'") + key + "' must be a string, got " + def[key].dump());
    }
    return def[key].get<std::string>();
}

static nlohmann::json field(const nlohmann::json& def, const char* key) {
    auto it = def.find(key);
    return it == def.end() ? nlohmann::json() : *it;
}

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
bool parseFlag(const nlohmann::json& value) {
    if (value.is_null())    return false;
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number())  return value.get<double>() != 0.0;
    if (value.is_string()) {
        const std::string s = value.get<std::string>();
        return !s.empty() && toLower(s) != "false";
    }
    // objects/arrays: truthy when non-empty
    return !value.empty();
}

TimerConfig parseTimerConfig(const nlohmann::json& def, const ActionCatalog& catalog) {
    if (!def.is_object()) {
        throw TimerError(TimerErrc::InvalidConfig, "timer definition must be a JSON object");
    }

    TimerConfig cfg;
    cfg.interval   = readTime(def, "interval");
    cfg.expiration = readTime(def, "expiration");
    if (!cfg.interval && !cfg.expiration) {
        throw TimerError(TimerErrc::InvalidConfig,
                         "timer definition needs 'interval' or 'expiration'");
    }

    const std::string action = readString(def, "action");
    if (action.empty()) {
        throw TimerError(TimerErrc::InvalidConfig, "timer definition needs an 'action'");
    }
    std::string source = readString(def, "library");
    if (source.empty()) {
        source = readString(def, "source");
    }
    cfg.action = catalog.resolve(action, source);

    cfg.isLong  = parseFlag(field(def, "long"));
    cfg.running = parseFlag(field(def, "running"));
    cfg.args    = field(def, "args");
    return cfg;
}

} // namespace polltimer
