#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace polltimer {

// Positional arguments handed to an action when it runs.
using ActionArgs = std::vector<nlohmann::json>;
using ActionFn   = std::function<void(const ActionArgs&)>;

/// Expand bound args: null -> no arguments, array -> one per element,
/// anything else -> a single argument.
ActionArgs expandArgs(const nlohmann::json& args);

// ------------------------------------------------------------
// TimerAction: invocable handle + label shown in listings
// ------------------------------------------------------------
struct TimerAction {
    std::string label;
    ActionFn fn;

    explicit operator bool() const { return static_cast<bool>(fn); }

    void invoke(const nlohmann::json& args) const;
};

/// Wrap a callable that takes no arguments.
TimerAction makeAction(std::string label, std::function<void()> fn);

/// Wrap a callable that takes the expanded positional args.
TimerAction makeAction(std::string label, ActionFn fn);

// ------------------------------------------------------------
// ActionCatalog
// ------------------------------------------------------------
// Explicit callback registration. Timer definitions name their action
// (and optionally a source); the catalog turns that into a handle once,
// when the definition is parsed.
class ActionCatalog {
public:
    static constexpr const char* kDefaultSource = "main";

    void add(const std::string& name, ActionFn fn,
             const std::string& source = kDefaultSource);

    /// Throws TimerError(ActionResolutionFailure) if the action is unknown.
    /// An empty source means the default source.
    TimerAction resolve(const std::string& name, const std::string& source = "") const;

    /// "source.name" for every registered action, sorted.
    std::vector<std::string> names() const;

private:
    std::map<std::string, std::map<std::string, ActionFn>> sources_;
};

} // namespace polltimer
