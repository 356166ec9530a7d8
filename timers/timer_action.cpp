#include "timer_action.hpp"
#include "timer_errors.hpp"

#include <utility>

namespace polltimer {

ActionArgs expandArgs(const nlohmann::json& args) {
    if (args.is_null()) {
        return {};
    }
    if (args.is_array()) {
        return ActionArgs(args.begin(), args.end());
    }
    ActionArgs single;
    single.push_back(args);
    return single;
}

void TimerAction::invoke(const nlohmann::json& args) const {
    if (!fn) {
        throw TimerError(TimerErrc::InvalidConfig, "action '" + label + "' has no callable bound");
    }
    fn(expandArgs(args));
}

TimerAction makeAction(std::string label, std::function<void()> fn) {
    if (!fn) {
        return {std::move(label), nullptr};
    }
    return {std::move(label), [f = std::move(fn)](const ActionArgs&) { f(); }};
}

TimerAction makeAction(std::string label, ActionFn fn) {
    return {std::move(label), std::move(fn)};
}

// ------------------------------------------------------------
// ActionCatalog
// ------------------------------------------------------------
void ActionCatalog::add(const std::string& name, ActionFn fn, const std::string& source) {
    sources_[source.empty() ? kDefaultSource : source][name] = std::move(fn);
}

TimerAction ActionCatalog::resolve(const std::string& name, const std::string& source) const {
    const std::string from = source.empty() ? kDefaultSource : source;

    auto src = sources_.find(from);
    if (src == sources_.end()) {
        throw TimerError(TimerErrc::ActionResolutionFailure,
                         "unknown action source '" + from + "' for action '" + name + "'");
    }
    auto it = src->second.find(name);
    if (it == src->second.end() || !it->second) {
        throw TimerError(TimerErrc::ActionResolutionFailure,
                         "action '" + name + "' not found in source '" + from + "'");
    }

    std::string label = (from == kDefaultSource) ? name : from + "." + name;
    return {label, it->second};
}

std::vector<std::string> ActionCatalog::names() const {
    std::vector<std::string> out;
    for (const auto& [source, actions] : sources_) {
        for (const auto& [name, _] : actions) {
            out.push_back(source + "." + name);
        }
    }
    return out;
}

} // namespace polltimer
