#pragma once
#include <stdexcept>
#include <string>

namespace polltimer {

enum class TimerErrc {
    InvalidConfig,            // missing interval/expiration/action, bad field type
    TimerNotFound,            // operation on an unregistered name
    ActionResolutionFailure   // action name not present in the catalog
};

/// Stable code used by ErrorManager (e.g. "ERR_TIMER_NOT_FOUND").
const char* errorCodeFor(TimerErrc code);

class TimerError : public std::runtime_error {
public:
    TimerError(TimerErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    TimerErrc code() const noexcept { return code_; }
    const char* errorCode() const noexcept { return errorCodeFor(code_); }

private:
    TimerErrc code_;
};

} // namespace polltimer
