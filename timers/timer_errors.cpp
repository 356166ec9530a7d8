#include "timer_errors.hpp"

namespace polltimer {

const char* errorCodeFor(TimerErrc code) {
    switch (code) {
        case TimerErrc::InvalidConfig:           return "ERR_TIMER_INVALID_CONFIG";
        case TimerErrc::TimerNotFound:           return "ERR_TIMER_NOT_FOUND";
        case TimerErrc::ActionResolutionFailure: return "ERR_TIMER_ACTION_UNRESOLVED";
    }
    return "ERR_TIMER_UNKNOWN";
}

} // namespace polltimer
