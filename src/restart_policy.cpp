#include "restart_policy.hpp"

#include <algorithm>

namespace selfsync {

RestartDecision decide_restart(const procutil::ExitOutcome& outcome, const RestartTiming& timing) {
    RestartDecision d;
    if (outcome.exited_with(kSelfUpdateExitCode)) {
        d.state = SupervisorState::SELF_UPDATE_REQUESTED;
        d.action = RestartAction::RESYNC_AND_RESTART;
        d.delay = std::max(timing.self_update_delay, kMinSelfUpdateDelay);
        return d;
    }
    d.state = SupervisorState::UNEXPECTED_EXIT;
    d.action = RestartAction::BACKOFF_AND_RESTART;
    d.delay = timing.crash_backoff;
    return d;
}

const char* to_string(SupervisorState state) {
    switch (state) {
    case SupervisorState::AWAITING_CHILD:
        return "awaiting-child";
    case SupervisorState::SELF_UPDATE_REQUESTED:
        return "self-update-requested";
    case SupervisorState::UNEXPECTED_EXIT:
        return "unexpected-exit";
    }
    return "unknown";
}

const char* to_string(RestartAction action) {
    switch (action) {
    case RestartAction::RESYNC_AND_RESTART:
        return "resync-and-restart";
    case RestartAction::BACKOFF_AND_RESTART:
        return "backoff-and-restart";
    case RestartAction::TERMINATE:
        return "terminate";
    }
    return "unknown";
}

} // namespace selfsync
