#ifndef RESTART_POLICY_HPP
#define RESTART_POLICY_HPP

#include <chrono>
#include <string>
#include "child_process.hpp"

namespace selfsync {

/// Exit status a managed application returns to ask for a pull and restart.
constexpr int kSelfUpdateExitCode = 42;

/// Lower bound for the self-update delay so a child that exits with
/// @ref kSelfUpdateExitCode on every start cannot spin the supervisor.
constexpr std::chrono::milliseconds kMinSelfUpdateDelay{1000};

enum class SupervisorState { AWAITING_CHILD, SELF_UPDATE_REQUESTED, UNEXPECTED_EXIT };

enum class RestartAction {
    RESYNC_AND_RESTART,  ///< pull, reinstall, short delay, restart
    BACKOFF_AND_RESTART, ///< long delay, restart with the same code
    TERMINATE            ///< never produced by decide_restart(); the loop is infinite
};

struct RestartTiming {
    std::chrono::milliseconds self_update_delay{2000};
    std::chrono::milliseconds crash_backoff{10000};
};

struct RestartDecision {
    SupervisorState state = SupervisorState::AWAITING_CHILD;
    RestartAction action = RestartAction::BACKOFF_AND_RESTART;
    std::chrono::milliseconds delay{0};

    bool resync() const { return action == RestartAction::RESYNC_AND_RESTART; }
};

/**
 * @brief Map a finished child run to the supervisor's next step.
 *
 * Only a normal exit with status @ref kSelfUpdateExitCode requests a code
 * refresh. Everything else, including status 0 and death by signal, is an
 * unexpected exit that is retried with unchanged code after
 * @p timing.crash_backoff.
 */
RestartDecision decide_restart(const procutil::ExitOutcome& outcome, const RestartTiming& timing);

const char* to_string(SupervisorState state);
const char* to_string(RestartAction action);

} // namespace selfsync

#endif // RESTART_POLICY_HPP
