#ifndef SUPERVISOR_HPP
#define SUPERVISOR_HPP

#include <chrono>
#include <functional>
#include "child_process.hpp"
#include "options.hpp"
#include "repo_sync.hpp"
#include "restart_policy.hpp"

namespace selfsync {

/**
 * Collaborators driven by run_supervisor_loop(). Production code uses
 * make_default_hooks(); tests substitute fakes.
 */
struct SupervisorHooks {
    std::function<SyncResult()> sync;    ///< cold-start clone or pull; may throw BootstrapError
    std::function<SyncResult()> pull;    ///< pull-only update after a self-update request
    std::function<void()> install;       ///< best-effort dependency install
    std::function<procutil::ExitOutcome()> run; ///< run the managed application once
    /// Wait; returns `false` when interrupted by a termination request.
    std::function<bool(std::chrono::milliseconds)> sleep;
    std::function<bool()> stop_requested;
};

/**
 * Startup sync and install, then run the child forever, consulting
 * decide_restart() after every exit.
 *
 * @param single_run Return after the first child exit.
 * @return 0 after a termination request, or the child's status when
 *         @a single_run is set.
 * @throws BootstrapError from the startup sync.
 */
int run_supervisor_loop(const SupervisorHooks& hooks, const RestartTiming& timing,
                        bool single_run = false);

/// Hooks wired to the real repository, installer and child process.
SupervisorHooks make_default_hooks(const Options& opts);

/// Sync parameters derived from the options.
SyncTarget make_sync_target(const Options& opts);

/// Child command, working directory and environment derived from the options.
procutil::ChildSpec make_child_spec(const Options& opts);

} // namespace selfsync

#endif // SUPERVISOR_HPP
