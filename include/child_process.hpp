#ifndef CHILD_PROCESS_HPP
#define CHILD_PROCESS_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace procutil {

/// Status reported when the program could not be started, as a shell does.
constexpr int kLaunchFailureStatus = 127;

/**
 * @brief Immutable result of one child run.
 *
 * @ref status holds the exit status for a normal exit, `128 + signal` when
 * the child was killed by a signal, and @ref kLaunchFailureStatus when it
 * never got to run.
 */
struct ExitOutcome {
    int status = 0;
    bool signaled = false;
    int signal = 0;
    bool launch_failed = false;
    std::chrono::milliseconds runtime{0};

    /// `true` for a normal exit with exactly @p code.
    bool exited_with(int code) const { return !signaled && !launch_failed && status == code; }

    /// Human readable summary, e.g. "exit status 1" or "killed by signal 9 (Killed)".
    std::string describe() const;

    static ExitOutcome exited(int code) {
        ExitOutcome o;
        o.status = code;
        return o;
    }
    static ExitOutcome killed(int sig) {
        ExitOutcome o;
        o.signaled = true;
        o.signal = sig;
        o.status = 128 + sig;
        return o;
    }
};

/// What to run: argv (argv[0] is looked up on PATH), working directory and
/// environment overrides applied on top of the inherited environment.
struct ChildSpec {
    std::vector<std::string> argv;
    std::filesystem::path cwd;
    std::map<std::string, std::string> env;
};

/// The one running child, if any.
struct ChildProcessHandle {
    pid_t pid = -1;
    std::filesystem::path cwd;
    std::chrono::steady_clock::time_point started;
};

/**
 * @brief Start @p spec and block until it terminates.
 *
 * Output streams are inherited. While the child runs, a termination signal
 * delivered to the supervisor is forwarded to it; if the child is still
 * alive @p shutdown_grace later it is sent SIGKILL.
 *
 * @throws std::invalid_argument if @p spec has no argv.
 * @throws std::logic_error if another child is already being supervised.
 */
ExitOutcome run_child(const ChildSpec& spec,
                      std::chrono::milliseconds shutdown_grace = std::chrono::seconds(10));

/// Snapshot of the child currently being waited on.
std::optional<ChildProcessHandle> active_child();

/// PID that termination signals are forwarded to, or -1 once it is reaped.
pid_t signal_forward_target();

/**
 * @brief Route SIGTERM, SIGINT and SIGHUP to the termination handler.
 *
 * The handler records the signal and forwards it to the active child. It is
 * installed without SA_RESTART so a blocking wait notices it.
 */
void install_termination_handlers();

/// `true` once a termination signal has been received.
bool termination_requested();

/// Signal number that requested termination, 0 if none.
int termination_signal();

/// Same effect as receiving @p sig: record it and forward it to the child.
void request_termination(int sig);

/// Clear a recorded termination request.
void reset_termination_state();

/**
 * @brief Sleep for @p dur unless termination is requested first.
 *
 * @return `false` when the sleep was cut short by a termination request.
 */
bool sleep_unless_terminated(std::chrono::milliseconds dur);

} // namespace procutil

#endif // CHILD_PROCESS_HPP
