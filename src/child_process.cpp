#include "child_process.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logger.hpp"
#include "system_utils.hpp"
#include "time_utils.hpp"

namespace procutil {

namespace {

volatile std::sig_atomic_t g_term_signal = 0;
std::atomic<pid_t> g_child_pid{-1};
std::atomic<bool> g_busy{false};
std::optional<ChildProcessHandle> g_active;
std::mutex g_active_mtx;

void on_termination_signal(int sig) {
    g_term_signal = sig;
    pid_t child = g_child_pid.load();
    if (child > 0)
        kill(child, sig);
}

struct BusyGuard {
    ~BusyGuard() {
        g_child_pid.store(-1);
        {
            std::lock_guard<std::mutex> lk(g_active_mtx);
            g_active.reset();
        }
        g_busy.store(false);
    }
};

ExitOutcome classify(int status) {
    if (WIFSIGNALED(status))
        return ExitOutcome::killed(WTERMSIG(status));
    if (WIFEXITED(status))
        return ExitOutcome::exited(WEXITSTATUS(status));
    ExitOutcome o;
    o.status = 1;
    return o;
}

// Blocking waitpid that retries on EINTR. Returns false on a real error.
bool wait_blocking(pid_t pid, int& status) {
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            return false;
    }
    return true;
}

// Give a signalled child @p grace to exit, then SIGKILL it.
bool reap_after_termination(pid_t pid, std::chrono::milliseconds grace, int& status) {
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid)
            return true;
        if (r < 0 && errno != EINTR)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    log_warning("Child ignored termination request, sending SIGKILL",
                {{"pid", std::to_string(pid)}, {"grace", format_duration_short(grace)}});
    kill(pid, SIGKILL);
    return wait_blocking(pid, status);
}

} // namespace

std::string ExitOutcome::describe() const {
    if (launch_failed)
        return "failed to launch (status " + std::to_string(status) + ")";
    if (signaled) {
        const char* name = strsignal(signal);
        std::string out = "killed by signal " + std::to_string(signal);
        if (name)
            out += std::string(" (") + name + ")";
        return out;
    }
    return "exit status " + std::to_string(status);
}

ExitOutcome run_child(const ChildSpec& spec, std::chrono::milliseconds shutdown_grace) {
    if (spec.argv.empty())
        throw std::invalid_argument("run_child: empty command");
    bool expected = false;
    if (!g_busy.compare_exchange_strong(expected, true))
        throw std::logic_error("run_child: a child process is already running");
    BusyGuard busy;

    // Everything the child touches between fork and exec is prepared here;
    // only async-signal-safe calls are made in the child.
    std::vector<std::string> env = build_environment(spec.env);
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& a : spec.argv)
        argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& e : env)
        envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);
    std::string cwd = spec.cwd.string();

    UniqueFd err_rd;
    UniqueFd err_wr;
    if (!make_cloexec_pipe(err_rd, err_wr)) {
        log_error("pipe2 failed: " + errno_message(errno));
        ExitOutcome o = ExitOutcome::exited(kLaunchFailureStatus);
        o.launch_failed = true;
        return o;
    }

    auto started = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        log_error("fork failed: " + errno_message(errno));
        ExitOutcome o = ExitOutcome::exited(kLaunchFailureStatus);
        o.launch_failed = true;
        return o;
    }
    if (pid == 0) {
        int err = 0;
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            err = errno;
        } else {
            execvpe(argv[0], argv.data(), envp.data());
            err = errno;
        }
        ssize_t ignored = write(err_wr.get(), &err, sizeof(err));
        (void)ignored;
        _exit(kLaunchFailureStatus);
    }

    g_child_pid.store(pid);
    {
        std::lock_guard<std::mutex> lk(g_active_mtx);
        g_active = ChildProcessHandle{pid, spec.cwd, started};
    }
    if (g_term_signal != 0)
        kill(pid, g_term_signal); // signal raced the fork
    err_wr.reset();

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(err_rd.get(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);

    int status = 0;
    bool reaped = false;
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        reaped = wait_blocking(pid, status);
        g_child_pid.store(-1);
        log_error("Failed to launch " + spec.argv.front(),
                  {{"cwd", cwd}, {"error", errno_message(exec_errno)}});
        ExitOutcome o = ExitOutcome::exited(kLaunchFailureStatus);
        o.launch_failed = true;
        o.runtime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (!reaped)
            log_error("waitpid failed: " + errno_message(errno));
        return o;
    }

    log_debug("Child started", {{"pid", std::to_string(pid)}, {"cwd", cwd}});
    while (true) {
        if (g_term_signal != 0) {
            log_info("Waiting for child to exit after signal",
                     {{"pid", std::to_string(pid)},
                      {"signal", std::to_string(static_cast<int>(g_term_signal))}});
            reaped = reap_after_termination(pid, shutdown_grace, status);
            break;
        }
        pid_t r = waitpid(pid, &status, 0);
        if (r == pid) {
            reaped = true;
            break;
        }
        if (r < 0 && errno == EINTR)
            continue;
        break;
    }
    // The pid may be reused as soon as it is reaped.
    if (reaped)
        g_child_pid.store(-1);

    ExitOutcome outcome;
    if (reaped) {
        outcome = classify(status);
    } else {
        log_error("waitpid failed: " + errno_message(errno), {{"pid", std::to_string(pid)}});
        outcome = ExitOutcome::exited(1);
    }
    outcome.runtime =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    return outcome;
}

pid_t signal_forward_target() { return g_child_pid.load(); }

std::optional<ChildProcessHandle> active_child() {
    std::lock_guard<std::mutex> lk(g_active_mtx);
    return g_active;
}

void install_termination_handlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_termination_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0; // no SA_RESTART: waitpid must return EINTR
    for (int sig : {SIGTERM, SIGINT, SIGHUP}) {
        if (sigaction(sig, &sa, nullptr) != 0)
            log_warning("sigaction failed for signal " + std::to_string(sig) + ": " +
                        errno_message(errno));
    }
}

bool termination_requested() { return g_term_signal != 0; }

int termination_signal() { return static_cast<int>(g_term_signal); }

void request_termination(int sig) { on_termination_signal(sig); }

void reset_termination_state() { g_term_signal = 0; }

bool sleep_unless_terminated(std::chrono::milliseconds dur) {
    auto deadline = std::chrono::steady_clock::now() + dur;
    while (!termination_requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(100)));
    }
    return false;
}

} // namespace procutil
