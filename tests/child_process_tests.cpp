#include "test_common.hpp"
#include <csignal>
#include <thread>

using procutil::ChildSpec;
using procutil::ExitOutcome;

namespace {

ChildSpec shell(const std::string& script, const fs::path& cwd = {}) {
    ChildSpec spec;
    spec.argv = {"/bin/sh", "-c", script};
    spec.cwd = cwd;
    return spec;
}

} // namespace

TEST_CASE("run_child reports the exit status") {
    ExitOutcome ok = procutil::run_child(shell("exit 0"));
    REQUIRE(ok.exited_with(0));
    ExitOutcome update = procutil::run_child(shell("exit 42"));
    REQUIRE(update.exited_with(42));
    REQUIRE_FALSE(update.signaled);
    REQUIRE(update.describe() == "exit status 42");
}

TEST_CASE("run_child reports signal deaths") {
    ExitOutcome o = procutil::run_child(shell("kill -9 $$"));
    REQUIRE(o.signaled);
    REQUIRE(o.signal == SIGKILL);
    REQUIRE(o.status == 128 + SIGKILL);
    REQUIRE_FALSE(o.exited_with(42));
    REQUIRE(o.describe().find("signal 9") != std::string::npos);
}

TEST_CASE("run_child sets working directory and environment") {
    fs::path dir = selfsync::test_support::scratch_dir("child_env");
    ChildSpec spec = shell("pwd > out.txt; echo \"$SELFSYNC_TEST_ROOT\" >> out.txt", dir);
    spec.env["SELFSYNC_TEST_ROOT"] = dir.string();
    ExitOutcome o = procutil::run_child(spec);
    REQUIRE(o.exited_with(0));
    std::ifstream ifs(dir / "out.txt");
    std::string cwd_line, env_line;
    std::getline(ifs, cwd_line);
    std::getline(ifs, env_line);
    REQUIRE(fs::equivalent(cwd_line, dir));
    REQUIRE(env_line == dir.string());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("run_child reports launch failures as status 127") {
    ChildSpec spec;
    spec.argv = {"selfsync-no-such-program-xyz"};
    ExitOutcome o = procutil::run_child(spec);
    REQUIRE(o.launch_failed);
    REQUIRE(o.status == procutil::kLaunchFailureStatus);
    REQUIRE_FALSE(o.exited_with(procutil::kLaunchFailureStatus));

    ChildSpec bad_cwd = shell("exit 0", "/nonexistent/selfsync/dir");
    ExitOutcome o2 = procutil::run_child(bad_cwd);
    REQUIRE(o2.launch_failed);
}

TEST_CASE("run_child rejects an empty command") {
    REQUIRE_THROWS_AS(procutil::run_child(ChildSpec{}), std::invalid_argument);
}

TEST_CASE("run_child is single-flight") {
    std::atomic<bool> started{false};
    std::thread t([&] {
        started = true;
        procutil::run_child(shell("sleep 1"));
    });
    while (!started.load() || !procutil::active_child())
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    auto handle = procutil::active_child();
    REQUIRE(handle);
    REQUIRE(handle->pid > 0);
    REQUIRE_THROWS_AS(procutil::run_child(shell("exit 0")), std::logic_error);
    t.join();
    REQUIRE_FALSE(procutil::active_child());
}

TEST_CASE("signals are only forwarded to an unreaped child") {
    REQUIRE(procutil::signal_forward_target() == -1);
    std::atomic<pid_t> seen{-1};
    std::atomic<pid_t> active{-1};
    std::thread watcher([&] {
        while (!procutil::active_child())
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        active = procutil::active_child()->pid;
        seen = procutil::signal_forward_target();
    });
    ExitOutcome o = procutil::run_child(shell("sleep 0.3"));
    watcher.join();
    REQUIRE(o.exited_with(0));
    REQUIRE(seen.load() == active.load());
    REQUIRE(procutil::signal_forward_target() == -1);
}

TEST_CASE("request_termination forwards the signal to the child") {
    procutil::reset_termination_state();
    std::thread stopper([] {
        while (!procutil::active_child())
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        procutil::request_termination(SIGTERM);
    });
    ExitOutcome o = procutil::run_child(shell("sleep 5"), std::chrono::milliseconds(500));
    stopper.join();
    REQUIRE(procutil::termination_requested());
    REQUIRE(o.signaled);
    REQUIRE(o.runtime < std::chrono::seconds(5));
    procutil::reset_termination_state();
}

TEST_CASE("a child ignoring SIGTERM is killed after the grace period") {
    procutil::reset_termination_state();
    procutil::request_termination(SIGTERM);
    ExitOutcome o = procutil::run_child(shell("trap '' TERM; sleep 5"),
                                        std::chrono::milliseconds(300));
    REQUIRE(o.signaled);
    REQUIRE((o.signal == SIGTERM || o.signal == SIGKILL));
    REQUIRE(o.runtime < std::chrono::seconds(5));
    procutil::reset_termination_state();
}

TEST_CASE("sleep_unless_terminated stops early on termination") {
    procutil::reset_termination_state();
    REQUIRE(procutil::sleep_unless_terminated(std::chrono::milliseconds(20)));
    procutil::request_termination(SIGTERM);
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(procutil::sleep_unless_terminated(std::chrono::seconds(5)));
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));
    REQUIRE(procutil::termination_signal() == SIGTERM);
    procutil::reset_termination_state();
}
