#include "test_common.hpp"
#include "supervisor.hpp"
#include <csignal>
#include <deque>
#include <stdexcept>

using namespace selfsync;
using procutil::ExitOutcome;

namespace {

/// Scripted collaborators recording the order of calls.
struct FakeWorld {
    std::vector<std::string> events;
    std::deque<ExitOutcome> exits;
    std::vector<std::chrono::milliseconds> sleeps;
    bool stop = false;
    bool sync_fails = false;
    bool bootstrap_fatal = false;
    std::string revision = "c1";
    std::string remote_revision = "c1";

    SupervisorHooks hooks() {
        SupervisorHooks h;
        h.sync = [this]() {
            events.push_back("sync");
            if (bootstrap_fatal)
                throw BootstrapError("no bootstrap");
            SyncResult r;
            r.source = SyncSource::CLONED;
            r.revision = revision;
            return r;
        };
        h.pull = [this]() {
            events.push_back("pull");
            SyncResult r;
            if (sync_fails)
                r.error = "network down";
            else
                revision = remote_revision;
            r.revision = revision;
            return r;
        };
        h.install = [this]() { events.push_back("install"); };
        h.run = [this]() {
            events.push_back("run@" + revision);
            if (exits.empty()) {
                stop = true; // operator signal after the script ends
                return ExitOutcome::killed(SIGTERM);
            }
            ExitOutcome o = exits.front();
            exits.pop_front();
            return o;
        };
        h.sleep = [this](std::chrono::milliseconds d) {
            sleeps.push_back(d);
            return !stop;
        };
        h.stop_requested = [this]() { return stop; };
        return h;
    }
};

} // namespace

TEST_CASE("startup syncs and installs before the first run") {
    selfsync::test_support::ScopedLogFile log("sup_startup");
    FakeWorld w;
    REQUIRE(run_supervisor_loop(w.hooks(), RestartTiming{}) == 0);
    REQUIRE(w.events == std::vector<std::string>{"sync", "install", "run@c1"});
}

TEST_CASE("exit 42 pulls and reinstalls before the next start") {
    selfsync::test_support::ScopedLogFile log("sup_42");
    FakeWorld w;
    w.remote_revision = "c2";
    w.exits = {ExitOutcome::exited(kSelfUpdateExitCode)};
    REQUIRE(run_supervisor_loop(w.hooks(), RestartTiming{}) == 0);
    REQUIRE(w.events ==
            std::vector<std::string>{"sync", "install", "run@c1", "pull", "install", "run@c2"});
    REQUIRE(w.sleeps == std::vector<std::chrono::milliseconds>{std::chrono::seconds(2)});
}

TEST_CASE("other exits back off and restart the unchanged code") {
    selfsync::test_support::ScopedLogFile log("sup_crash");
    FakeWorld w;
    w.remote_revision = "c2";
    w.exits = {ExitOutcome::exited(1), ExitOutcome::exited(1), ExitOutcome::killed(SIGSEGV),
               ExitOutcome::exited(0)};
    RestartTiming timing;
    REQUIRE(run_supervisor_loop(w.hooks(), timing) == 0);
    REQUIRE(w.events == std::vector<std::string>{"sync", "install", "run@c1", "run@c1", "run@c1",
                                                 "run@c1", "run@c1"});
    REQUIRE(w.sleeps.size() == 4);
    for (auto d : w.sleeps)
        REQUIRE(d == timing.crash_backoff);
}

TEST_CASE("a failed self-update pull still restarts the child") {
    selfsync::test_support::ScopedLogFile log("sup_pullfail");
    FakeWorld w;
    w.sync_fails = true;
    w.exits = {ExitOutcome::exited(42)};
    REQUIRE(run_supervisor_loop(w.hooks(), RestartTiming{}) == 0);
    REQUIRE(w.events ==
            std::vector<std::string>{"sync", "install", "run@c1", "pull", "install", "run@c1"});
    REQUIRE(log.contents().find("Self-update pull did not succeed") != std::string::npos);
}

TEST_CASE("a termination request ends the loop without resync") {
    selfsync::test_support::ScopedLogFile log("sup_stop");
    FakeWorld w;
    SupervisorHooks h = w.hooks();
    h.run = [&w]() {
        w.events.push_back("run");
        w.stop = true;
        return ExitOutcome::exited(42);
    };
    REQUIRE(run_supervisor_loop(h, RestartTiming{}) == 0);
    REQUIRE(w.events == std::vector<std::string>{"sync", "install", "run"});
    REQUIRE(w.sleeps.empty());
}

TEST_CASE("an interrupted backoff ends the loop") {
    selfsync::test_support::ScopedLogFile log("sup_sleep");
    FakeWorld w;
    w.exits = {ExitOutcome::exited(3), ExitOutcome::exited(3)};
    SupervisorHooks h = w.hooks();
    h.sleep = [&w](std::chrono::milliseconds d) {
        w.sleeps.push_back(d);
        return false;
    };
    REQUIRE(run_supervisor_loop(h, RestartTiming{}) == 0);
    REQUIRE(w.events == std::vector<std::string>{"sync", "install", "run@c1"});
}

TEST_CASE("single run returns the child status") {
    selfsync::test_support::ScopedLogFile log("sup_once");
    FakeWorld w;
    w.exits = {ExitOutcome::exited(42)};
    REQUIRE(run_supervisor_loop(w.hooks(), RestartTiming{}, true) == 42);
    REQUIRE(w.events == std::vector<std::string>{"sync", "install", "run@c1"});
}

TEST_CASE("bootstrap failure propagates out of the loop") {
    selfsync::test_support::ScopedLogFile log("sup_fatal");
    FakeWorld w;
    w.bootstrap_fatal = true;
    REQUIRE_THROWS_AS(run_supervisor_loop(w.hooks(), RestartTiming{}), BootstrapError);
    REQUIRE(w.events == std::vector<std::string>{"sync"});
}

TEST_CASE("child spec carries the code root") {
    Options opts;
    opts.app_dir = "/srv/agent";
    opts.child.command = {"python3", "main.py"};
    procutil::ChildSpec spec = make_child_spec(opts);
    REQUIRE(spec.argv == std::vector<std::string>{"python3", "main.py"});
    REQUIRE(spec.cwd == fs::path("/srv/agent"));
    REQUIRE(spec.env.at("PYTHONPATH") == "/srv/agent");
    REQUIRE(spec.env.at("SELFSYNC_CODE_ROOT") == "/srv/agent");
    REQUIRE(spec.env.at("SELFSYNC_SUPERVISED") == "1");

    SyncTarget t = make_sync_target(opts);
    REQUIRE(t.working_copy == fs::path("/srv/agent"));
    REQUIRE(t.bootstrap_dir == fs::path("/app"));
    REQUIRE(t.remote_url == "https://github.com/agenthatchery/cradle.git");
    REQUIRE(t.excluded.size() == 2);
}

TEST_CASE("the real hooks run a child from the working copy") {
    selfsync::test_support::ScopedLogFile log("sup_real");
    procutil::reset_termination_state();
    fs::path root = selfsync::test_support::scratch_dir("sup_real");
    Options opts;
    opts.app_dir = root / "repo";
    opts.bootstrap_dir = root / "bootstrap";
    opts.data_dir = root / "data";
    opts.logging.log_dir = root / "logs";
    opts.repo.remote_url = (root / "offline.git").string();
    opts.install.enabled = false;
    fs::create_directories(opts.bootstrap_dir);
    std::ofstream(opts.bootstrap_dir / "run.sh") << "echo \"$SELFSYNC_CODE_ROOT\" > ran.txt\n"
                                                    "exit 42\n";
    opts.child.command = {"/bin/sh", "run.sh"};
    git::GitInitGuard guard;
    REQUIRE(run_supervisor_loop(make_default_hooks(opts), opts.restart, true) == 42);
    REQUIRE(selfsync::test_support::read_file(opts.app_dir / "ran.txt") ==
            opts.app_dir.string() + "\n");
    FS_REMOVE_ALL(root);
}
