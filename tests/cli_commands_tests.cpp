#include "test_common.hpp"
#include "cli_commands.hpp"
#include "lockfile.hpp"

using selfsync::test_support::ScopedLogFile;
using selfsync::test_support::scratch_dir;

namespace {

Options offline_options(const fs::path& root) {
    Options opts;
    opts.app_dir = root / "repo";
    opts.bootstrap_dir = root / "bootstrap";
    opts.data_dir = root / "data";
    opts.logging.log_dir = root / "logs";
    opts.repo.remote_url = (root / "missing.git").string();
    opts.install.enabled = false;
    opts.single_run = true;
    return opts;
}

} // namespace

TEST_CASE("second supervisor exits when the lock is held") {
    ScopedLogFile log("cli_locked");
    fs::path root = scratch_dir("cli_locked");
    Options opts = offline_options(root);
    fs::create_directories(opts.data_dir);
    InstanceLock first(opts.data_dir);
    REQUIRE(first.acquired());
    REQUIRE(cli::handle_supervisor_run(opts) == cli::kExitLocked);
    REQUIRE(log.contents().find("Cannot start supervisor") != std::string::npos);
    FS_REMOVE_ALL(root);
}

TEST_CASE("missing bootstrap code is a fatal startup error") {
    ScopedLogFile log("cli_bootstrap");
    procutil::reset_termination_state();
    fs::path root = scratch_dir("cli_bootstrap");
    Options opts = offline_options(root);
    fs::create_directories(opts.data_dir);
    git::GitInitGuard guard;
    REQUIRE(cli::handle_supervisor_run(opts) == cli::kExitBootstrap);
    REQUIRE(log.contents().find("Fatal bootstrap failure") != std::string::npos);
    REQUIRE_FALSE(fs::exists(opts.data_dir / kInstanceLockName));
    FS_REMOVE_ALL(root);
}

TEST_CASE("single run reports the child exit status") {
    ScopedLogFile log("cli_once");
    procutil::reset_termination_state();
    fs::path root = scratch_dir("cli_once");
    Options opts = offline_options(root);
    fs::create_directories(opts.bootstrap_dir);
    std::ofstream(opts.bootstrap_dir / "main.sh") << "exit 5\n";
    opts.child.command = {"/bin/sh", "main.sh"};
    git::GitInitGuard guard;
    REQUIRE(cli::handle_supervisor_run(opts) == 5);
    REQUIRE(fs::exists(opts.app_dir / "main.sh"));
    FS_REMOVE_ALL(root);
}
