#include "test_common.hpp"
#include "lockfile.hpp"
#include <csignal>
#include <sys/wait.h>

TEST_CASE("InstanceLock is exclusive while held") {
    fs::path dir = selfsync::test_support::scratch_dir("lock");
    {
        InstanceLock first(dir);
        REQUIRE(first.acquired());
        REQUIRE(fs::exists(dir / kInstanceLockName / "pid"));
        REQUIRE(first.path() == dir / kInstanceLockName);
    }
    REQUIRE_FALSE(fs::exists(dir / kInstanceLockName));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("InstanceLock refuses a lock held by a running process") {
    fs::path dir = selfsync::test_support::scratch_dir("lock_busy");
    pid_t child = fork();
    REQUIRE(child >= 0);
    if (child == 0) {
        pause();
        _exit(0);
    }
    fs::create_directories(dir / kInstanceLockName);
    std::ofstream(dir / kInstanceLockName / "pid") << child;
    {
        InstanceLock lock(dir);
        REQUIRE_FALSE(lock.acquired());
        REQUIRE(lock.holder() == child);
        REQUIRE(lock.error().find(std::to_string(child)) != std::string::npos);
    }
    REQUIRE(fs::exists(dir / kInstanceLockName));
    kill(child, SIGKILL);
    int status = 0;
    waitpid(child, &status, 0);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("InstanceLock replaces a stale lock") {
    fs::path dir = selfsync::test_support::scratch_dir("lock_stale");
    pid_t child = fork();
    REQUIRE(child >= 0);
    if (child == 0)
        _exit(0);
    int status = 0;
    waitpid(child, &status, 0);
    fs::create_directories(dir / kInstanceLockName);
    std::ofstream(dir / kInstanceLockName / "pid") << child;
    InstanceLock lock(dir);
    REQUIRE(lock.acquired());
    std::ifstream ifs(dir / kInstanceLockName / "pid");
    long pid = 0;
    ifs >> pid;
    REQUIRE(pid == static_cast<long>(getpid()));
    FS_REMOVE_ALL(dir);
}
