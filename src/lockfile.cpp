#include "lockfile.hpp"
#include <cerrno>
#include <fstream>
#include <system_error>
#include <unistd.h>
#include <signal.h>
#include "logger.hpp"

namespace {

bool process_running(pid_t pid) {
    if (pid <= 0)
        return false;
    return kill(pid, 0) == 0 || errno != ESRCH;
}

pid_t read_pid(const std::filesystem::path& file) {
    std::ifstream f(file);
    long pid = 0;
    if (f)
        f >> pid;
    return static_cast<pid_t>(pid);
}

} // namespace

InstanceLock::InstanceLock(const std::filesystem::path& data_dir)
    : lock_dir_(data_dir / kInstanceLockName) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (fs::exists(lock_dir_, ec)) {
        pid_t pid = read_pid(lock_dir_ / "pid");
        if (pid != 0 && pid != getpid() && process_running(pid)) {
            holder_ = pid;
            err_ = "Another supervisor is already running (PID " + std::to_string(pid) + ")";
            return;
        }
        log_warning("Removing stale instance lock", lock_dir_.string());
        fs::remove_all(lock_dir_, ec);
        if (ec) {
            err_ = "Failed to remove stale lock " + lock_dir_.string() + ": " + ec.message();
            return;
        }
    }
    if (!fs::create_directory(lock_dir_, ec)) {
        err_ = "Failed to create lock directory " + lock_dir_.string();
        if (ec)
            err_ += ": " + ec.message();
        return;
    }
    std::ofstream out(lock_dir_ / "pid");
    out << getpid();
    if (!out) {
        err_ = "Failed to write " + (lock_dir_ / "pid").string();
        fs::remove_all(lock_dir_, ec);
        return;
    }
    locked_ = true;
}

InstanceLock::~InstanceLock() {
    if (locked_) {
        std::error_code ec;
        std::filesystem::remove_all(lock_dir_, ec);
    }
}

bool InstanceLock::acquired() const { return locked_; }
const std::string& InstanceLock::error() const { return err_; }
pid_t InstanceLock::holder() const { return holder_; }
const std::filesystem::path& InstanceLock::path() const { return lock_dir_; }
