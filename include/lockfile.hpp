#ifndef LOCKFILE_HPP
#define LOCKFILE_HPP
#include <filesystem>
#include <string>
#include <sys/types.h>

/// Name of the lock directory created inside the data directory.
constexpr const char* kInstanceLockName = ".selfsync-lock";

/** RAII class that creates a lock directory inside the supervisor's data
 *  directory so two supervisors never manage the same working copy. A lock
 *  left behind by a process that is no longer running is replaced. */
class InstanceLock {
  public:
    explicit InstanceLock(const std::filesystem::path& data_dir);
    ~InstanceLock();
    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    bool acquired() const;
    const std::string& error() const;
    /// PID of the instance holding the lock when acquisition failed, else 0.
    pid_t holder() const;
    const std::filesystem::path& path() const;

  private:
    std::filesystem::path lock_dir_;
    bool locked_ = false;
    pid_t holder_ = 0;
    std::string err_;
};

#endif // LOCKFILE_HPP
