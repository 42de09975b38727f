#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <map>
#include <string>
#include <vector>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX file descriptors.
 *
 * Closes the descriptor when the object goes out of scope.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/**
 * @brief Create a pipe whose ends are closed on exec.
 *
 * @return `false` with errno set when pipe2() fails.
 */
bool make_cloexec_pipe(UniqueFd& read_end, UniqueFd& write_end);

/**
 * @brief Copy of the current environment with @p overrides applied.
 *
 * Entries are `KEY=VALUE` strings ready to be handed to execve().
 */
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides);

/**
 * @brief Read an environment variable, treating empty values as unset.
 */
std::string getenv_or(const char* name, const std::string& fallback);

/**
 * @brief Text for an errno value.
 */
std::string errno_message(int err);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
