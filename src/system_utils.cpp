#include "system_utils.hpp"
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

extern char** environ;

namespace procutil {

bool make_cloexec_pipe(UniqueFd& read_end, UniqueFd& write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        return false;
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (!overrides.count(key))
            env.push_back(std::move(entry));
    }
    for (const auto& [k, v] : overrides)
        env.push_back(k + "=" + v);
    return env;
}

std::string getenv_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    if (v && *v)
        return std::string(v);
    return fallback;
}

std::string errno_message(int err) {
    char buf[256];
    // GNU strerror_r may return a static string instead of filling buf
    const char* msg = strerror_r(err, buf, sizeof(buf));
    return std::string(msg ? msg : "unknown error");
}

} // namespace procutil
