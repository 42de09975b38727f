#include "help_text.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <vector>
#include <map>
#include <cstring>
#include <string>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--repo-owner", "", "<name>", "Repository owner [GITHUB_ORG]", "Repository"},
        {"--repo-name", "", "<name>", "Repository name [GITHUB_REPO]", "Repository"},
        {"--token", "", "<token>", "Access token embedded in the URL [GITHUB_PAT]", "Repository"},
        {"--git-host", "", "<host>", "Git host (default github.com) [GIT_HOST]", "Repository"},
        {"--remote-url", "", "<url>", "Full remote URL, overrides the above [REPO_URL]",
         "Repository"},
        {"--branch", "-b", "<name>", "Branch to track (default main) [GIT_BRANCH]", "Repository"},
        {"--remote", "", "<name>", "Remote name (default origin)", "Repository"},
        {"--app-dir", "", "<path>", "Working copy the application runs from [APP_DIR]", "Paths"},
        {"--bootstrap-dir", "", "<path>", "Read-only fallback copy [BOOTSTRAP_DIR]", "Paths"},
        {"--data-dir", "", "<path>", "Data directory holding the instance lock [DATA_DIR]",
         "Paths"},
        {"--log-dir", "", "<path>", "Log directory [LOG_DIR]", "Paths"},
        {"--manifest", "", "<file>", "Dependency manifest (default requirements.txt)",
         "Install"},
        {"--installer", "", "<cmd>", "Installer command, manifest appended", "Install"},
        {"--no-install", "", "", "Skip dependency installation", "Install"},
        {"--code-root-env", "", "<var>", "Variable set to the working copy (PYTHONPATH)",
         "Process"},
        {"--update-delay", "", "<ms|s|m>", "Delay after a self-update request (default 2s)",
         "Process"},
        {"--crash-backoff", "", "<ms|s|m>", "Delay after any other exit (default 10s)",
         "Process"},
        {"--shutdown-grace", "", "<ms|s|m>", "Wait before SIGKILL on shutdown (default 10s)",
         "Process"},
        {"--once", "-1", "", "Run one cycle and exit with the child's status", "Process"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR [LOG_LEVEL]", "Logging"},
        {"--log-file", "", "<name>", "Log file name inside the log directory", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate when the log reaches this size", "Logging"},
        {"--log-files", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--json-log", "", "", "Write JSON log lines", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Mirror log lines to syslog", "Logging"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--version", "-V", "", "Print the version", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        width = std::max(width, flag.size());
    }

    std::cout << "selfsync - self-updating process supervisor\n";
    std::cout << "Keeps a working copy on the latest commit of a branch and runs an\n";
    std::cout << "application from it. Exit status 42 from the application means\n";
    std::cout << "\"pull and restart me\"; any other exit is retried after a backoff.\n\n";
    std::cout << "Usage: " << prog << " [options] [-- command args...]\n\n";
    const std::vector<std::string> order{"Basics",  "Repository", "Paths", "Install",
                                         "Process", "Logging",    "Config"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::string flag = "  ";
            if (std::strlen(o->short_flag))
                flag += std::string(o->short_flag) + ", ";
            else
                flag += "    ";
            flag += o->long_flag;
            if (std::strlen(o->arg))
                flag += " " + std::string(o->arg);
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag << o->desc
                      << "\n";
        }
        std::cout << "\n";
    }
}
