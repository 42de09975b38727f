#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "config_utils.hpp"
#include "logger.hpp"
#include "restart_policy.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::filesystem::path log_dir = "/app/logs";
    std::string log_file = "selfsync.log";
    size_t max_log_size = 10 * 1024 * 1024;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
};

struct RepositoryOptions {
    std::string owner = "agenthatchery";
    std::string name = "cradle";
    std::string token;
    std::string host = "github.com";
    std::string remote_url; ///< explicit URL; overrides owner/name/host/token
    std::string branch = "main";
    std::string remote_name = "origin";
};

struct InstallOptions {
    bool enabled = true;
    std::string manifest = "requirements.txt";
    std::vector<std::string> installer{"pip", "install", "--quiet", "--no-cache-dir", "-r"};
};

struct ChildOptions {
    std::vector<std::string> command{"python", "-m", "cradle.main"};
    std::string code_root_env = "PYTHONPATH";
    std::chrono::milliseconds shutdown_grace{10000};
};

struct Options {
    RepositoryOptions repo;
    std::filesystem::path app_dir = "/app/repo";
    std::filesystem::path bootstrap_dir = "/app";
    std::filesystem::path data_dir = "/app/data";
    LoggingOptions logging;
    InstallOptions install;
    ChildOptions child;
    selfsync::RestartTiming restart;
    std::filesystem::path config_file;
    bool single_run = false;
    bool show_help = false;
    bool print_version = false;
};

/// Longest accepted delay or grace period.
constexpr std::chrono::hours kMaxDuration{24};

/// Invalid command line, environment or config file contents.
class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * Build Options from built-in defaults, the environment, an optional config
 * file (`--config-yaml` / `--config-json`) and the command line, each layer
 * overriding the previous one.
 *
 * Recognized environment variables: GITHUB_ORG, GITHUB_REPO, GITHUB_PAT,
 * GIT_HOST, REPO_URL, GIT_BRANCH, APP_DIR, BOOTSTRAP_DIR, DATA_DIR, LOG_DIR and
 * LOG_LEVEL. Empty variables count as unset.
 *
 * @throws ConfigError on unknown flags or unparsable values.
 */
Options parse_options(int argc, char* argv[]);

/**
 * Remote URL to clone and pull from.
 *
 * Uses RepositoryOptions::remote_url when set, otherwise
 * `https://[token@]host/owner/name.git`. The result may carry a credential and
 * must go through git::redact_url() before it is logged.
 */
std::string effective_remote_url(const RepositoryOptions& repo);

/**
 * Settings taken from the environment, keyed like the matching flags
 * (`GITHUB_ORG` becomes `--repo-owner`).
 */
ConfigValues load_environment_layer();

/**
 * Load the file named by `--config-yaml` or `--config-json`, if any.
 *
 * @param cfg         Receives the file's entries.
 * @param config_file Receives the path that was loaded.
 * @throws ConfigError when the flag has no value or the file cannot be read.
 */
void load_config_layer(int argc, char* argv[], ConfigValues& cfg,
                       std::filesystem::path& config_file);

/// Full path of the supervisor's log file.
std::filesystem::path log_file_path(const Options& opts);

#endif // OPTIONS_HPP
