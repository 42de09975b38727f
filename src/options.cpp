#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_words(const std::string& s) {
    std::istringstream iss(s);
    std::vector<std::string> out;
    std::string w;
    while (iss >> w)
        out.push_back(w);
    return out;
}

fs::path comparable(const fs::path& p) {
    std::error_code ec;
    fs::path n = fs::weakly_canonical(fs::absolute(p), ec);
    if (ec)
        n = fs::absolute(p).lexically_normal();
    if (!n.has_filename() && n.has_parent_path() && n != n.root_path())
        n = n.parent_path();
    return n;
}

} // namespace

// Note: the environment and config file layers live in
// src/options/environment.cpp and src/options/config.cpp.

Options parse_options(int argc, char* argv[]) {
    ConfigValues layered = load_environment_layer();
    ConfigValues file;
    fs::path config_file;
    load_config_layer(argc, argv, file, config_file);

    const std::set<std::string> known{
        "--help",          "--version",       "--config-yaml",   "--config-json",
        "--repo-owner",    "--repo-name",     "--token",         "--git-host",
        "--remote-url",    "--branch",        "--remote",        "--app-dir",
        "--bootstrap-dir", "--data-dir",      "--log-dir",       "--log-file",
        "--log-level",     "--max-log-size",  "--log-files",     "--json-log",
        "--compress-logs", "--syslog",        "--manifest",      "--installer",
        "--no-install",    "--code-root-env", "--update-delay",  "--crash-backoff",
        "--shutdown-grace", "--once",         "--command"};
    const std::map<char, std::string> short_opts{{'h', "--help"},        {'V', "--version"},
                                                 {'y', "--config-yaml"}, {'j', "--config-json"},
                                                 {'L', "--log-level"},   {'b', "--branch"},
                                                 {'1', "--once"}};

    for (const auto& kv : file.values) {
        if (!known.count(kv.first))
            throw ConfigError("Unknown option in config: " + kv.first);
        layered.values[kv.first] = kv.second;
    }
    for (const auto& kv : file.lists) {
        if (kv.first != "--command" && kv.first != "--installer")
            throw ConfigError("Unexpected list in config: " + kv.first);
        layered.lists[kv.first] = kv.second;
    }

    ArgParser parser(argc, argv, known, short_opts);
    if (!parser.unknown_flags().empty())
        throw ConfigError("Unknown option: " + parser.unknown_flags().front());
    if (!parser.positional().empty())
        throw ConfigError("Unexpected argument '" + parser.positional().front() +
                          "' (put the managed command after --)");

    auto value = [&](const std::string& k) -> std::optional<std::string> {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = layered.values.find(k);
        if (it != layered.values.end())
            return it->second;
        return std::nullopt;
    };
    auto required = [&](const std::string& k) -> std::optional<std::string> {
        auto v = value(k);
        if (v && v->empty())
            throw ConfigError(k + " requires a value");
        return v;
    };
    auto flag = [&](const std::string& k) {
        auto v = value(k);
        if (!v)
            return false;
        bool ok = false;
        bool b = parse_bool(*v, ok);
        if (!ok)
            throw ConfigError("Invalid value for " + k + ": " + *v);
        return b;
    };
    auto duration = [&](const std::string& k, std::chrono::milliseconds& out) {
        if (auto v = required(k)) {
            bool ok = false;
            out = parse_time_ms(*v, ok);
            if (!ok)
                throw ConfigError("Invalid duration for " + k + ": " + *v);
            if (out > kMaxDuration)
                throw ConfigError(k + " must not exceed 24h: " + *v);
        }
    };
    auto list = [&](const std::string& k, std::vector<std::string>& out) {
        if (parser.has_flag(k)) {
            out = split_words(parser.get_option(k));
            return;
        }
        auto it = layered.lists.find(k);
        if (it != layered.lists.end()) {
            out = it->second;
            return;
        }
        auto sv = layered.values.find(k);
        if (sv != layered.values.end())
            out = split_words(sv->second);
    };

    Options opts;
    opts.config_file = config_file;
    opts.show_help = flag("--help");
    opts.print_version = flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;

    RepositoryOptions& repo = opts.repo;
    if (auto v = required("--repo-owner"))
        repo.owner = *v;
    if (auto v = required("--repo-name"))
        repo.name = *v;
    if (auto v = value("--token"))
        repo.token = *v;
    if (auto v = required("--git-host"))
        repo.host = *v;
    if (auto v = required("--remote-url"))
        repo.remote_url = *v;
    if (auto v = required("--branch"))
        repo.branch = *v;
    if (auto v = required("--remote"))
        repo.remote_name = *v;

    if (auto v = required("--app-dir"))
        opts.app_dir = *v;
    if (auto v = required("--bootstrap-dir"))
        opts.bootstrap_dir = *v;
    if (auto v = required("--data-dir"))
        opts.data_dir = *v;

    LoggingOptions& logging = opts.logging;
    if (auto v = required("--log-dir"))
        logging.log_dir = *v;
    if (auto v = required("--log-file"))
        logging.log_file = *v;
    if (auto v = required("--log-level")) {
        if (!parse_log_level(*v, logging.log_level))
            throw ConfigError("Invalid value for --log-level: " + *v);
    }
    if (auto v = required("--max-log-size")) {
        bool ok = false;
        logging.max_log_size = parse_bytes(*v, 0, SIZE_MAX, ok);
        if (!ok)
            throw ConfigError("Invalid value for --max-log-size: " + *v);
    }
    if (auto v = required("--log-files")) {
        bool ok = false;
        logging.max_log_files = parse_uint(*v, 0, 100, ok);
        if (!ok)
            throw ConfigError("Invalid value for --log-files: " + *v);
    }
    logging.json_log = flag("--json-log");
    logging.compress_logs = flag("--compress-logs");
    logging.use_syslog = flag("--syslog");

    opts.install.enabled = !flag("--no-install");
    if (auto v = required("--manifest"))
        opts.install.manifest = *v;
    list("--installer", opts.install.installer);

    if (!parser.command().empty())
        opts.child.command = parser.command();
    else
        list("--command", opts.child.command);
    if (auto v = required("--code-root-env"))
        opts.child.code_root_env = *v;
    duration("--shutdown-grace", opts.child.shutdown_grace);

    duration("--update-delay", opts.restart.self_update_delay);
    duration("--crash-backoff", opts.restart.crash_backoff);
    opts.single_run = flag("--once");

    if (repo.remote_url.empty() && (repo.owner.empty() || repo.name.empty()))
        throw ConfigError("Repository owner and name must not be empty");
    if (opts.child.command.empty())
        throw ConfigError("The managed command is empty");
    if (opts.install.enabled && opts.install.installer.empty())
        throw ConfigError("The installer command is empty");
    if (comparable(opts.app_dir) == comparable(opts.bootstrap_dir))
        throw ConfigError("--app-dir and --bootstrap-dir must differ");
    return opts;
}

std::string effective_remote_url(const RepositoryOptions& repo) {
    if (!repo.remote_url.empty())
        return repo.remote_url;
    std::string url = "https://";
    if (!repo.token.empty())
        url += repo.token + "@";
    url += repo.host + "/" + repo.owner + "/" + repo.name + ".git";
    return url;
}

fs::path log_file_path(const Options& opts) {
    return opts.logging.log_dir / opts.logging.log_file;
}
