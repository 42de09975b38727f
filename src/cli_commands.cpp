#include "cli_commands.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include "git_utils.hpp"
#include "lockfile.hpp"
#include "logger.hpp"
#include "supervisor.hpp"
#include "version.hpp"

namespace fs = std::filesystem;

namespace cli {

void prepare_runtime(const Options& opts) {
    fs::create_directories(opts.data_dir);
    fs::create_directories(opts.logging.log_dir);

    if (!opts.repo.token.empty())
        add_log_secret(opts.repo.token);
    std::string userinfo = git::url_userinfo(effective_remote_url(opts.repo));
    if (!userinfo.empty()) {
        add_log_secret(userinfo);
        size_t colon = userinfo.find(':');
        if (colon != std::string::npos && colon + 1 < userinfo.size())
            add_log_secret(userinfo.substr(colon + 1));
    }

    const LoggingOptions& lo = opts.logging;
    set_json_logging(lo.json_log);
    set_log_compression(lo.compress_logs);
    init_logger(log_file_path(opts).string(), lo.log_level, lo.max_log_size, lo.max_log_files);
    if (lo.use_syslog)
        init_syslog();
}

int handle_supervisor_run(const Options& opts) {
    InstanceLock lock(opts.data_dir);
    if (!lock.acquired()) {
        log_error("Cannot start supervisor", lock.error());
        std::cerr << lock.error() << std::endl;
        return kExitLocked;
    }

    log_info(std::string("selfsync ") + SELFSYNC_VERSION + " starting",
             {{"app_dir", opts.app_dir.string()},
              {"bootstrap_dir", opts.bootstrap_dir.string()},
              {"remote", git::redact_url(effective_remote_url(opts.repo))},
              {"branch", opts.repo.branch},
              {"config", opts.config_file.string()}});

    procutil::install_termination_handlers();
    int rc = kExitOk;
    try {
        rc = selfsync::run_supervisor_loop(selfsync::make_default_hooks(opts), opts.restart,
                                           opts.single_run);
    } catch (const selfsync::BootstrapError& e) {
        log_error("Fatal bootstrap failure", e.what());
        return kExitBootstrap;
    }
    if (procutil::termination_requested())
        log_info("Supervisor stopped by signal " + std::to_string(procutil::termination_signal()));
    return rc;
}

} // namespace cli
