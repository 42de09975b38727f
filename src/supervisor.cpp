#include "supervisor.hpp"

#include <string>
#include "dependency_installer.hpp"
#include "logger.hpp"
#include "time_utils.hpp"

namespace selfsync {

int run_supervisor_loop(const SupervisorHooks& hooks, const RestartTiming& timing,
                        bool single_run) {
    SyncResult startup = hooks.sync();
    log_info("Startup sync finished", {{"source", to_string(startup.source)},
                                       {"revision", startup.revision}});
    if (hooks.stop_requested())
        return 0;
    hooks.install();

    unsigned long restarts = 0;
    for (;;) {
        if (hooks.stop_requested())
            return 0;
        procutil::ExitOutcome outcome = hooks.run();
        log_info("Managed application exited",
                 {{"result", outcome.describe()},
                  {"runtime", format_duration_short(outcome.runtime)}});
        if (hooks.stop_requested()) {
            log_info("Shutdown requested; not restarting");
            return 0;
        }
        if (single_run)
            return outcome.status;

        RestartDecision decision = decide_restart(outcome, timing);
        ++restarts;
        log_info("Restart decision", {{"state", to_string(decision.state)},
                                      {"action", to_string(decision.action)},
                                      {"delay", format_duration_short(decision.delay)},
                                      {"restart", std::to_string(restarts)}});
        if (decision.resync()) {
            SyncResult result = hooks.pull();
            if (!result.ok())
                log_warning("Self-update pull did not succeed; restarting current code");
            if (hooks.stop_requested())
                return 0;
            hooks.install();
        }
        if (!hooks.sleep(decision.delay))
            return 0;
    }
}

SyncTarget make_sync_target(const Options& opts) {
    SyncTarget t;
    t.working_copy = opts.app_dir;
    t.remote_url = effective_remote_url(opts.repo);
    t.remote_name = opts.repo.remote_name;
    t.branch = opts.repo.branch;
    t.bootstrap_dir = opts.bootstrap_dir;
    t.excluded = {opts.data_dir, opts.logging.log_dir};
    return t;
}

procutil::ChildSpec make_child_spec(const Options& opts) {
    procutil::ChildSpec spec;
    spec.argv = opts.child.command;
    spec.cwd = opts.app_dir;
    const std::string root = opts.app_dir.string();
    spec.env["SELFSYNC_CODE_ROOT"] = root;
    spec.env["SELFSYNC_SUPERVISED"] = "1";
    if (!opts.child.code_root_env.empty())
        spec.env[opts.child.code_root_env] = root;
    return spec;
}

SupervisorHooks make_default_hooks(const Options& opts) {
    SupervisorHooks hooks;
    SyncTarget target = make_sync_target(opts);
    procutil::ChildSpec child = make_child_spec(opts);
    InstallOptions install = opts.install;
    std::filesystem::path app_dir = opts.app_dir;
    std::chrono::milliseconds grace = opts.child.shutdown_grace;

    hooks.sync = [target]() { return sync(target); };
    hooks.pull = [target]() { return pull(target); };
    hooks.install = [install, app_dir]() { install_dependencies(app_dir, install); };
    hooks.run = [child, grace]() {
        log_info("Starting managed application", child.argv.front());
        return procutil::run_child(child, grace);
    };
    hooks.sleep = [](std::chrono::milliseconds d) { return procutil::sleep_unless_terminated(d); };
    hooks.stop_requested = []() { return procutil::termination_requested(); };
    return hooks;
}

} // namespace selfsync
