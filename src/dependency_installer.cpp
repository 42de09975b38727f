#include "dependency_installer.hpp"

#include <stdexcept>
#include <system_error>
#include "logger.hpp"
#include "time_utils.hpp"

namespace selfsync {

bool install_dependencies(const std::filesystem::path& target, const InstallOptions& opts,
                          const CommandRunner& runner) {
    if (!opts.enabled) {
        log_debug("Dependency install disabled");
        return true;
    }
    std::error_code ec;
    const std::filesystem::path manifest = target / opts.manifest;
    if (!std::filesystem::is_regular_file(manifest, ec)) {
        log_debug("No dependency manifest", manifest.string());
        return true;
    }
    procutil::ChildSpec spec;
    spec.argv = opts.installer;
    spec.argv.push_back(opts.manifest);
    spec.cwd = target;
    std::string cmdline;
    for (const auto& a : spec.argv)
        cmdline += (cmdline.empty() ? "" : " ") + a;
    log_info("Installing dependencies", cmdline);

    procutil::ExitOutcome outcome;
    try {
        outcome = runner ? runner(spec) : procutil::run_child(spec);
    } catch (const std::exception& e) {
        log_warning("Dependency install could not run", e.what());
        return false;
    }
    if (outcome.exited_with(0)) {
        log_info("Dependencies installed",
                 {{"duration", format_duration_short(outcome.runtime)}});
        return true;
    }
    log_warning("Dependency install failed; continuing",
                {{"result", outcome.describe()}, {"command", cmdline}});
    return false;
}

} // namespace selfsync
