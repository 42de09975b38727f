/**
 * @file selfsync.cpp
 * @brief CLI entry point of the self-updating supervisor.
 *
 * Parses the layered configuration, prepares logging and hands control to
 * the supervisor loop, which keeps the working copy synchronized with the
 * remote branch and restarts the managed application as it exits.
 */

#include <filesystem>
#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return 0 after an operator shutdown, 2 on configuration errors, 73 when
 *         another instance holds the lock, 78 on a fatal bootstrap failure
 *         and 1 on unexpected errors.
 */
#ifndef SELFSYNC_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    int rc = cli::kExitFailure;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return cli::kExitOk;
        }
        if (opts.print_version) {
            std::cout << SELFSYNC_VERSION << "\n";
            return cli::kExitOk;
        }
        cli::prepare_runtime(opts);
        rc = cli::handle_supervisor_run(opts);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage.\n";
        rc = cli::kExitUsage;
    } catch (const std::exception& e) {
        if (logger_initialized())
            log_error("Unexpected error", e.what());
        std::cerr << redact_secrets(e.what()) << "\n";
        rc = cli::kExitFailure;
    }
    shutdown_logger();
    return rc;
}
#endif // SELFSYNC_NO_MAIN
