#pragma once

#include "options.hpp"

namespace cli {

/// Supervisor exit statuses (see sysexits.h for 73 and 78).
constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr int kExitLocked = 73;    // EX_CANTCREAT
constexpr int kExitBootstrap = 78; // EX_CONFIG

/**
 * @brief Create the data and log directories and start the logger.
 *
 * Registers the repository credential as a log secret before anything is
 * logged.
 *
 * @throws std::filesystem::filesystem_error when a directory cannot be made.
 */
void prepare_runtime(const Options& opts);

/**
 * @brief Execute the supervisor run loop.
 *
 * Takes the instance lock, installs the signal handlers and runs
 * selfsync::run_supervisor_loop() with the production hooks. Returns the
 * process exit status: kExitLocked when another supervisor holds the lock,
 * kExitBootstrap when the working copy cannot be populated.
 */
int handle_supervisor_run(const Options& opts);

} // namespace cli
