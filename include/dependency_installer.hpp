#ifndef DEPENDENCY_INSTALLER_HPP
#define DEPENDENCY_INSTALLER_HPP

#include <filesystem>
#include <functional>
#include "child_process.hpp"
#include "options.hpp"

namespace selfsync {

/// Runs one external command to completion.
using CommandRunner = std::function<procutil::ExitOutcome(const procutil::ChildSpec&)>;

/**
 * Best-effort install of the manifest's dependencies.
 *
 * Runs `installer... <manifest>` inside @a target with inherited output
 * streams. A missing manifest is a no-op; a failing or missing installer is
 * logged as a warning. Never throws for installer failures.
 *
 * @param runner Executes the installer; procutil::run_child() when empty.
 * @return `true` when nothing had to be done or the installer succeeded.
 */
bool install_dependencies(const std::filesystem::path& target, const InstallOptions& opts,
                          const CommandRunner& runner = {});

} // namespace selfsync

#endif // DEPENDENCY_INSTALLER_HPP
