#ifndef REPO_SYNC_HPP
#define REPO_SYNC_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace selfsync {
namespace fs = std::filesystem;

/// Where the code in the working copy came from.
enum class SyncSource { CLONED, PULLED, FALLBACK };

const char* to_string(SyncSource source);

struct SyncResult {
    SyncSource source = SyncSource::PULLED;
    std::optional<std::string> error; ///< set when the remote could not be used
    std::string revision;             ///< HEAD after the sync, empty for a fallback copy

    bool ok() const { return !error; }
};

/// Neither a clone nor the bootstrap copy could populate the working copy.
class BootstrapError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct SyncTarget {
    fs::path working_copy;
    std::string remote_url; ///< may carry a credential; never log unredacted
    std::string remote_name = "origin";
    std::string branch = "main";
    fs::path bootstrap_dir;
    /// Paths the bootstrap copy must never write into or copy from
    /// (data and log directories).
    std::vector<fs::path> excluded;
};

/**
 * Make sure the working copy exists and is at the latest revision of the
 * branch.
 *
 * - Existing repository: fast-forward-only pull (see pull()).
 * - Empty or missing directory: clone.
 * - Non-empty directory without `.git` (an earlier fallback copy): adopt it
 *   in place by fetching and force-checking out the branch.
 *
 * When clone or adoption fails the bootstrap directory is copied into the
 * working copy and the result is SyncSource::FALLBACK with the error kept.
 *
 * @throws BootstrapError when the fallback copy is impossible too.
 */
SyncResult sync(const SyncTarget& target);

/**
 * Pull-only update used after a self-update request. Refreshes the remote
 * URL first so a rotated credential is picked up, then fast-forwards. Never
 * clones; failures are reported in SyncResult::error and leave the working
 * copy untouched.
 */
SyncResult pull(const SyncTarget& target);

/**
 * Recursively copy @a from into @a to, overwriting files that exist.
 *
 * The top-level `.git` of @a from is skipped, as are @a to itself and every
 * path in @a excluded; directories that merely contain one of those are
 * descended into.
 *
 * @return Number of files and symlinks copied.
 * @throws fs::filesystem_error on I/O failure.
 */
size_t copy_bootstrap(const fs::path& from, const fs::path& to,
                      const std::vector<fs::path>& excluded = {});

} // namespace selfsync

#endif // REPO_SYNC_HPP
