#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <string>
#include <filesystem>
#include <optional>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
    GitInitGuard(const GitInitGuard&) = delete;
    GitInitGuard& operator=(const GitInitGuard&) = delete;
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using object_ptr = GitHandle<git_object, git_object_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;

/// Outcome of fast_forward().
enum class PullStatus {
    UP_TO_DATE,     ///< nothing to do (or the local branch is ahead)
    FAST_FORWARDED, ///< branch and work tree moved to the remote commit
    DIVERGED,       ///< local and remote history split; nothing changed
    LOCAL_CHANGES,  ///< uncommitted changes block the checkout; nothing changed
    FAILED          ///< open, fetch or lookup error; nothing changed
};

const char* to_string(PullStatus status);

/// Maximum number of times the credential callback answers per operation.
constexpr int kMaxCredentialAttempts = 3;

/// Password sent when the URL carries only a token in the user part.
constexpr const char* kTokenPassword = "x-oauth-basic";

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Determine whether the given path is a Git repository.
 *
 * @param p Filesystem path to check.
 * @return `true` if a `.git` directory exists inside @a p.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Get the commit hash pointed to by `HEAD`.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return 40 character hexadecimal commit hash or `std::nullopt` on error.
 */
std::optional<std::string> get_local_hash(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Retrieve the currently checked out branch name.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Branch name or `std::nullopt` if it cannot be determined.
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Obtain the URL of the specified remote.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Remote URL as a string or `std::nullopt` on failure.
 */
std::optional<std::string> get_remote_url(const fs::path& repo, const std::string& remote,
                                          std::string* error = nullptr);

/**
 * @brief Point @a remote at @a url, creating the remote if it is missing.
 *
 * @return `true` on success.
 */
bool set_remote_url(const fs::path& repo, const std::string& remote, const std::string& url,
                    std::string* error = nullptr);

/**
 * @brief Clone @a branch of a repository from a remote URL.
 *
 * @param dest   Destination path; must be missing or empty.
 * @param url    Remote repository URL, optionally carrying a credential.
 * @param branch Branch to check out.
 * @param error  Optional output string receiving a libgit2 error message.
 * @return `true` on success, `false` otherwise.
 */
bool clone_repo(const fs::path& dest, const std::string& url, const std::string& branch,
                std::string* error = nullptr);

/**
 * @brief Turn an existing non-repository directory into a clone.
 *
 * Initializes a repository in @a dest, adds @a remote pointing at @a url,
 * fetches and force-checks out @a branch over the files already present.
 * When any step fails the created `.git` directory is removed again so the
 * directory is left as it was found.
 *
 * @return `true` on success.
 */
bool adopt_directory(const fs::path& dest, const std::string& remote, const std::string& url,
                     const std::string& branch, std::string* error = nullptr);

/**
 * @brief Fast-forward-only update of @a branch from @a remote.
 *
 * Fetches the remote, then moves the checked out branch to the remote
 * commit with a safe checkout. Diverged history or local changes that the
 * checkout would overwrite leave the repository untouched.
 *
 * @param repo         Path to a Git repository.
 * @param remote       Remote name, normally `origin`.
 * @param branch       Branch that must be checked out locally.
 * @param out_pull_log Receives a short description of what happened.
 * @return Outcome of the update.
 */
PullStatus fast_forward(const fs::path& repo, const std::string& remote, const std::string& branch,
                        std::string& out_pull_log);

/**
 * @brief libgit2 credential callback for URLs carrying `user[:password]@`.
 *
 * A token-only user part is sent with kTokenPassword. @a payload must point
 * to an `int` attempt counter; the callback gives up after
 * kMaxCredentialAttempts calls so a rejected credential fails fast.
 */
int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload);

/**
 * @brief Replace the user part of a URL with `***`.
 *
 * `https://token@github.com/o/r.git` becomes `https://***@github.com/o/r.git`;
 * URLs without a user part are returned unchanged.
 */
std::string redact_url(const std::string& url);

/**
 * @brief Extract the user part of a URL (`user` or `user:password`).
 *
 * @return Empty string when the URL carries no credential.
 */
std::string url_userinfo(const std::string& url);

} // namespace git

#endif // GIT_UTILS_HPP
