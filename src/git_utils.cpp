#include "git_utils.hpp"
#include <system_error>

using namespace std;

namespace git {

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

const char* to_string(PullStatus status) {
    switch (status) {
    case PullStatus::UP_TO_DATE:
        return "up-to-date";
    case PullStatus::FAST_FORWARDED:
        return "fast-forwarded";
    case PullStatus::DIVERGED:
        return "diverged";
    case PullStatus::LOCAL_CHANGES:
        return "local-changes";
    case PullStatus::FAILED:
        return "failed";
    }
    return "unknown";
}

/**
 * @brief Locate the user part of a `scheme://user@host/...` URL.
 *
 * @return Start offset and length, or `npos` when there is none.
 */
static pair<size_t, size_t> userinfo_span(const string& url) {
    size_t scheme = url.find("://");
    if (scheme == string::npos)
        return {string::npos, 0};
    size_t start = scheme + 3;
    size_t end = url.find('/', start);
    size_t at = url.rfind('@', end == string::npos ? string::npos : end);
    if (at == string::npos || at < start)
        return {string::npos, 0};
    return {start, at - start};
}

string url_userinfo(const string& url) {
    auto span = userinfo_span(url);
    if (span.first == string::npos)
        return "";
    return url.substr(span.first, span.second);
}

string redact_url(const string& url) {
    auto span = userinfo_span(url);
    if (span.first == string::npos || span.second == 0)
        return url;
    string out = url;
    out.replace(span.first, span.second, "***");
    return out;
}

int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload) {
    int* attempts = static_cast<int*>(payload);
    if (attempts && ++*attempts > kMaxCredentialAttempts)
        return GIT_PASSTHROUGH; // credential was rejected; stop retrying
    string info = url ? url_userinfo(url) : "";
    string user = info;
    string pass;
    size_t colon = info.find(':');
    if (colon != string::npos) {
        user = info.substr(0, colon);
        pass = info.substr(colon + 1);
    }
    if (user.empty() && username_from_url)
        user = username_from_url;
    if (user.empty())
        return GIT_PASSTHROUGH;
    if (pass.empty())
        pass = kTokenPassword;
    if (allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT)
        return git_credential_userpass_plaintext_new(out, user.c_str(), pass.c_str());
    if (allowed_types & GIT_CREDENTIAL_USERNAME)
        return git_credential_username_new(out, user.c_str());
    return GIT_PASSTHROUGH;
}

/**
 * @brief Determine whether a path is a Git repository.
 *
 * @param p Filesystem path to inspect.
 * @return True if a `.git` directory exists.
 */
bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p / ".git", ec);
}

/**
 * @brief Convert a libgit2 object ID to a hexadecimal string.
 */
static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

static string short_hex(const git_oid& oid) { return oid_to_hex(oid).substr(0, 7); }

/**
 * @brief Populate an error string with the last libgit2 error message.
 *
 * @param error Output string receiving the error description.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

static string last_error(const string& fallback) {
    const git_error* e = git_error_last();
    if (e && e->message)
        return e->message;
    return fallback;
}

/**
 * @brief Fetch options using the URL credential callback.
 *
 * @param attempts Counter handed to credential_cb(); must outlive the fetch.
 */
static git_fetch_options make_fetch_options(int& attempts) {
    git_fetch_options fetch_opts = GIT_FETCH_OPTIONS_INIT;
    fetch_opts.callbacks.credentials = credential_cb;
    fetch_opts.callbacks.payload = &attempts;
    return fetch_opts;
}

optional<string> get_local_hash(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw);
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

optional<string> get_current_branch(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw);
    git_reference* head = nullptr;
    if (git_repository_head(&head, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr ref(head);
    const char* name = git_reference_shorthand(ref.get());
    string branch = name ? name : "";
    if (branch.empty()) {
        set_error(error);
        return nullopt;
    }
    return branch;
}

optional<string> get_remote_url(const fs::path& repo, const string& remote, string* error) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw_repo);
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);
    const char* url = git_remote_url(remote_handle.get());
    if (!url) {
        set_error(error);
        return nullopt;
    }
    return string(url);
}

bool set_remote_url(const fs::path& repo, const string& remote, const string& url,
                    string* error) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0) {
        set_error(error);
        return false;
    }
    repo_ptr r(raw_repo);
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        if (git_remote_create(&raw_remote, r.get(), remote.c_str(), url.c_str()) != 0) {
            set_error(error);
            return false;
        }
        remote_ptr created(raw_remote);
        return true;
    }
    remote_ptr remote_handle(raw_remote);
    const char* current = git_remote_url(remote_handle.get());
    if (current && url == current)
        return true;
    if (git_remote_set_url(r.get(), remote.c_str(), url.c_str()) != 0) {
        set_error(error);
        return false;
    }
    return true;
}

bool clone_repo(const fs::path& dest, const std::string& url, const std::string& branch,
                std::string* error) {
    int attempts = 0;
    git_clone_options opts = GIT_CLONE_OPTIONS_INIT;
    opts.fetch_opts = make_fetch_options(attempts);
    opts.checkout_branch = branch.c_str();
    git_repository* raw_repo = nullptr;
    if (git_clone(&raw_repo, url.c_str(), dest.string().c_str(), &opts) != 0) {
        set_error(error);
        return false;
    }
    repo_ptr repo(raw_repo);
    return true;
}

static bool adopt_into(const fs::path& dest, const string& remote, const string& url,
                       const string& branch, string* error) {
    git_repository* raw_repo = nullptr;
    if (git_repository_init(&raw_repo, dest.string().c_str(), 0) != 0) {
        set_error(error);
        return false;
    }
    repo_ptr r(raw_repo);
    git_remote* raw_remote = nullptr;
    if (git_remote_create(&raw_remote, r.get(), remote.c_str(), url.c_str()) != 0) {
        set_error(error);
        return false;
    }
    remote_ptr remote_handle(raw_remote);
    int attempts = 0;
    git_fetch_options fetch_opts = make_fetch_options(attempts);
    if (git_remote_fetch(remote_handle.get(), nullptr, &fetch_opts, nullptr) != 0) {
        set_error(error);
        return false;
    }
    git_oid oid;
    string remote_ref = "refs/remotes/" + remote + "/" + branch;
    if (git_reference_name_to_id(&oid, r.get(), remote_ref.c_str()) != 0) {
        set_error(error);
        return false;
    }
    git_object* raw_target = nullptr;
    if (git_object_lookup(&raw_target, r.get(), &oid, GIT_OBJECT_COMMIT) != 0) {
        set_error(error);
        return false;
    }
    object_ptr target(raw_target);
    git_checkout_options co = GIT_CHECKOUT_OPTIONS_INIT;
    co.checkout_strategy = GIT_CHECKOUT_FORCE;
    if (git_checkout_tree(r.get(), target.get(), &co) != 0) {
        set_error(error);
        return false;
    }
    string local_ref = "refs/heads/" + branch;
    git_reference* raw_ref = nullptr;
    if (git_reference_create(&raw_ref, r.get(), local_ref.c_str(), &oid, 1,
                             "selfsync: adopt working copy") != 0) {
        set_error(error);
        return false;
    }
    reference_ptr ref(raw_ref);
    if (git_repository_set_head(r.get(), local_ref.c_str()) != 0) {
        set_error(error);
        return false;
    }
    return true;
}

bool adopt_directory(const fs::path& dest, const std::string& remote, const std::string& url,
                     const std::string& branch, std::string* error) {
    if (adopt_into(dest, remote, url, branch, error))
        return true;
    std::error_code ec;
    fs::remove_all(dest / ".git", ec);
    if (ec && error)
        *error += " (removing " + (dest / ".git").string() + " failed: " + ec.message() + ")";
    return false;
}

PullStatus fast_forward(const fs::path& repo, const std::string& remote_name,
                        const std::string& branch, std::string& out_pull_log) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0) {
        out_pull_log = last_error("Failed to open repository");
        return PullStatus::FAILED;
    }
    repo_ptr r(raw_repo);
    {
        string err;
        auto current = get_current_branch(repo, &err);
        if (!current) {
            out_pull_log = err;
            return PullStatus::FAILED;
        }
        if (*current != branch) {
            out_pull_log = "Checked out branch is " + *current + ", expected " + branch;
            return PullStatus::FAILED;
        }
    }
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote_name.c_str()) != 0) {
        out_pull_log = "No " + remote_name + " remote";
        return PullStatus::FAILED;
    }
    remote_ptr remote_handle(raw_remote);
    int attempts = 0;
    git_fetch_options fetch_opts = make_fetch_options(attempts);
    if (git_remote_fetch(remote_handle.get(), nullptr, &fetch_opts, nullptr) != 0) {
        out_pull_log = last_error("Fetch failed");
        return PullStatus::FAILED;
    }
    git_oid remote_oid;
    string refname = "refs/remotes/" + remote_name + "/" + branch;
    if (git_reference_name_to_id(&remote_oid, r.get(), refname.c_str()) != 0) {
        out_pull_log = "Remote branch " + remote_name + "/" + branch + " not found";
        return PullStatus::FAILED;
    }
    git_oid local_oid;
    if (git_reference_name_to_id(&local_oid, r.get(), "HEAD") != 0) {
        out_pull_log = "Local HEAD not found";
        return PullStatus::FAILED;
    }
    if (git_oid_equal(&local_oid, &remote_oid)) {
        out_pull_log = "Already up to date at " + short_hex(local_oid);
        return PullStatus::UP_TO_DATE;
    }
    int behind = git_graph_descendant_of(r.get(), &remote_oid, &local_oid);
    if (behind < 0) {
        out_pull_log = last_error("History walk failed");
        return PullStatus::FAILED;
    }
    if (behind == 0) {
        int ahead = git_graph_descendant_of(r.get(), &local_oid, &remote_oid);
        if (ahead == 1) {
            out_pull_log = "Local branch is ahead of " + remote_name + "/" + branch;
            return PullStatus::UP_TO_DATE;
        }
        out_pull_log = "Local " + short_hex(local_oid) + " and " + remote_name + "/" + branch +
                       " " + short_hex(remote_oid) + " have diverged";
        return PullStatus::DIVERGED;
    }
    git_object* raw_target = nullptr;
    if (git_object_lookup(&raw_target, r.get(), &remote_oid, GIT_OBJECT_COMMIT) != 0) {
        out_pull_log = last_error("Lookup failed");
        return PullStatus::FAILED;
    }
    object_ptr target(raw_target);
    git_checkout_options co = GIT_CHECKOUT_OPTIONS_INIT;
    co.checkout_strategy = GIT_CHECKOUT_SAFE;
    int rc = git_checkout_tree(r.get(), target.get(), &co);
    if (rc == GIT_ECONFLICT) {
        out_pull_log = "Local changes would be overwritten: " + last_error("checkout conflict");
        return PullStatus::LOCAL_CHANGES;
    }
    if (rc != 0) {
        out_pull_log = last_error("Checkout failed");
        return PullStatus::FAILED;
    }
    git_reference* raw_head = nullptr;
    if (git_repository_head(&raw_head, r.get()) != 0) {
        out_pull_log = last_error("Local HEAD not found");
        return PullStatus::FAILED;
    }
    reference_ptr head(raw_head);
    git_reference* raw_moved = nullptr;
    if (git_reference_set_target(&raw_moved, head.get(), &remote_oid,
                                 "selfsync: fast-forward") != 0) {
        out_pull_log = last_error("Updating branch failed");
        return PullStatus::FAILED;
    }
    reference_ptr moved(raw_moved);
    out_pull_log = "Fast-forwarded " + short_hex(local_oid) + ".." + short_hex(remote_oid);
    return PullStatus::FAST_FORWARDED;
}

} // namespace git
