#include "repo_sync.hpp"

#include <map>
#include <system_error>
#include "git_utils.hpp"
#include "logger.hpp"

namespace selfsync {

namespace {

fs::path normalize(const fs::path& p) {
    std::error_code ec;
    fs::path n = fs::weakly_canonical(p, ec);
    if (ec)
        n = fs::absolute(p).lexically_normal();
    if (!n.has_filename() && n.has_parent_path() && n != n.root_path())
        n = n.parent_path();
    return n;
}

/// Replace the raw remote URL in a libgit2 message with its redacted form.
std::string scrub(std::string msg, const std::string& url) {
    if (url.empty())
        return msg;
    const std::string redacted = git::redact_url(url);
    for (size_t pos = msg.find(url); pos != std::string::npos;
         pos = msg.find(url, pos + redacted.size()))
        msg.replace(pos, url.size(), redacted);
    return msg;
}

size_t copy_tree(const fs::path& from, const fs::path& to, const std::vector<fs::path>& skip,
                 bool top) {
    size_t copied = 0;
    fs::create_directories(to);
    for (const auto& entry : fs::directory_iterator(from)) {
        const fs::path& src = entry.path();
        if (top && src.filename() == ".git")
            continue;
        fs::path norm = normalize(src);
        bool skipped = false;
        for (const auto& s : skip) {
            if (norm == s) {
                skipped = true;
                break;
            }
        }
        if (skipped)
            continue;
        fs::path dst = to / src.filename();
        fs::file_status st = entry.symlink_status();
        if (fs::is_symlink(st)) {
            if (fs::exists(fs::symlink_status(dst)))
                fs::remove(dst);
            fs::copy_symlink(src, dst);
            ++copied;
        } else if (fs::is_directory(st)) {
            copied += copy_tree(src, dst, skip, false);
        } else if (fs::is_regular_file(st)) {
            fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
            ++copied;
        }
    }
    return copied;
}

std::string revision_of(const fs::path& wc) {
    return git::get_local_hash(wc).value_or("");
}

SyncResult fall_back(const SyncTarget& t, const std::string& clone_error) {
    std::error_code ec;
    if (t.bootstrap_dir.empty() || !fs::is_directory(t.bootstrap_dir, ec))
        throw BootstrapError("Cannot populate " + t.working_copy.string() + ": clone failed (" +
                             clone_error + ") and no bootstrap copy exists at " +
                             t.bootstrap_dir.string());
    if (fs::exists(t.working_copy / ".git", ec))
        fs::remove_all(t.working_copy / ".git", ec);
    size_t copied = 0;
    try {
        copied = copy_bootstrap(t.bootstrap_dir, t.working_copy, t.excluded);
    } catch (const fs::filesystem_error& e) {
        throw BootstrapError("Copying bootstrap " + t.bootstrap_dir.string() + " to " +
                             t.working_copy.string() + " failed: " + e.what());
    }
    // A bootstrap holding only the skipped directories leaves nothing to run.
    if (copied == 0 && fs::is_empty(t.working_copy, ec))
        throw BootstrapError("Cannot populate " + t.working_copy.string() + ": clone failed (" +
                             clone_error + ") and bootstrap copy " + t.bootstrap_dir.string() +
                             " holds no application files");
    log_warning("Running from bootstrap copy",
                {{"bootstrap", t.bootstrap_dir.string()},
                 {"path", t.working_copy.string()},
                 {"reason", clone_error}});
    SyncResult r;
    r.source = SyncSource::FALLBACK;
    r.error = clone_error;
    return r;
}

} // namespace

const char* to_string(SyncSource source) {
    switch (source) {
    case SyncSource::CLONED:
        return "cloned";
    case SyncSource::PULLED:
        return "pulled";
    case SyncSource::FALLBACK:
        return "fallback";
    }
    return "unknown";
}

size_t copy_bootstrap(const fs::path& from, const fs::path& to,
                      const std::vector<fs::path>& excluded) {
    std::vector<fs::path> skip;
    skip.push_back(normalize(to));
    for (const auto& p : excluded) {
        if (!p.empty())
            skip.push_back(normalize(p));
    }
    return copy_tree(from, to, skip, true);
}

SyncResult sync(const SyncTarget& t) {
    if (git::is_git_repo(t.working_copy))
        return pull(t);

    const std::string redacted = git::redact_url(t.remote_url);
    std::error_code ec;
    bool populated = fs::exists(t.working_copy, ec) && !fs::is_empty(t.working_copy, ec);
    std::map<std::string, std::string> fields{{"path", t.working_copy.string()},
                                              {"remote", redacted},
                                              {"branch", t.branch}};
    std::string err;
    bool cloned = false;
    if (populated) {
        log_info("Adopting existing files as a clone", fields);
        cloned = git::adopt_directory(t.working_copy, t.remote_name, t.remote_url, t.branch, &err);
    } else {
        log_info("Cloning repository", fields);
        fs::create_directories(t.working_copy, ec);
        if (ec) {
            err = "Cannot create " + t.working_copy.string() + ": " + ec.message();
        } else {
            cloned = git::clone_repo(t.working_copy, t.remote_url, t.branch, &err);
        }
    }
    if (cloned) {
        SyncResult r;
        r.source = SyncSource::CLONED;
        r.revision = revision_of(t.working_copy);
        log_info("Repository cloned", {{"path", t.working_copy.string()}, {"revision", r.revision}});
        return r;
    }
    err = scrub(err, t.remote_url);
    log_warning("Could not obtain repository from remote", {{"remote", redacted}, {"error", err}});
    return fall_back(t, err);
}

SyncResult pull(const SyncTarget& t) {
    SyncResult r;
    r.source = SyncSource::PULLED;
    if (!git::is_git_repo(t.working_copy)) {
        r.error = "No repository at " + t.working_copy.string();
        log_warning("Pull skipped", *r.error);
        return r;
    }
    std::string err;
    if (!git::set_remote_url(t.working_copy, t.remote_name, t.remote_url, &err))
        log_warning("Could not refresh remote URL", scrub(err, t.remote_url));

    std::string detail;
    git::PullStatus status = git::fast_forward(t.working_copy, t.remote_name, t.branch, detail);
    detail = scrub(detail, t.remote_url);
    r.revision = revision_of(t.working_copy);
    std::map<std::string, std::string> fields{{"status", git::to_string(status)},
                                              {"branch", t.branch},
                                              {"revision", r.revision},
                                              {"detail", detail}};
    switch (status) {
    case git::PullStatus::UP_TO_DATE:
        log_info("Repository up to date", fields);
        break;
    case git::PullStatus::FAST_FORWARDED:
        log_info("Repository updated", fields);
        break;
    default:
        r.error = detail;
        log_warning("Pull failed; keeping current code", fields);
        break;
    }
    return r;
}

} // namespace selfsync
