// options/environment.cpp
//
// Environment layer. The variable names match the container the supervisor
// is deployed in, so the managed application and the supervisor read the
// same settings.

#include <string>

#include "options.hpp"
#include "system_utils.hpp"

ConfigValues load_environment_layer() {
    struct EnvKey {
        const char* env;
        const char* flag;
    };
    const EnvKey keys[] = {
        {"GITHUB_ORG", "--repo-owner"},   {"GITHUB_REPO", "--repo-name"},
        {"GITHUB_PAT", "--token"},        {"GIT_HOST", "--git-host"},
        {"REPO_URL", "--remote-url"},     {"GIT_BRANCH", "--branch"},
        {"APP_DIR", "--app-dir"},         {"BOOTSTRAP_DIR", "--bootstrap-dir"},
        {"DATA_DIR", "--data-dir"},       {"LOG_DIR", "--log-dir"},
        {"LOG_LEVEL", "--log-level"},
    };
    ConfigValues out;
    for (const auto& k : keys) {
        std::string v = procutil::getenv_or(k.env, "");
        if (!v.empty())
            out.values[k.flag] = v;
    }
    return out;
}
