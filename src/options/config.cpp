// options/config.cpp
//
// Config file layer: `--config-yaml` / `--config-json` are pre-parsed before
// the full option set so the file can provide defaults for everything else.

#include <filesystem>
#include <map>
#include <set>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

void load_config_layer(int argc, char* argv[], ConfigValues& cfg, fs::path& config_file) {
    const std::set<std::string> pre_known{"--config-yaml", "--config-json"};
    const std::map<char, std::string> pre_short{{'y', "--config-yaml"}, {'j', "--config-json"}};
    ArgParser pre_parser(argc, argv, pre_known, pre_short);
    if (pre_parser.has_flag("--config-yaml") && pre_parser.has_flag("--config-json"))
        throw ConfigError("--config-yaml and --config-json are mutually exclusive");
    if (pre_parser.has_flag("--config-yaml")) {
        std::string path = pre_parser.get_option("--config-yaml");
        if (path.empty())
            throw ConfigError("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(path, cfg, err))
            throw ConfigError("Failed to load config " + path + ": " + err);
        config_file = path;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string path = pre_parser.get_option("--config-json");
        if (path.empty())
            throw ConfigError("--config-json requires a file");
        std::string err;
        if (!load_json_config(path, cfg, err))
            throw ConfigError("Failed to load config " + path + ": " + err);
        config_file = path;
    }
}
