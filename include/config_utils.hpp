#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>

/**
 * @brief Settings read from a configuration file.
 *
 * Keys are stored in command line form (`--crash-backoff`) so the option
 * parser can treat file values and flags uniformly. Scalar entries land in
 * @ref values, sequences (the child command, the installer) in @ref lists.
 * Category maps such as `Logging: { log-level: DEBUG }` are flattened.
 */
struct ConfigValues {
    std::map<std::string, std::string> values;
    std::map<std::string, std::vector<std::string>> lists;
};

/**
 * @brief Load configuration options from a YAML file.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param out   Receives the parsed entries; existing keys are overwritten.
 * @param error Receives a human-readable message on failure.
 * @return `true` if the file was read and its root is a map.
 */
bool load_yaml_config(const std::string& path, ConfigValues& out, std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * @param path  Filesystem path to the JSON configuration file.
 * @param out   Receives the parsed entries; existing keys are overwritten.
 * @param error Receives a human-readable message on failure.
 * @return `true` if the file was read and its root is an object.
 */
bool load_json_config(const std::string& path, ConfigValues& out, std::string& error);

#endif // CONFIG_UTILS_HPP
