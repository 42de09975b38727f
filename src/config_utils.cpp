#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <string>

namespace {

bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    out = node.Scalar();
    return true;
}

bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

void store_yaml_entry(const std::string& key, const YAML::Node& node, ConfigValues& out) {
    const std::string flag = "--" + key;
    if (node.IsSequence()) {
        auto& list = out.lists[flag];
        list.clear();
        for (const auto& item : node) {
            std::string s;
            if (to_string_value(item, s))
                list.push_back(s);
        }
        return;
    }
    std::string s;
    if (to_string_value(node, s))
        out.values[flag] = s;
}

void store_json_entry(const std::string& key, const nlohmann::json& val, ConfigValues& out) {
    const std::string flag = "--" + key;
    if (val.is_array()) {
        auto& list = out.lists[flag];
        list.clear();
        for (const auto& item : val) {
            std::string s;
            if (to_string_value(item, s))
                list.push_back(s);
        }
        return;
    }
    std::string s;
    if (to_string_value(val, s))
        out.values[flag] = s;
}

} // namespace

bool load_yaml_config(const std::string& path, ConfigValues& out, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            const std::string key_name = it->first.as<std::string>();
            const YAML::Node& node = it->second;
            if (node.IsMap()) {
                // category section: flatten one level
                for (auto sub = node.begin(); sub != node.end(); ++sub) {
                    if (sub->first.IsScalar())
                        store_yaml_entry(sub->first.as<std::string>(), sub->second, out);
                }
            } else {
                store_yaml_entry(key_name, node, out);
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, ConfigValues& out, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& val = it.value();
            if (val.is_object()) {
                for (auto sub = val.begin(); sub != val.end(); ++sub)
                    store_json_entry(sub.key(), sub.value(), out);
            } else {
                store_json_entry(it.key(), val, out);
            }
        }
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
}
