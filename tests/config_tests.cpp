#include "test_common.hpp"

TEST_CASE("YAML config loading") {
    fs::path cfg = fs::temp_directory_path() / "selfsync_cfg.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "branch: dev\n";
        ofs << "json-log: true\n";
        ofs << "no-install:\n";
        ofs << "update-delay: 5s\n";
    }
    ConfigValues cv;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), cv, err));
    REQUIRE(cv.values["--branch"] == "dev");
    REQUIRE(cv.values["--json-log"] == "true");
    REQUIRE(cv.values.count("--no-install"));
    REQUIRE(cv.values["--no-install"].empty());
    REQUIRE(cv.values["--update-delay"] == "5s");
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config categories and lists") {
    fs::path cfg = fs::temp_directory_path() / "selfsync_cfg_cat.yaml";
    {
        std::ofstream ofs(cfg);
        ofs << "Repository:\n  repo-owner: acme\n  repo-name: agent\n";
        ofs << "Process:\n  command: [python3, -m, agent.main]\n";
        ofs << "installer:\n  - uv\n  - pip\n  - install\n  - -r\n";
    }
    ConfigValues cv;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), cv, err));
    REQUIRE(cv.values["--repo-owner"] == "acme");
    REQUIRE(cv.values["--repo-name"] == "agent");
    REQUIRE(cv.lists["--command"] == std::vector<std::string>{"python3", "-m", "agent.main"});
    REQUIRE(cv.lists["--installer"] == std::vector<std::string>{"uv", "pip", "install", "-r"});
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config categories and lists") {
    fs::path cfg = fs::temp_directory_path() / "selfsync_cfg_cat.json";
    {
        std::ofstream ofs(cfg);
        ofs << "{\n  \"Logging\": {\n    \"log-level\": \"DEBUG\",\n    \"log-files\": 5\n  },\n"
               "  \"syslog\": false,\n  \"command\": [\"node\", \"server.js\"]\n}";
    }
    ConfigValues cv;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), cv, err));
    REQUIRE(cv.values["--log-level"] == "DEBUG");
    REQUIRE(cv.values["--log-files"] == "5");
    REQUIRE(cv.values["--syslog"] == "false");
    REQUIRE(cv.lists["--command"] == std::vector<std::string>{"node", "server.js"});
    FS_REMOVE(cfg);
}

TEST_CASE("Config loading reports errors") {
    ConfigValues cv;
    std::string err;
    REQUIRE_FALSE(load_yaml_config("/nonexistent/selfsync.yaml", cv, err));
    REQUIRE_FALSE(err.empty());

    fs::path bad = fs::temp_directory_path() / "selfsync_bad.json";
    std::ofstream(bad) << "{ not json";
    err.clear();
    REQUIRE_FALSE(load_json_config(bad.string(), cv, err));
    REQUIRE_FALSE(err.empty());
    FS_REMOVE(bad);

    fs::path list = fs::temp_directory_path() / "selfsync_list.yaml";
    std::ofstream(list) << "- a\n- b\n";
    err.clear();
    REQUIRE_FALSE(load_yaml_config(list.string(), cv, err));
    REQUIRE(err == "Root YAML node is not a map");
    FS_REMOVE(list);
}
