#include "test_common.hpp"
#include "config_utils.hpp"

using watchrun::test_support::write_file;

TEST_CASE("YAML config loading") {
    fs::path cfg = fs::temp_directory_path() / "watchrun_cfg.yaml";
    write_file(cfg, "debounce: 300ms\ncancel-on-restart: true\nqueue-size: 32\n");
    ConfigOptions opts;
    ConfigLists lists;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, lists, err));
    REQUIRE(opts["--debounce"] == "300ms");
    REQUIRE(opts["--cancel-on-restart"] == "true");
    REQUIRE(opts["--queue-size"] == "32");
    REQUIRE(lists.empty());
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config categories and sequences") {
    fs::path cfg = fs::temp_directory_path() / "watchrun_cfg_cat.yaml";
    write_file(cfg, "watch:\n  - src\n  - include\n"
                    "command: [make, test]\n"
                    "Logging:\n  log-level: DEBUG\n  json-log: yes\n");
    ConfigOptions opts;
    ConfigLists lists;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), opts, lists, err));
    REQUIRE(lists["--watch"] == std::vector<std::string>{"src", "include"});
    REQUIRE(lists["--command"] == std::vector<std::string>{"make", "test"});
    REQUIRE(opts["--log-level"] == "DEBUG");
    REQUIRE(opts["--json-log"] == "yes");
    REQUIRE_FALSE(opts.count("--Logging"));
    FS_REMOVE(cfg);
}

TEST_CASE("YAML config rejects a non-map root") {
    fs::path cfg = fs::temp_directory_path() / "watchrun_cfg_list.yaml";
    write_file(cfg, "- a\n- b\n");
    ConfigOptions opts;
    ConfigLists lists;
    std::string err;
    REQUIRE_FALSE(load_yaml_config(cfg.string(), opts, lists, err));
    REQUIRE(err == "Root YAML node is not a map");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config categories") {
    fs::path cfg = fs::temp_directory_path() / "watchrun_cfg_cat.json";
    write_file(cfg, "{\n  \"General\": {\n    \"debounce\": 150,\n    \"shell\": true\n  },\n  "
                    "\"Logging\": {\n    \"log-level\": \"DEBUG\"\n  }\n}");
    ConfigOptions opts;
    ConfigLists lists;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, lists, err));
    REQUIRE(opts["--debounce"] == "150");
    REQUIRE(opts["--shell"] == "true");
    REQUIRE(opts["--log-level"] == "DEBUG");
    FS_REMOVE(cfg);
}

TEST_CASE("JSON config arrays") {
    fs::path cfg = fs::temp_directory_path() / "watchrun_cfg.json";
    write_file(cfg, "{\"watch\": [\"src\", \"tests\"], \"command\": \"make -j4\"}");
    ConfigOptions opts;
    ConfigLists lists;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), opts, lists, err));
    REQUIRE(lists["--watch"] == std::vector<std::string>{"src", "tests"});
    REQUIRE(opts["--command"] == "make -j4");
    FS_REMOVE(cfg);
}

TEST_CASE("Config loaders report unreadable files") {
    ConfigOptions opts;
    ConfigLists lists;
    std::string err;
    fs::path missing = fs::temp_directory_path() / "watchrun_no_such_config.yaml";
    REQUIRE_FALSE(load_yaml_config(missing.string(), opts, lists, err));
    REQUIRE(err == "Failed to open file");

    fs::path bad = fs::temp_directory_path() / "watchrun_bad.json";
    write_file(bad, "{ not json");
    err.clear();
    REQUIRE_FALSE(load_json_config(bad.string(), opts, lists, err));
    REQUIRE_FALSE(err.empty());
    FS_REMOVE(bad);
}
