// options/config.cpp
//
// Load configuration from YAML/JSON and auto-discovery.

#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"

namespace fs = std::filesystem;

static void load_file(const fs::path& cfg, bool yaml, ConfigOptions& cfg_opts,
                      ConfigLists& cfg_lists) {
    std::string err;
    bool ok = yaml ? load_yaml_config(cfg.string(), cfg_opts, cfg_lists, err)
                   : load_json_config(cfg.string(), cfg_opts, cfg_lists, err);
    if (!ok)
        throw std::runtime_error("Failed to load config " + cfg.string() + ": " + err);
}

void load_config_and_auto(int argc, char* argv[], ConfigOptions& cfg_opts, ConfigLists& cfg_lists,
                          fs::path& config_file) {
    const std::set<std::string> pre_known{"--config-yaml", "--config-json", "--auto-config"};
    const std::map<char, std::string> pre_short{{'y', "--config-yaml"}, {'j', "--config-json"}};
    ArgParser pre_parser(argc, argv, pre_known, pre_short, {"--auto-config"});
    if (pre_parser.has_flag("--config-yaml")) {
        std::string cfg = pre_parser.get_option("--config-yaml");
        if (cfg.empty())
            throw std::runtime_error("--config-yaml requires a file");
        load_file(cfg, true, cfg_opts, cfg_lists);
        config_file = cfg;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string cfg = pre_parser.get_option("--config-json");
        if (cfg.empty())
            throw std::runtime_error("--config-json requires a file");
        load_file(cfg, false, cfg_opts, cfg_lists);
        config_file = cfg;
    }
    if (!config_file.empty() || !pre_parser.has_flag("--auto-config"))
        return;
    const fs::path dir = fs::current_path();
    std::error_code ec;
    if (fs::path y = dir / ".watchrun.yaml"; fs::exists(y, ec)) {
        load_file(y, true, cfg_opts, cfg_lists);
        config_file = y;
    } else if (fs::path j = dir / ".watchrun.json"; fs::exists(j, ec)) {
        load_file(j, false, cfg_opts, cfg_lists);
        config_file = j;
    }
}
