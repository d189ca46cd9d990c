#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

// Note: config file loading and logging flags are handled in
// src/options/config.cpp and src/options/logging.cpp.

Options parse_options(int argc, char* argv[]) {
    Options opts;
    ConfigOptions cfg_opts;
    ConfigLists cfg_lists;
    load_config_and_auto(argc, argv, cfg_opts, cfg_lists, opts.config_file);

    const std::set<std::string> known{"--watch",         "--debounce",      "--cancel-on-restart",
                                      "--shell",         "--cwd",           "--poll",
                                      "--queue-size",    "--log-file",      "--log-level",
                                      "--verbose",       "--max-log-size",  "--max-log-files",
                                      "--compress-logs", "--json-log",      "--syslog",
                                      "--syslog-facility", "--silent",      "--no-colors",
                                      "--config-yaml",   "--config-json",   "--auto-config",
                                      "--help",          "--version"};
    const std::map<char, std::string> short_opts{{'w', "--watch"},     {'d', "--debounce"},
                                                 {'k', "--cancel-on-restart"},
                                                 {'S', "--shell"},     {'p', "--poll"},
                                                 {'l', "--log-file"},  {'L', "--log-level"},
                                                 {'g', "--verbose"},   {'s', "--silent"},
                                                 {'C', "--no-colors"}, {'y', "--config-yaml"},
                                                 {'j', "--config-json"}, {'h', "--help"},
                                                 {'V', "--version"}};
    const std::set<std::string> switches{"--cancel-on-restart", "--shell",    "--verbose",
                                         "--compress-logs",     "--json-log", "--syslog",
                                         "--silent",            "--no-colors", "--auto-config",
                                         "--help",              "--version"};
    ArgParser parser(argc, argv, known, short_opts, switches);

    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());

    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;

    auto cfg_opt = [&](const std::string& k) -> std::string {
        auto it = cfg_opts.find(k);
        return it == cfg_opts.end() ? std::string() : it->second;
    };
    auto value_of = [&](const std::string& k, std::string& out) {
        if (parser.has_flag(k)) {
            out = parser.get_option(k);
            return true;
        }
        if (!cfg_opts.count(k))
            return false;
        out = cfg_opt(k);
        return true;
    };
    auto flag_on = [&](const std::string& k) {
        std::string v;
        if (!value_of(k, v))
            return false;
        bool ok = false;
        bool on = parse_bool(v, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for " + k);
        return on;
    };

    std::vector<std::string> watch = parser.get_all_options("--watch");
    if (watch.empty() && parser.has_flag("--watch"))
        throw std::runtime_error("--watch requires a path");
    if (watch.empty()) {
        if (cfg_lists.count("--watch"))
            watch = cfg_lists["--watch"];
        else if (cfg_opts.count("--watch"))
            watch.push_back(cfg_opt("--watch"));
    }
    for (const auto& w : watch) {
        if (!w.empty())
            opts.watch_paths.emplace_back(w);
    }

    opts.use_shell = flag_on("--shell");
    if (!parser.trailing().empty()) {
        opts.command = parser.trailing();
    } else if (!parser.positional().empty()) {
        opts.command = parser.positional();
    } else if (cfg_lists.count("--command")) {
        opts.command = cfg_lists["--command"];
    } else if (cfg_opts.count("--command") && !cfg_opt("--command").empty()) {
        // A single string is a shell command line.
        opts.command.push_back(cfg_opt("--command"));
        opts.use_shell = true;
    }

    std::string v;
    bool ok = false;
    if (value_of("--cwd", v))
        opts.working_dir = v;
    if (value_of("--debounce", v)) {
        opts.debounce = parse_time_ms(v, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --debounce");
    }
    if (value_of("--poll", v)) {
        opts.poll_interval = parse_time_ms(v, ok);
        if (!ok || opts.poll_interval.count() < 1)
            throw std::runtime_error("Invalid value for --poll");
    }
    if (value_of("--queue-size", v)) {
        opts.queue_size = parse_size_t(v, 1, 4096, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --queue-size");
    }
    opts.cancel_on_restart = flag_on("--cancel-on-restart");
    parse_logging_options(opts, parser, cfg_opts);

    if (opts.watch_paths.empty())
        throw std::runtime_error("No paths to watch; use --watch <path>");
    if (opts.command.empty())
        throw std::runtime_error("No command given; pass it after --");
    return opts;
}
