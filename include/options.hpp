#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "config_utils.hpp"
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool compress_logs = false;
    bool json_log = false;
    bool use_syslog = false;
    int syslog_facility = 0;
    bool silent = false;
    bool no_colors = false;
};

struct Options {
    std::vector<std::filesystem::path> watch_paths;
    std::vector<std::string> command;
    bool use_shell = false;
    std::filesystem::path working_dir;
    std::chrono::milliseconds debounce{200};
    bool cancel_on_restart = false;
    /// Polling interval; zero selects the native notification backend.
    std::chrono::milliseconds poll_interval{0};
    size_t queue_size = 16;
    LoggingOptions logging;
    std::filesystem::path config_file;
    bool show_help = false;
    bool print_version = false;
};

/**
 * Parse command-line arguments and configuration files to populate an Options
 * instance.
 *
 * Configuration files are read first (`--config-yaml`, `--config-json` or
 * `--auto-config`); command line values override them.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure.
 * @throws std::runtime_error on unknown flags, invalid values, unreadable
 *         config files or when the watch paths or the command are missing.
 */
Options parse_options(int argc, char* argv[]);

class ArgParser;

/**
 * Load the configuration file named by `--config-yaml`/`--config-json`, or the
 * one found by `--auto-config` (`.watchrun.yaml` or `.watchrun.json` in the
 * working directory).
 *
 * @param cfg_opts    Receives scalar values keyed by flag.
 * @param cfg_lists   Receives sequence values keyed by flag.
 * @param config_file Set to the file that was loaded, if any.
 * @throws std::runtime_error if a requested file cannot be loaded.
 */
void load_config_and_auto(int argc, char* argv[], ConfigOptions& cfg_opts, ConfigLists& cfg_lists,
                          std::filesystem::path& config_file);

/**
 * Parse the logging flags into opts.logging.
 *
 * @throws std::runtime_error on invalid values.
 */
void parse_logging_options(Options& opts, const ArgParser& parser, const ConfigOptions& cfg_opts);

#endif // OPTIONS_HPP
