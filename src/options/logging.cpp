// options/logging.cpp
//
// Parse log level, log file rotation, syslog and console settings.

#include <climits>
#include <functional>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

void parse_logging_options(Options& opts, const ArgParser& parser, const ConfigOptions& cfg_opts) {
    // Command line first, config file second.
    auto lookup = [&](const std::string& flag, std::string& out) {
        if (parser.has_flag(flag)) {
            out = parser.get_option(flag);
            return true;
        }
        auto it = cfg_opts.find(flag);
        if (it == cfg_opts.end())
            return false;
        out = it->second;
        return true;
    };
    auto flag_on = [&](const std::string& flag, bool current) {
        std::string v;
        if (!lookup(flag, v))
            return current;
        bool ok = false;
        bool on = parse_bool(v, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for " + flag);
        return on;
    };
    LoggingOptions& log = opts.logging;
    std::string v;
    if (lookup("--log-level", v) && !parse_log_level(v, log.log_level))
        throw std::runtime_error("Invalid value for --log-level");
    if (flag_on("--verbose", false))
        log.log_level = LogLevel::DEBUG;
    if (lookup("--log-file", v)) {
        if (v.empty())
            throw std::runtime_error("--log-file requires a path");
        log.log_file = v;
    }
    bool ok = false;
    if (lookup("--max-log-size", v)) {
        log.max_log_size = parse_bytes(v, 0, SIZE_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (lookup("--max-log-files", v)) {
        log.max_log_files = parse_size_t(v, 0, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    log.compress_logs = flag_on("--compress-logs", log.compress_logs);
    log.json_log = flag_on("--json-log", log.json_log);
    log.use_syslog = flag_on("--syslog", log.use_syslog);
    if (lookup("--syslog-facility", v)) {
        log.syslog_facility = parse_int(v, 0, INT_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --syslog-facility");
    }
    log.silent = flag_on("--silent", log.silent);
    log.no_colors = flag_on("--no-colors", log.no_colors);
}
