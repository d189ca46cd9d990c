#include "help_text.hpp"
#include <iostream>
#include <iomanip>
#include <vector>
#include <string>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--watch", "-w", "<path>", "Path to watch, non-recursive (repeatable)", "Basics"},
        {"--debounce", "-d", "<ms|s|m>", "Quiet window before a change counts (default 200ms)",
         "Basics"},
        {"--cancel-on-restart", "-k", "", "Terminate the running command when a change arrives",
         "Basics"},
        {"--shell", "-S", "", "Run the command through /bin/sh -c", "Basics"},
        {"--cwd", "", "<dir>", "Working directory for the command", "Basics"},
        {"--poll", "-p", "<ms|s|m>", "Poll for changes instead of using inotify", "Backend"},
        {"--queue-size", "", "<n>", "Pending notification limit (default 16)", "Backend"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--auto-config", "", "", "Load .watchrun.yaml or .watchrun.json if present", "Config"},
        {"--log-file", "-l", "<path>", "Also write logs to this file", "Logging"},
        {"--log-level", "-L", "<level>", "debug, info, warning or error", "Logging"},
        {"--verbose", "-g", "", "Shorthand for --log-level debug", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep (default 1)", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--json-log", "", "", "Write the log file as JSON lines", "Logging"},
        {"--syslog", "", "", "Mirror log lines to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility number", "Logging"},
        {"--silent", "-s", "", "Only print errors on the console", "Logging"},
        {"--no-colors", "-C", "", "Disable ANSI colors", "Logging"},
        {"--help", "-h", "", "Show this message", "Info"},
        {"--version", "-V", "", "Print program version and exit", "Info"}};

    std::cout << "Usage: " << prog << " [options] --watch <path>... -- <command> [args...]\n\n";
    std::cout << "Runs <command> and restarts it whenever it exits and a watched path\n"
                 "changes, or immediately when a change settles while it is running.\n";
    const char* current = nullptr;
    for (const auto& opt : opts) {
        if (!current || std::string(current) != opt.category) {
            current = opt.category;
            std::cout << "\n" << current << ":\n";
        }
        std::string flags = opt.long_flag;
        if (*opt.short_flag)
            flags = std::string(opt.short_flag) + ", " + flags;
        if (*opt.arg)
            flags += std::string(" ") + opt.arg;
        std::cout << "  " << std::left << std::setw(32) << flags << opt.desc << "\n";
    }
}
