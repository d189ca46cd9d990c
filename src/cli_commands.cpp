#include "cli_commands.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <stop_token>
#include <thread>

#include "command_task.hpp"
#include "logger.hpp"
#include "watch_set.hpp"

namespace {
std::atomic<bool> g_stop_signal{false};

void handle_signal(int) { g_stop_signal.store(true); }
} // namespace

namespace cli {

void configure_logging(const LoggingOptions& logging) {
    set_log_level(logging.log_level);
    set_json_logging(logging.json_log);
    set_log_compression(logging.compress_logs);
    init_console_logger(!logging.no_colors,
                        logging.silent ? LogLevel::ERR : LogLevel::DEBUG);
    if (!logging.log_file.empty())
        init_logger(logging.log_file, logging.log_level, logging.max_log_size,
                    logging.max_log_files);
    if (logging.use_syslog)
        init_syslog(logging.syslog_facility);
}

SupervisorOptions supervisor_options(const Options& opts) {
    SupervisorOptions sup;
    sup.quiet_window = opts.debounce;
    sup.cancel_on_restart = opts.cancel_on_restart;
    sup.channel_capacity = opts.queue_size;
    if (opts.poll_interval.count() > 0)
        sup.source_factory = make_polling_watcher(opts.poll_interval);
    return sup;
}

int handle_watch_run(const Options& opts) {
    WatchSet paths(opts.watch_paths);
    CommandSpec spec;
    spec.argv = opts.command;
    spec.use_shell = opts.use_shell;
    spec.working_dir = opts.working_dir;
    auto factory = std::make_shared<CommandTaskFactory>(spec);

    Supervisor supervisor(paths, factory, supervisor_options(opts));
    log_debug("Watching " + std::to_string(paths.size()) + " path(s) for " +
              command_line(spec));

    g_stop_signal.store(false);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::jthread signal_monitor([&supervisor](std::stop_token st) {
        while (!st.stop_requested()) {
            if (g_stop_signal.load()) {
                log_info("Interrupted, stopping");
                supervisor.stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
    supervisor.run();
    return 0;
}

} // namespace cli
