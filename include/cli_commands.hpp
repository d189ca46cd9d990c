#pragma once

#include "options.hpp"
#include "supervisor.hpp"

namespace cli {

/**
 * @brief Configure the console, file and syslog sinks from @a logging.
 *
 * The console sink is always enabled so fatal errors stay visible;
 * `--silent` restricts it to error lines.
 */
void configure_logging(const LoggingOptions& logging);

/**
 * @brief Translate parsed options into supervisor settings.
 *
 * Selects the polling backend when a poll interval is configured.
 */
SupervisorOptions supervisor_options(const Options& opts);

/**
 * @brief Supervise the configured command until interrupted.
 *
 * Installs SIGINT/SIGTERM handlers that stop the supervisor. Returns `0`
 * after a signal-driven stop.
 *
 * @throws WatchSetupError if a watched path cannot be registered.
 * @throws ChannelError if notification delivery fails.
 */
int handle_watch_run(const Options& opts);

} // namespace cli
