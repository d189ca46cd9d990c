#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <string>
#include <map>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Parse a level name such as `debug`, `INFO`, `warn` or `error`.
 *
 * @param name  Case-insensitive level name.
 * @param level Receives the parsed level on success.
 * @return `true` if @p name was recognized.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path and configures log rotation parameters.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Enable the console sink on stderr.
 *
 * Informational lines carry a `Watcher` label, warnings and errors are
 * prefixed with `warning:` and `error:`.
 *
 * @param colors    Emit ANSI color sequences for the labels.
 * @param min_level Console-only threshold applied on top of the global level.
 */
void init_console_logger(bool colors = true, LogLevel min_level = LogLevel::DEBUG);

/** @brief Set the global minimum log level. */
void set_log_level(LogLevel level);

/** @brief Enable or disable JSON formatted lines in the log file. */
void set_json_logging(bool enable);

/** @brief Gzip rotated log files with zlib. */
void set_log_compression(bool enable);

/** @brief Configure how many rotated log files are retained. */
void set_log_rotation(size_t max_files);

/**
 * @brief Check whether the file logger has been initialized.
 */
bool logger_initialized();

/** @brief Block until every queued message has been written. */
void flush_logger();

void log_event(LogLevel level, const std::string& message);
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Mirror log lines to syslog using the specified facility.
 */
void init_syslog(int facility = 0);

/**
 * @brief Shut down the logging subsystem and release resources.
 *
 * Pending messages are written before the sinks are closed.
 */
void shutdown_logger();

#endif // LOGGER_HPP
