#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <string>
#include <map>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending and starts the background
 * writer thread. Calling it again reopens the sink at the new location.
 *
 * @param path      Filesystem path where the log file will be written. An
 *                  empty path keeps only the console/syslog sinks.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Parse a level name (`DEBUG`, `INFO`, `WARNING`/`WARN`, `ERROR`).
 *
 * Matching is case-insensitive.
 *
 * @return `true` and sets @p out when the name is recognized.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

/**
 * @brief Emit log lines as JSON objects instead of plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files.
 */
void set_log_compression(bool enable);

/**
 * @brief Mirror every formatted line to stderr.
 *
 * Enabled by default so container runtimes collect supervisor output
 * alongside the child's inherited streams.
 */
void set_log_console(bool enable);

/**
 * @brief Register a secret that must never appear in a log line.
 *
 * Every occurrence in messages and field values is replaced by `***`
 * before the entry is queued. Empty strings are ignored.
 */
void add_log_secret(const std::string& secret);

/// Forget all registered secrets.
void clear_log_secrets();

/**
 * @brief Apply the registered secret redactions to @p text.
 */
std::string redact_secrets(const std::string& text);

/**
 * @brief Check whether the file sink is open.
 */
bool logger_initialized();

/**
 * @brief Block until the writer thread has drained the queue.
 */
void flush_logger();

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::string& data);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::string& data);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::string& data);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::string& data);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Mirror log lines to syslog using @p facility.
 */
void init_syslog(int facility = 0);

/**
 * @brief Stop the writer thread and close every sink.
 */
void shutdown_logger();

#endif // LOGGER_HPP
