#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for append and configures log rotation.
 * Calling it again closes the previous sink first.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 * @return `true` if the file could be opened.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Set the global minimum log level.
 */
void set_log_level(LogLevel level);

/**
 * @brief Parse a level name (DEBUG, INFO, WARNING/WARN, ERROR), case-insensitive.
 *
 * @throws std::runtime_error when @p name is not a known level.
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files with zlib.
 */
void set_log_compression(bool enable);

/**
 * @brief Check whether the logger has an open sink.
 */
bool logger_initialized();

/**
 * @brief Log a message with the specified severity.
 */
void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
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
 * @brief Flush pending output to the log file.
 */
void flush_logger();

/**
 * @brief Close the log file and reset the logger to its uninitialized state.
 */
void shutdown_logger();

#endif // LOGGER_HPP
