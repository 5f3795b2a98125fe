#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for appending. Until this is called every
 * log_* function is a no-op, so the tool stays silent unless a log file was
 * requested.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 * @return `false` if the file could not be opened.
 */
bool init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Set the global minimum log level.
 */
void set_log_level(LogLevel level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files instead of keeping them as plain text.
 */
void set_log_compression(bool enable);

/**
 * @brief Check whether the logger has been initialized.
 */
bool logger_initialized();

/**
 * @brief Parse a textual level name (DEBUG, INFO, WARNING/WARN, ERROR).
 *
 * Matching is case-insensitive.
 *
 * @return `false` for an unknown name; @p out is left untouched.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Flush and close the log file.
 */
void shutdown_logger();

#endif // LOGGER_HPP
