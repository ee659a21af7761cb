/**
 * @file diagnostics.h
 * @brief Leveled diagnostic logging shared by all log_backup components.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 *
 * Diagnostics are written to stderr (or a log file) and fanned out to any
 * registered callbacks, which is how the daemon and the tests observe what
 * the pipeline decided for each file and line.
 */

#ifndef LOG_BACKUP_DIAGNOSTICS_H
#define LOG_BACKUP_DIAGNOSTICS_H

#include <atomic>
#include <cstddef>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace log_backup {

/**
 * @enum Severity
 * @brief Diagnostic severity levels.
 */
enum class Severity { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

/**
 * @brief Convert severity to string representation.
 * @param severity The severity level.
 * @return String representation of the severity.
 */
inline std::string severityToString(Severity severity) {
  switch (severity) {
    case Severity::DEBUG: return "DEBUG";
    case Severity::INFO: return "INFO";
    case Severity::WARNING: return "WARNING";
    case Severity::ERROR: return "ERROR";
    case Severity::CRITICAL: return "CRITICAL";
    default: return "UNKNOWN";
  }
}

/**
 * @brief Parse severity from string.
 * @param str The string representation.
 * @return The severity level, or nullopt if invalid.
 */
inline std::optional<Severity> severityFromString(const std::string& str) {
  if (str == "DEBUG" || str == "debug") return Severity::DEBUG;
  if (str == "INFO" || str == "info") return Severity::INFO;
  if (str == "WARNING" || str == "warning" || str == "WARN" || str == "warn") return Severity::WARNING;
  if (str == "ERROR" || str == "error" || str == "ERR" || str == "err") return Severity::ERROR;
  if (str == "CRITICAL" || str == "critical" || str == "CRIT" || str == "crit" || str == "FATAL" || str == "fatal")
    return Severity::CRITICAL;
  return std::nullopt;
}

/**
 * @typedef DiagnosticCallback
 * @brief Callback type for diagnostic messages.
 */
using DiagnosticCallback =
    std::function<void(Severity severity, const std::string& component, const std::string& message)>;

/**
 * @class Logger
 * @brief Thread-safe leveled logger.
 *
 * Every accepted message is formatted as
 * `YYYY-MM-DD HH:MM:SS [LEVEL] component: message`, written to the console
 * (stderr) or the configured log file, and passed to every callback.
 */
class Logger {
public:
  /**
   * @brief Constructs a logger.
   * @param min_severity Messages below this level are discarded.
   */
  explicit Logger(Severity min_severity = Severity::INFO);

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  /**
   * @brief Logs a message.
   * @param severity Message severity.
   * @param component Name of the emitting component.
   * @param message Message text.
   */
  void log(Severity severity, const std::string& component, const std::string& message);

  void debug(const std::string& component, const std::string& message) {
    log(Severity::DEBUG, component, message);
  }
  void info(const std::string& component, const std::string& message) {
    log(Severity::INFO, component, message);
  }
  void warning(const std::string& component, const std::string& message) {
    log(Severity::WARNING, component, message);
  }
  void error(const std::string& component, const std::string& message) {
    log(Severity::ERROR, component, message);
  }

  /**
   * @brief Sets the minimum severity.
   * @param min_severity Minimum severity (messages below this are ignored).
   */
  void setMinSeverity(Severity min_severity);

  /**
   * @brief Gets the minimum severity.
   * @return Current minimum severity.
   */
  Severity getMinSeverity() const;

  /**
   * @brief Enables or disables console (stderr) output.
   * @param enabled Whether to write to stderr.
   */
  void setConsoleOutput(bool enabled);

  /**
   * @brief Appends formatted output to a file instead of stderr.
   * @param path Log file path; empty to go back to the console.
   * @return true if the file could be opened.
   */
  bool setLogFile(const std::string& path);

  /**
   * @brief Registers a callback for diagnostic messages.
   * @param callback Function to call for each accepted message.
   * @return Callback ID for removal.
   */
  size_t addCallback(DiagnosticCallback callback);

  /**
   * @brief Removes a callback by ID.
   * @param id The callback ID to remove.
   */
  void removeCallback(size_t id);

private:
  std::atomic<Severity> min_severity_;
  std::atomic<bool> console_output_;
  std::ofstream log_file_;
  std::map<size_t, DiagnosticCallback> callbacks_;
  size_t next_callback_id_;
  std::mutex mutex_;
};

}  // namespace log_backup

#endif  // LOG_BACKUP_DIAGNOSTICS_H
