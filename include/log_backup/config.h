/**
 * @file config.h
 * @brief Configuration of the log_backup service.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 *
 * Configuration is read from a JSON file; the executables override single
 * values from the command line and validate the result before use.
 */

#ifndef LOG_BACKUP_CONFIG_H
#define LOG_BACKUP_CONFIG_H

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "log_backup/backup_runner.h"
#include "log_backup/diagnostics.h"
#include "log_backup/log_io.h"
#include "log_backup/log_processor.h"

namespace log_backup {

/**
 * @class ConfigError
 * @brief Raised for unreadable or invalid configuration.
 */
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @struct BackupConfig
 * @brief Complete service configuration.
 */
struct BackupConfig {
  std::string          input_directory;                   ///< Paths.Input
  std::string          output_directory;                  ///< Paths.Output
  std::string          state_file;                        ///< Paths.State
  std::chrono::seconds interval{15};                      ///< Worker.IntervalSeconds
  RunnerOptions        runner;                            ///< Worker.MaxParallelFiles, Worker.CheckpointBatchLines
  CompressionType      compression = CompressionType::NONE;  ///< Output.Compression
  Severity             log_severity = Severity::INFO;     ///< Logging.MinSeverity
  std::string          log_file;                          ///< Logging.File (empty = stderr)
  ProcessingConfig     processing;                        ///< Processing.*
};

/**
 * @brief Parses configuration from JSON text.
 *
 * Missing keys keep their defaults. Values of the wrong type raise.
 *
 * @param text JSON document.
 * @return The parsed configuration.
 * @throws ConfigError on syntax or type errors.
 */
BackupConfig parseConfig(const std::string& text);

/**
 * @brief Loads configuration from a JSON file.
 * @param path Path to the file.
 * @return The parsed configuration.
 * @throws ConfigError if the file cannot be read or parsed.
 */
BackupConfig loadConfig(const std::string& path);

/**
 * @brief Checks that a configuration can run the service.
 *
 * Requires the three paths, an interval of at least one second and at least
 * one parallel file.
 *
 * @param config The configuration to check.
 * @throws ConfigError naming the first violation.
 */
void validateConfig(const BackupConfig& config);

/**
 * @brief Wires file source, file sink, checkpoint store and JSON processor.
 * @param config A validated configuration.
 * @param logger Diagnostics sink shared by all components.
 * @return A ready runner.
 */
std::shared_ptr<BackupRunner> buildRunner(const BackupConfig& config, std::shared_ptr<Logger> logger);

}  // namespace log_backup

#endif  // LOG_BACKUP_CONFIG_H
