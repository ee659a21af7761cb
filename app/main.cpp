/**
 * @file main.cpp
 * @brief Main application entry point for the log_backup daemon.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 *
 * This file contains the main() function of log_backupd. It loads the JSON
 * configuration, applies command-line overrides and runs backup cycles on an
 * interval until it receives SIGTERM, SIGINT or SIGHUP.
 *
 * @version 1.0
 * @date 2026-10-18
 */

#include <sys/stat.h>
#include <unistd.h>

#include <CLI/CLI.hpp>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>

#include "log_backup/log_backup.h"

using namespace log_backup;

volatile sig_atomic_t stop_flag = 0;

/**
 * @brief Signal handler for graceful shutdown.
 * @param signum The signal number received.
 */
void signal_handler(int signum) {
  (void)signum;
  stop_flag = 1;
}

/**
 * @brief Main entry point of the application.
 *
 * Parses command-line arguments using CLI11, builds the backup runner and
 * drives it with a BackupWorker.
 *
 * @param argc Number of command-line arguments.
 * @param argv Array of command-line argument strings.
 *
 * @return 0 on successful execution, non-zero on error.
 */
int main(int argc, char* argv[]) {
  CLI::App app{"Log Backup Daemon v1.0"};

  std::string config_file;
  app.add_option("-c,--config", config_file, "JSON configuration file")->check(CLI::ExistingFile);

  // Paths
  std::string input_dir;
  app.add_option("-i,--input", input_dir, "Directory of log files to back up");

  std::string output_dir;
  app.add_option("-o,--output", output_dir, "Directory receiving sanitized backups");

  std::string state_file;
  app.add_option("-s,--state", state_file, "Checkpoint state file");

  // Worker
  int interval = 0;
  app.add_option("--interval", interval, "Seconds between backup cycles")->check(CLI::PositiveNumber);

  size_t max_parallel = 0;
  app.add_option("-p,--max-parallel", max_parallel, "Maximum files processed in parallel")
      ->check(CLI::PositiveNumber);

  size_t batch_lines = 0;
  auto* batch_opt = app.add_option("--batch-lines", batch_lines,
                                   "Save checkpoints every N written lines (0 = once per file)");

  std::string compression;
  app.add_option("-z,--compression", compression, "Backup compression: none, gzip");

  // Logging
  std::string log_level;
  app.add_option("--log-level", log_level, "Minimum severity: DEBUG, INFO, WARNING, ERROR, CRITICAL");

  std::string log_file;
  app.add_option("--log-file", log_file, "Append diagnostics to this file instead of stderr");

  bool verbose = false;
  app.add_flag("-v,--verbose", verbose, "Log at DEBUG severity");

  // Statistics
  std::string stats_file;
  app.add_option("--stats-file", stats_file, "File to export statistics on shutdown");

  // Daemon configuration
  bool once = false;
  app.add_flag("--once", once, "Run a single cycle and exit");

  bool daemon_mode = false;
  app.add_flag("-d,--daemon,!--no-daemon", daemon_mode, "Detach and run as daemon (default: false)");

  std::string pid_file = "/var/run/log_backupd.pid";
  app.add_option("--pid-file", pid_file, "PID file path");

  CLI11_PARSE(app, argc, argv);

  // Load and override configuration
  BackupConfig config;
  try {
    if (!config_file.empty()) config = loadConfig(config_file);
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (!input_dir.empty()) config.input_directory = input_dir;
  if (!output_dir.empty()) config.output_directory = output_dir;
  if (!state_file.empty()) config.state_file = state_file;
  if (interval > 0) config.interval = std::chrono::seconds(interval);
  if (max_parallel > 0) config.runner.max_parallel_files = max_parallel;
  if (batch_opt->count() > 0) config.runner.checkpoint_batch_lines = batch_lines;
  if (!log_file.empty()) config.log_file = log_file;

  if (!compression.empty()) {
    auto type = compressionFromString(compression);
    if (!type) {
      std::cerr << "Error: unknown compression: " << compression << std::endl;
      return 1;
    }
    config.compression = *type;
  }

  if (!log_level.empty()) {
    auto sev = severityFromString(log_level);
    if (!sev) {
      std::cerr << "Error: invalid severity level: " << log_level << std::endl;
      return 1;
    }
    config.log_severity = *sev;
  }
  if (verbose) config.log_severity = Severity::DEBUG;

  try {
    validateConfig(config);
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // Daemonize if requested
  if (daemon_mode && !once) {
    pid_t pid = fork();
    if (pid < 0) {
      std::cerr << "Fork failed: " << strerror(errno) << std::endl;
      return 1;
    }
    if (pid > 0) {
      // Parent: write PID file and exit
      std::ofstream pf(pid_file);
      if (pf.is_open()) {
        pf << pid << std::endl;
      }
      return 0;
    }

    // Child becomes session leader
    if (setsid() < 0) {
      std::cerr << "setsid failed: " << strerror(errno) << std::endl;
      return 1;
    }

    close(STDIN_FILENO);
    close(STDOUT_FILENO);
    close(STDERR_FILENO);

    if (chdir("/") != 0) {
      return 1;
    }
    umask(027);
  }

  auto logger = std::make_shared<Logger>(config.log_severity);
  if (!config.log_file.empty() && !logger->setLogFile(config.log_file)) {
    if (!daemon_mode) std::cerr << "Warning: cannot open log file " << config.log_file << std::endl;
  }
  if (daemon_mode && config.log_file.empty()) {
    logger->setConsoleOutput(false);
  }

  std::unique_ptr<BackupWorker> worker;
  try {
    worker = std::make_unique<BackupWorker>(buildRunner(config, logger),
                                            std::chrono::duration_cast<std::chrono::milliseconds>(config.interval),
                                            logger);
  } catch (const std::exception& e) {
    logger->log(Severity::CRITICAL, "main", std::string("Failed to start: ") + e.what());
    return 1;
  }

  logger->info("main", "Backing up " + config.input_directory + " -> " + config.output_directory +
                           " every " + std::to_string(config.interval.count()) + "s, " +
                           std::to_string(config.runner.max_parallel_files) + " files in parallel");

  if (once) {
    CycleReport report = worker->runOnce();
    if (!stats_file.empty() && !worker->exportStatistics(stats_file)) {
      logger->error("main", "Cannot write statistics to " + stats_file);
    }
    return report.statistics.files_failed > 0 ? 2 : 0;
  }

  // Set up signal handlers
  signal(SIGTERM, signal_handler);
  signal(SIGINT, signal_handler);
  signal(SIGHUP, signal_handler);

  worker->start();

  // Main loop
  while (!stop_flag && worker->isRunning()) {
    sleep(1);
  }

  logger->info("main", "Shutting down");
  worker->stop();

  // Export statistics on shutdown
  if (!stats_file.empty() && !worker->exportStatistics(stats_file)) {
    logger->error("main", "Cannot write statistics to " + stats_file);
  }

  // Remove PID file
  if (daemon_mode) {
    unlink(pid_file.c_str());
  }

  auto stats = worker->getStatistics();
  logger->info("main", "Final statistics: " + stats.toJson());

  return 0;
}
