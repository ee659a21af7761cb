/**
 * @file cli.cpp
 * @brief Command-line tool for the log_backup library.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 *
 * This file provides a CLI for trying processing rules on sample logs,
 * inspecting the checkpoint table and running a single backup cycle by hand.
 */

#include <CLI/CLI.hpp>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "log_backup/log_backup.h"

using namespace log_backup;

// ==================== Output Formatting ====================

namespace colors {
const std::string RESET = "\033[0m";
const std::string RED = "\033[31m";
const std::string GREEN = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string CYAN = "\033[36m";
const std::string BOLD = "\033[1m";
const std::string DIM = "\033[2m";

std::string lineStatusColor(LineStatus status) {
  switch (status) {
    case LineStatus::EMITTED: return GREEN;
    case LineStatus::SKIPPED: return DIM;
    case LineStatus::MALFORMED: return YELLOW;
    case LineStatus::FAILED: return RED;
    default: return RESET;
  }
}

std::string fileStatusColor(FileStatus status) {
  switch (status) {
    case FileStatus::PROCESSED: return GREEN;
    case FileStatus::EMPTY:
    case FileStatus::UP_TO_DATE: return DIM;
    case FileStatus::CANCELLED: return YELLOW;
    case FileStatus::FAILED: return BOLD + RED;
    default: return RESET;
  }
}
}  // namespace colors

namespace {

// Loads the configuration file, or returns defaults when none was given.
bool loadOptionalConfig(const std::string& config_file, BackupConfig& config) {
  if (config_file.empty()) return true;
  try {
    config = loadConfig(config_file);
    return true;
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return false;
  }
}

}  // namespace

// ==================== Mask Command ====================

int maskLines(const std::string& config_file, const std::string& file, bool show_status, bool colorize) {
  BackupConfig config;
  if (!loadOptionalConfig(config_file, config)) return 1;

  auto logger = std::make_shared<Logger>(Severity::ERROR);
  JsonLogProcessor processor(config.processing, logger);

  std::ifstream file_in;
  if (!file.empty() && file != "-") {
    file_in.open(file, std::ios::binary);
    if (!file_in.is_open()) {
      std::cerr << "Cannot open file: " << file << std::endl;
      return 1;
    }
  }
  std::istream& in = file_in.is_open() ? static_cast<std::istream&>(file_in) : std::cin;

  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t\v\f") == std::string::npos) continue;

    LineResult result = processor.process(line);
    if (show_status) {
      std::string status = lineStatusToString(result.status);
      status.resize(9, ' ');
      if (colorize) status = colors::lineStatusColor(result.status) + status + colors::RESET;
      std::cout << status << " " << (result.emitted() ? result.output : std::string()) << "\n";
    } else if (result.emitted()) {
      std::cout << result.output << "\n";
    }
  }
  return 0;
}

// ==================== Checkpoints Command ====================

int showCheckpoints(const std::string& config_file, std::string state_file, bool json_output) {
  BackupConfig config;
  if (!loadOptionalConfig(config_file, config)) return 1;
  if (state_file.empty()) state_file = config.state_file;
  if (state_file.empty()) {
    std::cerr << "Error: no state file given (use --state or --config)" << std::endl;
    return 1;
  }

  CheckpointStore store(state_file, std::make_shared<Logger>(Severity::ERROR));
  auto table = store.snapshot();

  if (json_output) {
    nlohmann::ordered_json document = nlohmann::ordered_json::object();
    for (const auto& [source, checkpoint] : table) {
      document[source] = {{"Offset", checkpoint.offset}, {"BackupFile", checkpoint.destination}};
    }
    std::cout << document.dump(2) << std::endl;
    return 0;
  }

  std::cout << "Checkpoints in " << state_file << " (" << table.size() << " sources)\n";
  for (const auto& [source, checkpoint] : table) {
    std::cout << "  " << std::left << std::setw(32) << source << std::right << std::setw(14)
              << checkpoint.offset << "  " << checkpoint.destination << "\n";
  }
  return 0;
}

// ==================== Run Command ====================

int runCycleOnce(const std::string& config_file, bool colorize, bool verbose) {
  BackupConfig config;
  if (!loadOptionalConfig(config_file, config)) return 1;

  try {
    validateConfig(config);
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  auto logger = std::make_shared<Logger>(verbose ? Severity::DEBUG : config.log_severity);
  std::shared_ptr<BackupRunner> runner;
  try {
    runner = buildRunner(config, logger);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  CycleReport report = runner->runCycle(CancellationToken());

  for (const auto& file : report.files) {
    std::string status = fileStatusToString(file.status);
    if (colorize) status = colors::fileStatusColor(file.status) + status + colors::RESET;
    std::cout << std::left << std::setw(32) << file.name << " " << status << "  offset "
              << file.previous_offset << " -> " << file.new_offset << ", " << file.lines_written << "/"
              << file.lines_read << " lines written";
    if (file.truncated) std::cout << " (truncated)";
    if (!file.error.empty()) std::cout << ": " << file.error;
    std::cout << "\n";
  }

  const auto& stats = report.statistics;
  std::cout << "\n" << (colorize ? colors::BOLD : "") << "Cycle statistics" << (colorize ? colors::RESET : "")
            << "\n";
  std::cout << "  Files:     " << stats.files_seen << " seen, " << stats.files_processed << " processed, "
            << stats.files_up_to_date << " up to date, " << stats.files_failed << " failed\n";
  std::cout << "  Lines:     " << stats.lines_read << " read, " << stats.lines_written << " written, "
            << stats.lines_skipped << " skipped, " << stats.lines_malformed << " malformed, "
            << stats.lines_failed << " failed\n";
  std::cout << "  Bytes:     " << stats.bytes_read << " read, " << stats.bytes_written << " written\n";
  std::cout << "  Duration:  " << report.duration.count() << " ms\n";

  return stats.files_failed > 0 ? 2 : 0;
}

// ==================== Main ====================

int main(int argc, char* argv[]) {
  CLI::App app{"Log Backup CLI Tool - sanitize and back up JSON logs"};
  app.require_subcommand(1);

  std::string config_file;
  bool colorize = true;

  // ==================== Mask Subcommand ====================
  auto mask_cmd = app.add_subcommand("mask", "Apply processing rules to lines of a file or stdin");
  std::string file;
  bool show_status = false;
  mask_cmd->add_option("file", file, "Input file (default: stdin)");
  mask_cmd->add_option("-c,--config", config_file, "JSON configuration file")->check(CLI::ExistingFile);
  mask_cmd->add_flag("-s,--status", show_status, "Print the status of every line");
  mask_cmd->add_flag("--no-color", [&colorize](int) { colorize = false; }, "Disable colorized output");

  // ==================== Checkpoints Subcommand ====================
  auto checkpoints_cmd = app.add_subcommand("checkpoints", "Show the checkpoint table");
  std::string state_file;
  bool json_output = false;
  checkpoints_cmd->add_option("-s,--state", state_file, "Checkpoint state file");
  checkpoints_cmd->add_option("-c,--config", config_file, "JSON configuration file")->check(CLI::ExistingFile);
  checkpoints_cmd->add_flag("-j,--json", json_output, "Output in JSON format");

  // ==================== Run Subcommand ====================
  auto run_cmd = app.add_subcommand("run", "Run a single backup cycle");
  bool verbose = false;
  run_cmd->add_option("-c,--config", config_file, "JSON configuration file")
      ->required()
      ->check(CLI::ExistingFile);
  run_cmd->add_flag("-v,--verbose", verbose, "Log at DEBUG severity");
  run_cmd->add_flag("--no-color", [&colorize](int) { colorize = false; }, "Disable colorized output");

  // ==================== Version Subcommand ====================
  auto version_cmd = app.add_subcommand("version", "Show version information");

  CLI11_PARSE(app, argc, argv);

  if (mask_cmd->parsed()) {
    return maskLines(config_file, file, show_status, colorize);
  } else if (checkpoints_cmd->parsed()) {
    return showCheckpoints(config_file, state_file, json_output);
  } else if (run_cmd->parsed()) {
    return runCycleOnce(config_file, colorize, verbose);
  } else if (version_cmd->parsed()) {
    std::cout << "log_backup CLI version " << kVersion << "\n";
    std::cout << "Incremental JSON log backup with masking and checkpoints\n";
  }

  return 0;
}
