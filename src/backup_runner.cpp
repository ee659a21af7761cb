/**
 * @file backup_runner.cpp
 * @brief Implementation of the per-file pipeline and the cycle orchestrator.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 */

#include "log_backup/backup_runner.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>

namespace log_backup {

namespace {

const char* kComponent = "runner";

bool isBlank(const std::string& line) {
  return std::all_of(line.begin(), line.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string formatTime(std::chrono::system_clock::time_point time_point) {
  auto time_t = std::chrono::system_clock::to_time_t(time_point);
  std::tm tm{};
  localtime_r(&time_t, &tm);
  char time_str[20];
  std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &tm);
  return time_str;
}

}  // namespace

// ==================== CancellationToken ====================

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::isCancelled() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
}

// ==================== BackupStatistics ====================

void BackupStatistics::record(const FileResult& result) {
  ++files_seen;
  switch (result.status) {
    case FileStatus::PROCESSED:
    case FileStatus::CANCELLED:
      ++files_processed;
      break;
    case FileStatus::EMPTY:
    case FileStatus::UP_TO_DATE:
      ++files_up_to_date;
      break;
    case FileStatus::FAILED:
      ++files_failed;
      break;
  }
  if (result.truncated) ++truncations;
  lines_read += result.lines_read;
  lines_written += result.lines_written;
  lines_skipped += result.lines_skipped;
  lines_malformed += result.lines_malformed;
  lines_failed += result.lines_failed;
  bytes_read += result.bytes_read;
  bytes_written += result.bytes_written;
  last_update = std::chrono::system_clock::now();
}

void BackupStatistics::merge(const BackupStatistics& other) {
  cycles += other.cycles;
  files_seen += other.files_seen;
  files_processed += other.files_processed;
  files_up_to_date += other.files_up_to_date;
  files_failed += other.files_failed;
  truncations += other.truncations;
  lines_read += other.lines_read;
  lines_written += other.lines_written;
  lines_skipped += other.lines_skipped;
  lines_malformed += other.lines_malformed;
  lines_failed += other.lines_failed;
  bytes_read += other.bytes_read;
  bytes_written += other.bytes_written;
  last_update = std::chrono::system_clock::now();
}

std::string BackupStatistics::toJson() const {
  nlohmann::ordered_json document = {
      {"cycles", cycles},
      {"files_seen", files_seen},
      {"files_processed", files_processed},
      {"files_up_to_date", files_up_to_date},
      {"files_failed", files_failed},
      {"truncations", truncations},
      {"lines_read", lines_read},
      {"lines_written", lines_written},
      {"lines_skipped", lines_skipped},
      {"lines_malformed", lines_malformed},
      {"lines_failed", lines_failed},
      {"bytes_read", bytes_read},
      {"bytes_written", bytes_written},
      {"start_time", formatTime(start_time)},
      {"last_update", formatTime(last_update)},
  };
  return document.dump();
}

void BackupStatistics::reset() {
  *this = BackupStatistics();
  start_time = std::chrono::system_clock::now();
  last_update = start_time;
}

// ==================== BackupRunner ====================

BackupRunner::BackupRunner(std::shared_ptr<LogSource> source, std::shared_ptr<LogSink> sink,
                           std::shared_ptr<CheckpointStore> checkpoints,
                           std::shared_ptr<LogProcessor> processor, RunnerOptions options,
                           std::shared_ptr<Logger> logger)
    : source_(std::move(source)),
      sink_(std::move(sink)),
      checkpoints_(std::move(checkpoints)),
      processor_(std::move(processor)),
      options_(options),
      logger_(std::move(logger)) {
  if (!source_ || !sink_ || !checkpoints_ || !processor_) {
    throw std::invalid_argument("BackupRunner requires a source, a sink, a checkpoint store and a processor");
  }
  if (options_.max_parallel_files == 0) {
    throw std::invalid_argument("max_parallel_files must be at least 1");
  }
}

CycleReport BackupRunner::runCycle(const CancellationToken& token) {
  CycleReport report;
  report.statistics.reset();
  const auto started = std::chrono::steady_clock::now();

  std::vector<SourceFile> files;
  try {
    files = source_->listFiles();
  } catch (const std::exception& e) {
    if (logger_) logger_->error(kComponent, "Failed to list source files: " + std::string(e.what()));
  } catch (...) {
    if (logger_) logger_->error(kComponent, "Failed to list source files: unknown error");
  }

  std::vector<std::optional<FileResult>> results(files.size());
  std::atomic<size_t> next_file{0};

  auto worker = [&]() {
    while (!token.isCancelled()) {
      size_t index = next_file.fetch_add(1);
      if (index >= files.size()) return;
      results[index] = processIsolated(files[index], token);
    }
  };

  const size_t worker_count = std::min(options_.max_parallel_files, files.size());
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker);
  }
  for (auto& thread : workers) {
    thread.join();
  }

  for (auto& result : results) {
    if (!result) continue;
    report.statistics.record(*result);
    report.files.push_back(std::move(*result));
  }
  report.statistics.cycles = 1;
  report.cancelled = token.isCancelled();
  report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  if (logger_) {
    const auto& stats = report.statistics;
    logger_->info(kComponent, "Cycle finished: " + std::to_string(files.size()) + " files, " +
                                  std::to_string(stats.files_processed) + " processed, " +
                                  std::to_string(stats.files_failed) + " failed, " +
                                  std::to_string(stats.lines_written) + " lines written in " +
                                  std::to_string(report.duration.count()) + " ms" +
                                  (report.cancelled ? " (cancelled)" : ""));
  }
  return report;
}

FileResult BackupRunner::processIsolated(const SourceFile& file, const CancellationToken& token) {
  try {
    return processFile(file, token);
  } catch (const std::exception& e) {
    return failedResult(file, e.what());
  } catch (...) {
    return failedResult(file, "unknown error");
  }
}

FileResult BackupRunner::failedResult(const SourceFile& file, const std::string& error) const {
  if (logger_) {
    logger_->error(kComponent, "Error processing file " + file.name + ". Skipping file: " + error);
  }
  FileResult failed;
  failed.name = file.name;
  failed.status = FileStatus::FAILED;
  failed.error = error;
  if (auto checkpoint = checkpoints_->find(file.name)) {
    failed.previous_offset = checkpoint->offset;
    failed.new_offset = checkpoint->offset;
  }
  return failed;
}

FileResult BackupRunner::processFile(const SourceFile& file, const CancellationToken& token) {
  FileResult result;
  result.name = file.name;

  const Checkpoint checkpoint = checkpoints_->getCheckpoint(file.name);
  result.previous_offset = checkpoint.offset;
  uint64_t offset = checkpoint.offset;

  if (file.length == 0) {
    sink_->append(checkpoint.destination, std::string());
    saveOffset(file.name, 0);
    result.new_offset = 0;
    result.truncated = offset > 0;
    result.status = FileStatus::EMPTY;
    return result;
  }

  if (file.length < offset) {
    if (logger_) {
      logger_->warning(kComponent, "File " + file.name + " truncated (" + std::to_string(file.length) +
                                       " < " + std::to_string(offset) + "). Resetting offset.");
    }
    offset = 0;
    result.truncated = true;
  }

  if (file.length == offset) {
    result.new_offset = offset;
    result.status = FileStatus::UP_TO_DATE;
    return result;
  }

  std::unique_ptr<std::istream> stream = source_->openRead(file, offset);

  result.status = FileStatus::PROCESSED;
  uint64_t consumed = 0;
  size_t pending_lines = 0;
  std::string pending;
  std::string line;

  // One sink append per flush keeps gzip output to one member per batch.
  auto flush = [&]() {
    if (pending.empty()) return;
    sink_->append(checkpoint.destination, pending);
    pending.clear();
    pending_lines = 0;
  };

  while (true) {
    if (token.isCancelled()) {
      result.status = FileStatus::CANCELLED;
      break;
    }
    if (!std::getline(*stream, line)) break;

    // The terminator is absent only for a final unterminated line.
    const uint64_t line_bytes = line.size() + (stream->eof() ? 0 : 1);
    consumed += line_bytes;
    result.bytes_read += line_bytes;
    ++result.lines_read;

    if (!line.empty() && line.back() == '\r') line.pop_back();

    if (isBlank(line)) {
      ++result.lines_blank;
      continue;
    }

    LineResult outcome;
    try {
      outcome = processor_->process(line);
    } catch (const std::exception& e) {
      ++result.lines_failed;
      if (logger_) logger_->debug(kComponent, "Skipping line of " + file.name + ": " + e.what());
      continue;
    } catch (...) {
      ++result.lines_failed;
      if (logger_) logger_->debug(kComponent, "Skipping line of " + file.name + ": unknown error");
      continue;
    }

    switch (outcome.status) {
      case LineStatus::EMITTED:
        break;
      case LineStatus::SKIPPED:
        ++result.lines_skipped;
        continue;
      case LineStatus::MALFORMED:
        ++result.lines_malformed;
        continue;
      case LineStatus::FAILED:
        ++result.lines_failed;
        continue;
    }

    pending += outcome.output;
    pending += '\n';
    ++pending_lines;
    ++result.lines_written;
    result.bytes_written += outcome.output.size() + 1;

    if (options_.checkpoint_batch_lines > 0 && pending_lines >= options_.checkpoint_batch_lines) {
      flush();
      saveOffset(file.name, offset + consumed);
    }
  }

  flush();

  if (stream->bad()) {
    saveOffset(file.name, offset + consumed);
    throw SourceError("Read error in " + file.name + " after " + std::to_string(offset + consumed) + " bytes");
  }

  result.new_offset = offset + consumed;
  saveOffset(file.name, result.new_offset);

  if (logger_) {
    logger_->debug(kComponent, file.name + ": " + std::to_string(result.lines_written) + " of " +
                                   std::to_string(result.lines_read) + " lines written, offset " +
                                   std::to_string(result.previous_offset) + " -> " +
                                   std::to_string(result.new_offset));
  }
  return result;
}

void BackupRunner::saveOffset(const std::string& source, uint64_t offset) {
  CheckpointStatus status = checkpoints_->saveCheckpoint(source, offset);
  if (status == CheckpointStatus::PERSIST_FAILED && logger_) {
    logger_->warning(kComponent, "Offset of " + source + " advanced in memory only; it will be persisted "
                                 "with the next successful save");
  } else if (status == CheckpointStatus::NOT_FOUND && logger_) {
    logger_->error(kComponent, "No checkpoint record for " + source);
  }
}

}  // namespace log_backup
