/**
 * @file backup_runner.h
 * @brief Incremental, resumable backup of a set of log files.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 *
 * BackupRunner reads only the bytes appended to each source since its last
 * checkpoint, passes every line through a LogProcessor, appends the results
 * to the source's backup file and advances the checkpoint. One cycle handles
 * every listed source with bounded parallelism; a failing file never stops
 * its siblings.
 */

#ifndef LOG_BACKUP_BACKUP_RUNNER_H
#define LOG_BACKUP_BACKUP_RUNNER_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "log_backup/checkpoint_store.h"
#include "log_backup/diagnostics.h"
#include "log_backup/log_io.h"
#include "log_backup/log_processor.h"

namespace log_backup {

/**
 * @class CancellationToken
 * @brief Cooperative stop signal shared by copies of the token.
 */
class CancellationToken {
public:
  CancellationToken();

  /**
   * @brief Requests cancellation and wakes every waiter.
   */
  void cancel();

  /**
   * @brief Checks whether cancellation was requested.
   * @return true once cancel() was called.
   */
  bool isCancelled() const;

  /**
   * @brief Sleeps until the timeout elapses or cancellation is requested.
   * @param timeout Maximum wait time.
   * @return true if cancelled.
   */
  bool waitFor(std::chrono::milliseconds timeout) const;

private:
  struct State {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    cancelled = false;
  };
  std::shared_ptr<State> state_;
};

/**
 * @enum FileStatus
 * @brief Outcome of one pipeline run over a file.
 */
enum class FileStatus {
  EMPTY,       ///< Source is empty; empty backup ensured
  UP_TO_DATE,  ///< No new bytes since the checkpoint
  PROCESSED,   ///< New bytes read to the end of the stream
  CANCELLED,   ///< Stopped early; checkpoint covers the consumed lines
  FAILED       ///< Aborted by an error; checkpoint not advanced past it
};

/**
 * @brief Convert file status to string representation.
 * @param status The file status.
 * @return String representation of the status.
 */
inline std::string fileStatusToString(FileStatus status) {
  switch (status) {
    case FileStatus::EMPTY: return "EMPTY";
    case FileStatus::UP_TO_DATE: return "UP_TO_DATE";
    case FileStatus::PROCESSED: return "PROCESSED";
    case FileStatus::CANCELLED: return "CANCELLED";
    case FileStatus::FAILED: return "FAILED";
    default: return "UNKNOWN";
  }
}

/**
 * @struct FileResult
 * @brief What one pipeline run did to one file.
 */
struct FileResult {
  std::string name;                            ///< Source file name
  FileStatus  status = FileStatus::FAILED;     ///< Outcome
  uint64_t    previous_offset = 0;             ///< Checkpoint offset before the run
  uint64_t    new_offset = 0;                  ///< Checkpoint offset after the run
  bool        truncated = false;               ///< Source shrank below the checkpoint
  uint64_t    lines_read = 0;                  ///< Lines consumed, blank ones included
  uint64_t    lines_blank = 0;                 ///< Blank lines discarded
  uint64_t    lines_written = 0;               ///< Lines appended to the backup
  uint64_t    lines_skipped = 0;               ///< Lines dropped by skip rules
  uint64_t    lines_malformed = 0;             ///< Lines that were not JSON objects
  uint64_t    lines_failed = 0;                ///< Lines the processor failed on
  uint64_t    bytes_read = 0;                  ///< Source bytes consumed
  uint64_t    bytes_written = 0;               ///< Backup bytes appended
  std::string error;                           ///< Failure reason when FAILED
};

/**
 * @struct BackupStatistics
 * @brief Counters aggregated over files and cycles.
 */
struct BackupStatistics {
  uint64_t cycles = 0;             ///< Completed cycles
  uint64_t files_seen = 0;         ///< Files handled, all statuses
  uint64_t files_processed = 0;    ///< Files with new bytes read
  uint64_t files_up_to_date = 0;   ///< Files without new bytes (empty ones included)
  uint64_t files_failed = 0;       ///< Files aborted by an error
  uint64_t truncations = 0;        ///< Truncations or rotations detected
  uint64_t lines_read = 0;         ///< Source lines consumed
  uint64_t lines_written = 0;      ///< Lines appended to backups
  uint64_t lines_skipped = 0;      ///< Lines dropped by skip rules
  uint64_t lines_malformed = 0;    ///< Lines that were not JSON objects
  uint64_t lines_failed = 0;       ///< Lines the processor failed on
  uint64_t bytes_read = 0;         ///< Source bytes consumed
  uint64_t bytes_written = 0;      ///< Backup bytes appended
  std::chrono::system_clock::time_point start_time;   ///< When counting started
  std::chrono::system_clock::time_point last_update;  ///< Last change

  /**
   * @brief Adds one file result to the counters.
   * @param result The file result.
   */
  void record(const FileResult& result);

  /**
   * @brief Adds another set of counters (times are not merged).
   * @param other Counters to add.
   */
  void merge(const BackupStatistics& other);

  /**
   * @brief Convert statistics to JSON string.
   * @return JSON representation of statistics.
   */
  std::string toJson() const;

  /**
   * @brief Reset all statistics.
   */
  void reset();
};

/**
 * @struct CycleReport
 * @brief Result of one BackupRunner::runCycle call.
 */
struct CycleReport {
  std::vector<FileResult> files;       ///< One entry per file that was started
  BackupStatistics        statistics;  ///< Counters of this cycle
  bool                    cancelled = false;  ///< Cancellation was requested during the cycle
  std::chrono::milliseconds duration{0};      ///< Wall time of the cycle
};

/**
 * @struct RunnerOptions
 * @brief Tuning of BackupRunner.
 */
struct RunnerOptions {
  size_t max_parallel_files = 4;      ///< Upper bound of concurrently processed files (>= 1)
  size_t checkpoint_batch_lines = 0;  ///< Flush and save the offset every N written lines (0 = once per file)
};

/**
 * @class BackupRunner
 * @brief Single-file pipeline and multi-file orchestrator.
 */
class BackupRunner {
public:
  /**
   * @brief Constructs a runner over injected collaborators.
   * @param source Files to back up.
   * @param sink Backup destination.
   * @param checkpoints Offset and destination table.
   * @param processor Line transformer.
   * @param options Parallelism and checkpoint batching.
   * @param logger Diagnostics sink; may be null.
   */
  BackupRunner(std::shared_ptr<LogSource> source, std::shared_ptr<LogSink> sink,
               std::shared_ptr<CheckpointStore> checkpoints, std::shared_ptr<LogProcessor> processor,
               RunnerOptions options = RunnerOptions(), std::shared_ptr<Logger> logger = nullptr);

  // Disable copy
  BackupRunner(const BackupRunner&) = delete;
  BackupRunner& operator=(const BackupRunner&) = delete;

  /**
   * @brief Backs up every currently listed file once.
   *
   * Files are listed once. At most max_parallel_files files are processed at
   * the same time. An exception escaping one file is logged and recorded as a
   * FAILED result. After cancellation no new file is started.
   *
   * @param token Cancellation signal.
   * @return Per-file results and counters.
   */
  CycleReport runCycle(const CancellationToken& token);

  /**
   * @brief Runs the pipeline for one file.
   *
   * | Condition            | Action                                        |
   * |----------------------|-----------------------------------------------|
   * | length == 0          | append empty content, save offset 0 (EMPTY)   |
   * | length < offset      | warn, restart from offset 0                   |
   * | length == offset     | nothing, source not opened (UP_TO_DATE)       |
   * | length > offset      | read to end of stream (PROCESSED / CANCELLED) |
   *
   * Blank lines are discarded. Lines the processor drops or throws on are
   * skipped. Emitted lines are buffered and handed to the sink in one append
   * per pass, or per batch when checkpoint_batch_lines is set. The offset is
   * saved only after the append succeeds.
   *
   * @param file The file as listed.
   * @param token Cancellation signal, checked before every line.
   * @return What the run did.
   * @throws SinkError if the backup cannot be written; the checkpoint is not
   *         advanced past the failing line.
   * @throws SourceError if the source cannot be opened or read.
   */
  FileResult processFile(const SourceFile& file, const CancellationToken& token);

  /**
   * @brief Gets the runner options.
   * @return The options.
   */
  const RunnerOptions& options() const { return options_; }

private:
  FileResult processIsolated(const SourceFile& file, const CancellationToken& token);
  FileResult failedResult(const SourceFile& file, const std::string& error) const;
  void saveOffset(const std::string& source, uint64_t offset);

  std::shared_ptr<LogSource>       source_;
  std::shared_ptr<LogSink>         sink_;
  std::shared_ptr<CheckpointStore> checkpoints_;
  std::shared_ptr<LogProcessor>    processor_;
  RunnerOptions                    options_;
  std::shared_ptr<Logger>          logger_;
};

}  // namespace log_backup

#endif  // LOG_BACKUP_BACKUP_RUNNER_H
