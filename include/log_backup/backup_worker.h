/**
 * @file backup_worker.h
 * @brief Periodic driver of backup cycles.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 *
 * BackupWorker runs BackupRunner::runCycle on a background thread at a fixed
 * interval until stopped. Errors of a cycle are logged and the next cycle
 * runs as scheduled; only stop() ends the loop.
 */

#ifndef LOG_BACKUP_BACKUP_WORKER_H
#define LOG_BACKUP_BACKUP_WORKER_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "log_backup/backup_runner.h"
#include "log_backup/diagnostics.h"

namespace log_backup {

/**
 * @typedef CycleCallback
 * @brief Callback type for finished cycles.
 */
using CycleCallback = std::function<void(const CycleReport&)>;

/**
 * @class BackupWorker
 * @brief Runs backup cycles on an interval.
 */
class BackupWorker {
public:
  /**
   * @brief Constructs a worker.
   * @param runner The runner executing each cycle.
   * @param interval Delay between the end of a cycle and the next one.
   * @param logger Diagnostics sink; may be null.
   */
  BackupWorker(std::shared_ptr<BackupRunner> runner, std::chrono::milliseconds interval,
               std::shared_ptr<Logger> logger = nullptr);

  /**
   * @brief Stops the worker if running and destroys it.
   */
  ~BackupWorker();

  // Disable copy
  BackupWorker(const BackupWorker&) = delete;
  BackupWorker& operator=(const BackupWorker&) = delete;

  // Enable move
  BackupWorker(BackupWorker&&) noexcept;
  BackupWorker& operator=(BackupWorker&&) noexcept;

  // ==================== Lifecycle ====================

  /**
   * @brief Starts the cycle loop on a background thread.
   *
   * The first cycle runs immediately. Calling start() on a running worker
   * does nothing.
   */
  void start();

  /**
   * @brief Requests cancellation and joins the loop.
   *
   * A cycle in progress finishes its current lines and starts no new file.
   */
  void stop();

  /**
   * @brief Checks if the worker loop is running.
   * @return true if running, false otherwise.
   */
  bool isRunning() const;

  /**
   * @brief Blocks until the worker stops or timeout.
   * @param timeout Maximum wait time (0 = infinite).
   * @return true if stopped, false if timed out.
   */
  bool waitForStop(std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  /**
   * @brief Runs one cycle on the calling thread.
   * @return The cycle report.
   */
  CycleReport runOnce();

  // ==================== Statistics ====================

  /**
   * @brief Gets the counters accumulated over all cycles.
   * @return Current statistics.
   */
  BackupStatistics getStatistics() const;

  /**
   * @brief Resets all statistics.
   */
  void resetStatistics();

  /**
   * @brief Exports statistics to a file.
   * @param path File path for statistics.
   * @return true if export was successful.
   */
  bool exportStatistics(const std::string& path) const;

  // ==================== Callbacks ====================

  /**
   * @brief Registers a callback for finished cycles.
   * @param callback Function to call with each cycle report.
   * @return Callback ID for removal.
   */
  size_t onCycle(CycleCallback callback);

  /**
   * @brief Removes a callback by ID.
   * @param id The callback ID to remove.
   */
  void removeCallback(size_t id);

  /**
   * @brief Gets the interval between cycles.
   * @return The interval.
   */
  std::chrono::milliseconds getInterval() const;

private:
  /**
   * @class Impl
   * @brief Private implementation class (PIMPL pattern).
   */
  class Impl;

  /**
   * @brief Pointer to the private implementation.
   */
  std::unique_ptr<Impl> pimpl_;
};

}  // namespace log_backup

#endif  // LOG_BACKUP_BACKUP_WORKER_H
