/**
 * @file backup_worker.cpp
 * @brief Implementation of the periodic backup driver.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 */

#include "log_backup/backup_worker.h"

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace log_backup {

namespace {
const char* kComponent = "worker";
}  // namespace

// ==================== BackupWorker::Impl ====================

class BackupWorker::Impl {
public:
  Impl(std::shared_ptr<BackupRunner> runner, std::chrono::milliseconds interval,
       std::shared_ptr<Logger> logger)
      : runner_(std::move(runner)),
        interval_(interval),
        logger_(std::move(logger)),
        running_(false),
        next_callback_id_(1) {
    if (!runner_) {
      throw std::invalid_argument("BackupWorker requires a runner");
    }
    statistics_.reset();
  }

  ~Impl() {
    stop();
  }

  void start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) return;
    if (loop_thread_.joinable()) loop_thread_.join();

    {
      std::lock_guard<std::mutex> token_lock(token_mutex_);
      token_ = CancellationToken();
    }
    running_ = true;
    loop_thread_ = std::thread(&Impl::loop, this);
  }

  void stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    currentToken().cancel();
    if (loop_thread_.joinable()) {
      loop_thread_.join();
    }
  }

  bool isRunning() const {
    return running_;
  }

  bool waitForStop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    if (timeout.count() == 0) {
      stop_cv_.wait(lock, [this] { return !running_.load(); });
      return true;
    }
    return stop_cv_.wait_for(lock, timeout, [this] { return !running_.load(); });
  }

  CycleReport runOnce() {
    return runCycle(currentToken());
  }

  BackupStatistics getStatistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return statistics_;
  }

  void resetStatistics() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    statistics_.reset();
  }

  bool exportStatistics(const std::string& path) const {
    std::ofstream out(path);
    if (!out.is_open()) return false;

    std::lock_guard<std::mutex> lock(stats_mutex_);
    out << statistics_.toJson();
    return static_cast<bool>(out);
  }

  size_t onCycle(CycleCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    size_t id = next_callback_id_++;
    cycle_callbacks_[id] = std::move(callback);
    return id;
  }

  void removeCallback(size_t id) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    cycle_callbacks_.erase(id);
  }

  std::chrono::milliseconds getInterval() const {
    return interval_;
  }

private:
  CancellationToken currentToken() const {
    std::lock_guard<std::mutex> lock(token_mutex_);
    return token_;
  }

  void loop() {
    CancellationToken token = currentToken();
    if (logger_) logger_->info(kComponent, "Log backup worker started");

    while (!token.isCancelled()) {
      try {
        runCycle(token);
      } catch (const std::exception& e) {
        if (logger_) logger_->error(kComponent, "Worker encountered an unexpected error: " + std::string(e.what()));
      } catch (...) {
        if (logger_) logger_->error(kComponent, "Worker encountered an unexpected error: unknown error");
      }
      if (token.waitFor(interval_)) break;
    }

    if (logger_) logger_->info(kComponent, "Log backup worker stopping");
    {
      std::lock_guard<std::mutex> lock(stop_mutex_);
      running_ = false;
    }
    stop_cv_.notify_all();
  }

  CycleReport runCycle(const CancellationToken& token) {
    CycleReport report = runner_->runCycle(token);
    {
      std::lock_guard<std::mutex> lock(stats_mutex_);
      statistics_.merge(report.statistics);
    }
    invokeCycleCallbacks(report);
    return report;
  }

  void invokeCycleCallbacks(const CycleReport& report) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (const auto& [_, callback] : cycle_callbacks_) {
      try {
        callback(report);
      } catch (const std::exception& e) {
        if (logger_) logger_->warning(kComponent, "Cycle callback failed: " + std::string(e.what()));
      } catch (...) {
        if (logger_) logger_->warning(kComponent, "Cycle callback failed: unknown error");
      }
    }
  }

  std::shared_ptr<BackupRunner> runner_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<Logger> logger_;

  // Loop thread
  std::atomic<bool> running_;
  std::thread loop_thread_;
  std::mutex lifecycle_mutex_;
  CancellationToken token_;
  mutable std::mutex token_mutex_;

  // Stop synchronization
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  // Statistics
  BackupStatistics statistics_;
  mutable std::mutex stats_mutex_;

  // Callbacks
  std::map<size_t, CycleCallback> cycle_callbacks_;
  std::mutex callbacks_mutex_;
  size_t next_callback_id_;
};

// ==================== BackupWorker Public Interface ====================

BackupWorker::BackupWorker(std::shared_ptr<BackupRunner> runner, std::chrono::milliseconds interval,
                           std::shared_ptr<Logger> logger)
    : pimpl_(std::make_unique<Impl>(std::move(runner), interval, std::move(logger))) {}

BackupWorker::~BackupWorker() = default;

BackupWorker::BackupWorker(BackupWorker&&) noexcept = default;
BackupWorker& BackupWorker::operator=(BackupWorker&&) noexcept = default;

void BackupWorker::start() { pimpl_->start(); }
void BackupWorker::stop() { pimpl_->stop(); }
bool BackupWorker::isRunning() const { return pimpl_->isRunning(); }
bool BackupWorker::waitForStop(std::chrono::milliseconds timeout) { return pimpl_->waitForStop(timeout); }
CycleReport BackupWorker::runOnce() { return pimpl_->runOnce(); }

BackupStatistics BackupWorker::getStatistics() const { return pimpl_->getStatistics(); }
void BackupWorker::resetStatistics() { pimpl_->resetStatistics(); }
bool BackupWorker::exportStatistics(const std::string& path) const { return pimpl_->exportStatistics(path); }

size_t BackupWorker::onCycle(CycleCallback callback) { return pimpl_->onCycle(std::move(callback)); }
void BackupWorker::removeCallback(size_t id) { pimpl_->removeCallback(id); }
std::chrono::milliseconds BackupWorker::getInterval() const { return pimpl_->getInterval(); }

}  // namespace log_backup
