/**
 * @file checkpoint_store.cpp
 * @brief Implementation of the persistent checkpoint table.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 */

#include "log_backup/checkpoint_store.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace log_backup {

using json = nlohmann::json;

namespace {

const char* kComponent = "checkpoints";
const char* kOffsetKey = "Offset";
const char* kBackupFileKey = "BackupFile";

// Local time with millisecond precision, sortable as text.
std::string destinationTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  localtime_r(&time_t, &tm);
  char time_str[32];
  std::strftime(time_str, sizeof(time_str), "%Y-%m-%d_%H-%M-%S", &tm);
  char result[40];
  std::snprintf(result, sizeof(result), "%s-%03d", time_str, static_cast<int>(millis));
  return result;
}

Checkpoint parseRecord(const std::string& source, const json& record) {
  if (!record.is_object()) {
    throw std::runtime_error("record for '" + source + "' is not an object");
  }
  auto offset = record.find(kOffsetKey);
  if (offset == record.end() || !offset->is_number_integer() || offset->get<int64_t>() < 0) {
    throw std::runtime_error("record for '" + source + "' has no valid Offset");
  }
  auto backup_file = record.find(kBackupFileKey);
  if (backup_file == record.end() || !backup_file->is_string() ||
      backup_file->get<std::string>().empty()) {
    throw std::runtime_error("record for '" + source + "' has no valid BackupFile");
  }

  Checkpoint checkpoint;
  checkpoint.offset = offset->get<uint64_t>();
  checkpoint.destination = backup_file->get<std::string>();
  return checkpoint;
}

}  // namespace

// ==================== CheckpointStore::Impl ====================

class CheckpointStore::Impl {
public:
  Impl(std::string path, std::shared_ptr<Logger> logger)
      : path_(std::move(path)), logger_(std::move(logger)) {
    load();
  }

  Checkpoint getCheckpoint(const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = table_.find(source);
    if (it != table_.end()) return it->second;

    Checkpoint checkpoint;
    checkpoint.offset = 0;
    checkpoint.destination = uniqueDestination(source);

    table_[source] = checkpoint;
    destinations_.insert(checkpoint.destination);
    persist();

    if (logger_) {
      logger_->info(kComponent, "New source " + source + " -> " + checkpoint.destination);
    }
    return checkpoint;
  }

  CheckpointStatus saveCheckpoint(const std::string& source, uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = table_.find(source);
    if (it == table_.end()) {
      if (logger_) {
        logger_->error(kComponent, "Cannot save offset for unknown source " + source);
      }
      return CheckpointStatus::NOT_FOUND;
    }

    it->second.offset = offset;
    return persist() ? CheckpointStatus::OK : CheckpointStatus::PERSIST_FAILED;
  }

  std::optional<Checkpoint> find(const std::string& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = table_.find(source);
    if (it == table_.end()) return std::nullopt;
    return it->second;
  }

  std::map<std::string, Checkpoint> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.size();
  }

  const std::string& path() const {
    return path_;
  }

private:
  void load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
      if (logger_) logger_->info(kComponent, "No state file at " + path_ + ", starting empty");
      return;
    }

    try {
      std::ifstream in(path_);
      if (!in.is_open()) {
        throw std::runtime_error("cannot open file");
      }
      json document = json::parse(in);
      if (!document.is_object()) {
        throw std::runtime_error("top-level value is not an object");
      }

      std::map<std::string, Checkpoint> loaded;
      std::set<std::string> destinations;
      for (auto it = document.begin(); it != document.end(); ++it) {
        Checkpoint checkpoint = parseRecord(it.key(), it.value());
        destinations.insert(checkpoint.destination);
        loaded.emplace(it.key(), std::move(checkpoint));
      }

      table_ = std::move(loaded);
      destinations_ = std::move(destinations);
      if (logger_) {
        logger_->info(kComponent, "Loaded " + std::to_string(table_.size()) + " checkpoints from " + path_);
      }
    } catch (const std::exception& e) {
      table_.clear();
      destinations_.clear();
      if (logger_) {
        logger_->error(kComponent, "Failed loading state file " + path_ + ": " + e.what() +
                                       "; all sources will be processed from the start");
      }
    }
  }

  std::string uniqueDestination(const std::string& source) const {
    const std::string timestamp = destinationTimestamp();
    std::string candidate = timestamp + "-" + source;
    for (int n = 1; destinations_.count(candidate); ++n) {
      candidate = timestamp + "-" + std::to_string(n) + "-" + source;
    }
    return candidate;
  }

  // Caller holds mutex_. The table is written to a temporary file first and
  // renamed over the state file.
  bool persist() {
    json document = json::object();
    for (const auto& [source, checkpoint] : table_) {
      document[source] = {{kOffsetKey, checkpoint.offset}, {kBackupFileKey, checkpoint.destination}};
    }

    const std::string tmp_path = path_ + ".tmp";
    try {
      fs::path parent = fs::path(path_).parent_path();
      if (!parent.empty()) fs::create_directories(parent);

      {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
          throw std::runtime_error("cannot open " + tmp_path);
        }
        out << document.dump(2) << '\n';
        out.flush();
        if (!out) {
          throw std::runtime_error("write to " + tmp_path + " failed");
        }
      }
      fs::rename(tmp_path, path_);
      return true;
    } catch (const std::exception& e) {
      if (logger_) {
        logger_->error(kComponent, "Failed writing state file " + path_ + ": " + e.what());
      }
      std::error_code ec;
      fs::remove(tmp_path, ec);
      return false;
    }
  }

  std::string path_;
  std::shared_ptr<Logger> logger_;
  std::map<std::string, Checkpoint> table_;
  std::set<std::string> destinations_;
  mutable std::mutex mutex_;
};

// ==================== CheckpointStore Public Interface ====================

CheckpointStore::CheckpointStore(std::string path, std::shared_ptr<Logger> logger)
    : pimpl_(std::make_unique<Impl>(std::move(path), std::move(logger))) {}

CheckpointStore::~CheckpointStore() = default;

Checkpoint CheckpointStore::getCheckpoint(const std::string& source) { return pimpl_->getCheckpoint(source); }

CheckpointStatus CheckpointStore::saveCheckpoint(const std::string& source, uint64_t offset) {
  return pimpl_->saveCheckpoint(source, offset);
}

std::optional<Checkpoint> CheckpointStore::find(const std::string& source) const { return pimpl_->find(source); }
std::map<std::string, Checkpoint> CheckpointStore::snapshot() const { return pimpl_->snapshot(); }
size_t CheckpointStore::size() const { return pimpl_->size(); }
const std::string& CheckpointStore::path() const { return pimpl_->path(); }

std::string CheckpointStore::makeDestinationName(const std::string& source) {
  return destinationTimestamp() + "-" + source;
}

}  // namespace log_backup
