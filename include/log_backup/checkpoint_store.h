/**
 * @file checkpoint_store.h
 * @brief Persistent per-source read offsets and backup destinations.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 *
 * The store maps each source file name to the byte offset already backed up
 * and to the name of the backup file its content is appended to. The whole
 * table is rewritten after every mutation so a restart resumes where the last
 * successful pass stopped.
 */

#ifndef LOG_BACKUP_CHECKPOINT_STORE_H
#define LOG_BACKUP_CHECKPOINT_STORE_H

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "log_backup/diagnostics.h"

namespace log_backup {

/**
 * @struct Checkpoint
 * @brief Backup progress of one source file.
 */
struct Checkpoint {
  uint64_t    offset = 0;   ///< Bytes of the source already consumed
  std::string destination;  ///< Backup file the source is appended to; never changes

  bool operator==(const Checkpoint& other) const {
    return offset == other.offset && destination == other.destination;
  }
};

/**
 * @enum CheckpointStatus
 * @brief Result of CheckpointStore::saveCheckpoint.
 */
enum class CheckpointStatus {
  OK,              ///< Updated and persisted
  NOT_FOUND,       ///< No record; getCheckpoint was never called for the source
  PERSIST_FAILED   ///< Updated in memory, but the table could not be written
};

/**
 * @brief Convert checkpoint status to string representation.
 * @param status The status.
 * @return String representation of the status.
 */
inline std::string checkpointStatusToString(CheckpointStatus status) {
  switch (status) {
    case CheckpointStatus::OK: return "OK";
    case CheckpointStatus::NOT_FOUND: return "NOT_FOUND";
    case CheckpointStatus::PERSIST_FAILED: return "PERSIST_FAILED";
    default: return "UNKNOWN";
  }
}

/**
 * @class CheckpointStore
 * @brief Thread-safe checkpoint table persisted as a JSON file.
 *
 * File layout (compatible with state files of earlier deployments):
 * @code
 * { "app.log": { "Offset": 1024, "BackupFile": "2026-01-05_10-00-00-123-app.log" } }
 * @endcode
 *
 * A missing file is an empty table. A file that cannot be parsed is logged
 * and replaced by an empty table, which re-processes every source from the
 * start on the next cycle.
 */
class CheckpointStore {
public:
  /**
   * @brief Constructs a store and loads the table from disk.
   * @param path Path to the JSON state file.
   * @param logger Diagnostics sink; may be null.
   */
  explicit CheckpointStore(std::string path, std::shared_ptr<Logger> logger = nullptr);

  /**
   * @brief Destroys the CheckpointStore object.
   */
  ~CheckpointStore();

  // Disable copy
  CheckpointStore(const CheckpointStore&) = delete;
  CheckpointStore& operator=(const CheckpointStore&) = delete;

  /**
   * @brief Returns the checkpoint of a source, creating it when absent.
   *
   * A new record starts at offset 0 with a fresh, time-ordered destination
   * name that no other source uses. Creation is persisted immediately.
   *
   * @param source Source file name.
   * @return The current checkpoint.
   */
  Checkpoint getCheckpoint(const std::string& source);

  /**
   * @brief Stores a new offset for an existing record and persists the table.
   *
   * On PERSIST_FAILED the in-memory offset is still updated.
   *
   * @param source Source file name.
   * @param offset New byte offset.
   * @return OK, NOT_FOUND or PERSIST_FAILED.
   */
  CheckpointStatus saveCheckpoint(const std::string& source, uint64_t offset);

  /**
   * @brief Looks up a record without creating it.
   * @param source Source file name.
   * @return The checkpoint, or nullopt if unknown.
   */
  std::optional<Checkpoint> find(const std::string& source) const;

  /**
   * @brief Copies the whole table.
   * @return Map of source name to checkpoint.
   */
  std::map<std::string, Checkpoint> snapshot() const;

  /**
   * @brief Number of known sources.
   * @return Record count.
   */
  size_t size() const;

  /**
   * @brief Path of the state file.
   * @return The state file path.
   */
  const std::string& path() const;

  /**
   * @brief Builds a destination name for a source at the current local time.
   * @param source Source file name.
   * @return `YYYY-MM-DD_HH-MM-SS-mmm-<source>`.
   */
  static std::string makeDestinationName(const std::string& source);

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

#endif  // LOG_BACKUP_CHECKPOINT_STORE_H
