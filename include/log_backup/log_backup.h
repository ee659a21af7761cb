/**
 * @file log_backup.h
 * @brief Main header file for the log_backup library.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 *
 * This header pulls in the public interface of the log_backup library.
 *
 * @version 1.0
 * @date 2026-10-18
 *
 * @details
 * The library incrementally copies JSON log files into a sanitized backup
 * directory. Each source is read from its last checkpointed byte offset,
 * every line is masked, filtered and normalized, and the result is appended
 * to a backup file that stays the same for the life of the source. Progress
 * survives restarts, truncation and rotation, and malformed lines.
 *
 * @note This library requires C++17 or later.
 */

#ifndef LOG_BACKUP_H
#define LOG_BACKUP_H

#include "log_backup/backup_runner.h"
#include "log_backup/backup_worker.h"
#include "log_backup/checkpoint_store.h"
#include "log_backup/config.h"
#include "log_backup/diagnostics.h"
#include "log_backup/log_io.h"
#include "log_backup/log_processor.h"

/**
 * @namespace log_backup
 * @brief Main namespace for log_backup library.
 */
namespace log_backup {

/// Library version string.
inline constexpr const char* kVersion = "1.0.0";

}  // namespace log_backup

#endif  // LOG_BACKUP_H
