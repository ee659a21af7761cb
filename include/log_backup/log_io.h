/**
 * @file log_io.h
 * @brief Source and sink seams of the backup pipeline.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 *
 * LogSource enumerates the files to back up and opens them at a byte offset;
 * LogSink appends sanitized content to backup files. The file-system
 * implementations live next to the interfaces; tests substitute in-memory
 * fakes.
 */

#ifndef LOG_BACKUP_LOG_IO_H
#define LOG_BACKUP_LOG_IO_H

#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "log_backup/diagnostics.h"

namespace log_backup {

/**
 * @struct SourceFile
 * @brief A source file as seen by one listing.
 */
struct SourceFile {
  std::string name;        ///< File name without directory
  uint64_t    length = 0;  ///< Size in bytes at listing time
};

/**
 * @class SourceError
 * @brief Raised when a source file cannot be opened or positioned.
 */
class SourceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @class SinkError
 * @brief Raised when content cannot be durably appended to a backup file.
 */
class SinkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @enum CompressionType
 * @brief Compression applied to backup output.
 */
enum class CompressionType { NONE, GZIP };

/**
 * @brief Parse compression type from string.
 * @param str "none", "gzip" or "gz".
 * @return The compression type, or nullopt if invalid.
 */
inline std::optional<CompressionType> compressionFromString(const std::string& str) {
  if (str == "none" || str == "NONE" || str.empty()) return CompressionType::NONE;
  if (str == "gzip" || str == "GZIP" || str == "gz") return CompressionType::GZIP;
  return std::nullopt;
}

/**
 * @brief Convert compression type to string representation.
 * @param type The compression type.
 * @return "none" or "gzip".
 */
inline std::string compressionToString(CompressionType type) {
  return type == CompressionType::GZIP ? "gzip" : "none";
}

/**
 * @class LogSource
 * @brief Provides the files to back up.
 */
class LogSource {
public:
  virtual ~LogSource() = default;

  /**
   * @brief Lists the files currently available.
   * @return Snapshot of names and lengths.
   */
  virtual std::vector<SourceFile> listFiles() = 0;

  /**
   * @brief Opens a file for reading at a byte offset.
   *
   * The file stays writable by other processes while it is read.
   *
   * @param file The file to open.
   * @param offset Byte position to start from.
   * @return Stream positioned at offset.
   * @throws SourceError if the file cannot be opened or positioned.
   */
  virtual std::unique_ptr<std::istream> openRead(const SourceFile& file, uint64_t offset) = 0;
};

/**
 * @class LogSink
 * @brief Append-only destination for sanitized content.
 */
class LogSink {
public:
  virtual ~LogSink() = default;

  /**
   * @brief Appends content to a backup file, creating it on first use.
   * @param destination Backup file name.
   * @param content Content to append; may be empty.
   * @throws SinkError if the content could not be written.
   */
  virtual void append(const std::string& destination, const std::string& content) = 0;
};

/**
 * @class FileLogSource
 * @brief Lists regular files of one directory (non-recursive).
 */
class FileLogSource : public LogSource {
public:
  /**
   * @brief Constructs a source over a directory.
   * @param directory Input directory.
   * @param logger Diagnostics sink; may be null.
   */
  explicit FileLogSource(std::string directory, std::shared_ptr<Logger> logger = nullptr);

  /**
   * @brief Lists regular files sorted by name.
   *
   * A missing directory logs a warning and yields no files; listing errors
   * are logged and yield no files.
   */
  std::vector<SourceFile> listFiles() override;

  std::unique_ptr<std::istream> openRead(const SourceFile& file, uint64_t offset) override;

  const std::string& directory() const { return directory_; }

private:
  std::string             directory_;
  std::shared_ptr<Logger> logger_;
};

/**
 * @class FileLogSink
 * @brief Appends backup content to files in one directory.
 *
 * With CompressionType::GZIP every append is written as a gzip member to
 * `<destination>.gz`; concatenated members decompress as one stream.
 */
class FileLogSink : public LogSink {
public:
  /**
   * @brief Constructs a sink and creates its directory.
   * @param directory Output directory.
   * @param compression Compression for backup files.
   * @param logger Diagnostics sink; may be null.
   * @throws SinkError if the directory cannot be created.
   */
  FileLogSink(std::string directory, CompressionType compression = CompressionType::NONE,
              std::shared_ptr<Logger> logger = nullptr);

  void append(const std::string& destination, const std::string& content) override;

  /**
   * @brief Full path of the file backing a destination.
   * @param destination Backup file name.
   * @return Path including the compression suffix.
   */
  std::string pathFor(const std::string& destination) const;

  const std::string& directory() const { return directory_; }
  CompressionType compression() const { return compression_; }

private:
  void appendPlain(const std::string& path, const std::string& content);
  void appendGzip(const std::string& path, const std::string& content);
  std::mutex& mutexFor(const std::string& destination);

  std::string             directory_;
  CompressionType         compression_;
  std::shared_ptr<Logger> logger_;
  std::map<std::string, std::unique_ptr<std::mutex>> destination_mutexes_;
  std::mutex              mutexes_guard_;
};

}  // namespace log_backup

#endif  // LOG_BACKUP_LOG_IO_H
