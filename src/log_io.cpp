/**
 * @file log_io.cpp
 * @brief File-system implementations of LogSource and LogSink.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 */

#include "log_backup/log_io.h"

#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace log_backup {

// ==================== FileLogSource ====================

FileLogSource::FileLogSource(std::string directory, std::shared_ptr<Logger> logger)
    : directory_(std::move(directory)), logger_(std::move(logger)) {}

std::vector<SourceFile> FileLogSource::listFiles() {
  std::vector<SourceFile> files;
  try {
    if (!fs::is_directory(directory_)) {
      if (logger_) logger_->warning("source", "Input directory " + directory_ + " does not exist");
      return files;
    }

    for (const auto& entry : fs::directory_iterator(directory_)) {
      std::error_code ec;
      if (!entry.is_regular_file(ec) || ec) continue;
      uint64_t size = entry.file_size(ec);
      if (ec) continue;  // vanished between listing and stat
      files.push_back({entry.path().filename().string(), size});
    }
  } catch (const fs::filesystem_error& e) {
    if (logger_) logger_->error("source", "Failed to list files from " + directory_ + ": " + e.what());
    files.clear();
    return files;
  }

  std::sort(files.begin(), files.end(),
            [](const SourceFile& a, const SourceFile& b) { return a.name < b.name; });
  return files;
}

std::unique_ptr<std::istream> FileLogSource::openRead(const SourceFile& file, uint64_t offset) {
  const std::string path = (fs::path(directory_) / file.name).string();

  auto stream = std::make_unique<std::ifstream>(path, std::ios::in | std::ios::binary);
  if (!stream->is_open()) {
    std::string message = "Failed to open file " + file.name + " at offset " + std::to_string(offset) +
                          ": " + std::strerror(errno);
    if (logger_) logger_->error("source", message);
    throw SourceError(message);
  }

  stream->seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!*stream) {
    std::string message = "Failed to seek file " + file.name + " to offset " + std::to_string(offset);
    if (logger_) logger_->error("source", message);
    throw SourceError(message);
  }
  return stream;
}

// ==================== FileLogSink ====================

FileLogSink::FileLogSink(std::string directory, CompressionType compression,
                         std::shared_ptr<Logger> logger)
    : directory_(std::move(directory)), compression_(compression), logger_(std::move(logger)) {
  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec) {
    throw SinkError("Cannot create backup directory " + directory_ + ": " + ec.message());
  }
}

std::string FileLogSink::pathFor(const std::string& destination) const {
  std::string path = (fs::path(directory_) / destination).string();
  if (compression_ == CompressionType::GZIP) path += ".gz";
  return path;
}

void FileLogSink::append(const std::string& destination, const std::string& content) {
  const std::string path = pathFor(destination);
  std::lock_guard<std::mutex> lock(mutexFor(destination));
  try {
    if (compression_ == CompressionType::GZIP) {
      appendGzip(path, content);
    } else {
      appendPlain(path, content);
    }
  } catch (const SinkError& e) {
    if (logger_) logger_->error("sink", "Failed writing to backup file " + destination + ": " + e.what());
    throw;
  }
}

void FileLogSink::appendPlain(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::out | std::ios::app | std::ios::binary);
  if (!out.is_open()) {
    throw SinkError("cannot open " + path + ": " + std::strerror(errno));
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out) {
    throw SinkError("write to " + path + " failed");
  }
}

void FileLogSink::appendGzip(const std::string& path, const std::string& content) {
  // gzclose emits a member header even when nothing was written.
  if (content.empty()) {
    appendPlain(path, content);
    return;
  }

  gzFile gz = gzopen(path.c_str(), "ab");
  if (!gz) {
    throw SinkError("cannot open " + path + ": " + std::strerror(errno));
  }

  int written = gzwrite(gz, content.data(), static_cast<unsigned>(content.size()));
  if (written <= 0) {
    int errnum = 0;
    std::string reason = gzerror(gz, &errnum);
    gzclose(gz);
    throw SinkError("gzip write to " + path + " failed: " + reason);
  }

  if (gzclose(gz) != Z_OK) {
    throw SinkError("gzip close of " + path + " failed");
  }
}

std::mutex& FileLogSink::mutexFor(const std::string& destination) {
  std::lock_guard<std::mutex> lock(mutexes_guard_);
  auto& entry = destination_mutexes_[destination];
  if (!entry) entry = std::make_unique<std::mutex>();
  return *entry;
}

}  // namespace log_backup
