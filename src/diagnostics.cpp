/**
 * @file diagnostics.cpp
 * @brief Implementation of the log_backup diagnostic logger.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 */

#include "log_backup/diagnostics.h"

#include <chrono>
#include <ctime>
#include <iostream>
#include <sstream>

namespace log_backup {

namespace {

std::string currentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&time_t, &tm);
  char time_str[20];
  std::strftime(time_str, sizeof(time_str), "%Y-%m-%d %H:%M:%S", &tm);
  return time_str;
}

}  // namespace

Logger::Logger(Severity min_severity)
    : min_severity_(min_severity), console_output_(true), next_callback_id_(1) {}

void Logger::log(Severity severity, const std::string& component, const std::string& message) {
  if (severity < min_severity_.load()) return;

  std::ostringstream oss;
  oss << currentTimestamp() << " [" << severityToString(severity) << "] " << component << ": "
      << message;
  const std::string line = oss.str();

  std::lock_guard<std::mutex> lock(mutex_);
  if (log_file_.is_open()) {
    log_file_ << line << std::endl;
  } else if (console_output_) {
    std::cerr << line << std::endl;
  }

  for (const auto& [_, callback] : callbacks_) {
    try {
      callback(severity, component, message);
    } catch (const std::exception& e) {
      std::cerr << "Diagnostic callback failed: " << e.what() << std::endl;
    } catch (...) {
      std::cerr << "Diagnostic callback failed: unknown error" << std::endl;
    }
  }
}

void Logger::setMinSeverity(Severity min_severity) {
  min_severity_ = min_severity;
}

Severity Logger::getMinSeverity() const {
  return min_severity_;
}

void Logger::setConsoleOutput(bool enabled) {
  console_output_ = enabled;
}

bool Logger::setLogFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (log_file_.is_open()) log_file_.close();
  if (path.empty()) return true;
  log_file_.open(path, std::ios::app);
  return log_file_.is_open();
}

size_t Logger::addCallback(DiagnosticCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_callback_id_++;
  callbacks_[id] = std::move(callback);
  return id;
}

void Logger::removeCallback(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(id);
}

}  // namespace log_backup
