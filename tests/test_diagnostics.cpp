/**
 * @file test_diagnostics.cpp
 * @brief Unit tests for the diagnostic logger.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include "log_backup/diagnostics.h"

namespace fs = std::filesystem;
using namespace log_backup;

// ==================== Severity Tests ====================

TEST(SeverityTest, ToString) {
  EXPECT_EQ(severityToString(Severity::DEBUG), "DEBUG");
  EXPECT_EQ(severityToString(Severity::INFO), "INFO");
  EXPECT_EQ(severityToString(Severity::WARNING), "WARNING");
  EXPECT_EQ(severityToString(Severity::ERROR), "ERROR");
  EXPECT_EQ(severityToString(Severity::CRITICAL), "CRITICAL");
}

TEST(SeverityTest, FromString) {
  EXPECT_EQ(severityFromString("debug"), Severity::DEBUG);
  EXPECT_EQ(severityFromString("WARN"), Severity::WARNING);
  EXPECT_EQ(severityFromString("err"), Severity::ERROR);
  EXPECT_EQ(severityFromString("fatal"), Severity::CRITICAL);
  EXPECT_FALSE(severityFromString("verbose").has_value());
}

// ==================== Logger Tests ====================

TEST(LoggerTest, MinSeverityFilters) {
  Logger logger(Severity::WARNING);
  logger.setConsoleOutput(false);

  std::vector<Severity> received;
  logger.addCallback([&received](Severity severity, const std::string&, const std::string&) {
    received.push_back(severity);
  });

  logger.debug("test", "d");
  logger.info("test", "i");
  logger.warning("test", "w");
  logger.error("test", "e");

  ASSERT_EQ(received.size(), 2u);
  EXPECT_EQ(received[0], Severity::WARNING);
  EXPECT_EQ(received[1], Severity::ERROR);

  logger.setMinSeverity(Severity::DEBUG);
  EXPECT_EQ(logger.getMinSeverity(), Severity::DEBUG);
  logger.debug("test", "d");
  EXPECT_EQ(received.size(), 3u);
}

TEST(LoggerTest, CallbackReceivesComponentAndMessage) {
  Logger logger;
  logger.setConsoleOutput(false);

  std::string component;
  std::string message;
  logger.addCallback([&](Severity, const std::string& c, const std::string& m) {
    component = c;
    message = m;
  });

  logger.info("runner", "cycle finished");
  EXPECT_EQ(component, "runner");
  EXPECT_EQ(message, "cycle finished");
}

TEST(LoggerTest, RemoveCallback) {
  Logger logger;
  logger.setConsoleOutput(false);

  int calls = 0;
  size_t id = logger.addCallback([&calls](Severity, const std::string&, const std::string&) { ++calls; });
  logger.info("test", "one");
  logger.removeCallback(id);
  logger.info("test", "two");

  EXPECT_EQ(calls, 1);
}

TEST(LoggerTest, ThrowingCallbackDoesNotPropagate) {
  Logger logger;
  logger.setConsoleOutput(false);
  logger.addCallback([](Severity, const std::string&, const std::string&) {
    throw std::runtime_error("callback failure");
  });
  EXPECT_NO_THROW(logger.error("test", "message"));
}

TEST(LoggerTest, WritesToLogFile) {
  const fs::path path = fs::temp_directory_path() / "log_backup_diagnostics_test.log";
  fs::remove(path);

  {
    Logger logger;
    ASSERT_TRUE(logger.setLogFile(path.string()));
    logger.warning("sink", "disk almost full");
    logger.debug("sink", "not written");
  }

  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string content = buffer.str();

  EXPECT_NE(content.find("[WARNING] sink: disk almost full"), std::string::npos);
  EXPECT_EQ(content.find("not written"), std::string::npos);

  fs::remove(path);
}

TEST(LoggerTest, BadLogFileFails) {
  Logger logger;
  EXPECT_FALSE(logger.setLogFile("/nonexistent/dir/log_backup.log"));
}
