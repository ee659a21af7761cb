/**
 * @file test_backup_worker.cpp
 * @brief Unit tests for the periodic backup worker.
 * @author Sandesh Ghimire | sandesh@soccentric
 * @copyright (C) Soccentric LLC. All rights reserved.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

#include "log_backup/backup_worker.h"

namespace fs = std::filesystem;
using namespace log_backup;

// ==================== Test Fixtures ====================

class BackupWorkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    const std::string test_name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    test_dir_ = fs::temp_directory_path() / ("log_backup_worker_" + test_name);
    fs::remove_all(test_dir_);
    input_dir_ = test_dir_ / "input";
    output_dir_ = test_dir_ / "output";
    fs::create_directories(input_dir_);

    logger_ = std::make_shared<Logger>(Severity::DEBUG);
    logger_->setConsoleOutput(false);

    auto source = std::make_shared<FileLogSource>(input_dir_.string(), logger_);
    auto sink = std::make_shared<FileLogSink>(output_dir_.string(), CompressionType::NONE, logger_);
    checkpoints_ = std::make_shared<CheckpointStore>((test_dir_ / "state.json").string(), logger_);
    auto processor = std::make_shared<JsonLogProcessor>(ProcessingConfig(), logger_);
    runner_ = std::make_shared<BackupRunner>(source, sink, checkpoints_, processor, RunnerOptions(), logger_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  void appendInput(const std::string& name, const std::string& content) {
    std::ofstream out(input_dir_ / name, std::ios::app | std::ios::binary);
    out << content;
  }

  std::string backupOf(const std::string& source) {
    auto checkpoint = checkpoints_->find(source);
    if (!checkpoint) return std::string();
    std::ifstream in(output_dir_ / checkpoint->destination, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
  }

  fs::path test_dir_;
  fs::path input_dir_;
  fs::path output_dir_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<CheckpointStore> checkpoints_;
  std::shared_ptr<BackupRunner> runner_;
};

// ==================== Construction Tests ====================

TEST(BackupWorkerBasicTest, NullRunnerThrows) {
  EXPECT_THROW(BackupWorker(nullptr, std::chrono::milliseconds(100)), std::invalid_argument);
}

TEST_F(BackupWorkerTest, IntervalIsKept) {
  BackupWorker worker(runner_, std::chrono::milliseconds(1500));
  EXPECT_EQ(worker.getInterval(), std::chrono::milliseconds(1500));
  EXPECT_FALSE(worker.isRunning());
}

TEST_F(BackupWorkerTest, MoveConstructor) {
  BackupWorker worker1(runner_, std::chrono::milliseconds(100));
  BackupWorker worker2(std::move(worker1));
  EXPECT_EQ(worker2.getInterval(), std::chrono::milliseconds(100));
}

// ==================== RunOnce Tests ====================

TEST_F(BackupWorkerTest, RunOnceBacksUpFiles) {
  appendInput("app.log", "{\"msg\":\"hello\"}\n");
  BackupWorker worker(runner_, std::chrono::seconds(60), logger_);

  CycleReport report = worker.runOnce();

  ASSERT_EQ(report.files.size(), 1u);
  EXPECT_EQ(report.files[0].status, FileStatus::PROCESSED);
  EXPECT_EQ(backupOf("app.log"), "{\"msg\":\"hello\"}\n");
}

TEST_F(BackupWorkerTest, StatisticsAccumulate) {
  BackupWorker worker(runner_, std::chrono::seconds(60), logger_);

  appendInput("app.log", "{\"n\":1}\n");
  worker.runOnce();
  appendInput("app.log", "{\"n\":2}\n{\"n\":3}\n");
  worker.runOnce();

  BackupStatistics stats = worker.getStatistics();
  EXPECT_EQ(stats.cycles, 2u);
  EXPECT_EQ(stats.lines_written, 3u);
  EXPECT_EQ(stats.files_processed, 2u);

  worker.resetStatistics();
  EXPECT_EQ(worker.getStatistics().cycles, 0u);
}

TEST_F(BackupWorkerTest, ExportStatistics) {
  appendInput("app.log", "{\"n\":1}\n");
  BackupWorker worker(runner_, std::chrono::seconds(60), logger_);
  worker.runOnce();

  const fs::path stats_file = test_dir_ / "stats.json";
  ASSERT_TRUE(worker.exportStatistics(stats_file.string()));

  std::ifstream in(stats_file);
  std::stringstream buffer;
  buffer << in.rdbuf();
  EXPECT_NE(buffer.str().find("\"lines_written\":1"), std::string::npos);
}

TEST_F(BackupWorkerTest, ExportStatisticsToBadPathFails) {
  BackupWorker worker(runner_, std::chrono::seconds(60), logger_);
  EXPECT_FALSE(worker.exportStatistics((test_dir_ / "missing" / "stats.json").string()));
}

// ==================== Callback Tests ====================

TEST_F(BackupWorkerTest, CycleCallback) {
  appendInput("app.log", "{\"n\":1}\n");
  BackupWorker worker(runner_, std::chrono::seconds(60), logger_);

  int calls = 0;
  uint64_t written = 0;
  size_t id = worker.onCycle([&](const CycleReport& report) {
    ++calls;
    written += report.statistics.lines_written;
  });

  worker.runOnce();
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(written, 1u);

  worker.removeCallback(id);
  worker.runOnce();
  EXPECT_EQ(calls, 1);
}

TEST_F(BackupWorkerTest, ThrowingCallbackIsContained) {
  BackupWorker worker(runner_, std::chrono::seconds(60), logger_);
  worker.onCycle([](const CycleReport&) { throw std::runtime_error("callback failure"); });
  EXPECT_NO_THROW(worker.runOnce());
}

// ==================== Lifecycle Tests ====================

TEST_F(BackupWorkerTest, StartRunsFirstCycleImmediately) {
  appendInput("app.log", "{\"n\":1}\n");
  BackupWorker worker(runner_, std::chrono::seconds(60), logger_);

  std::atomic<int> cycles{0};
  worker.onCycle([&cycles](const CycleReport&) { ++cycles; });

  worker.start();
  EXPECT_TRUE(worker.isRunning());
  for (int i = 0; i < 200 && cycles.load() == 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  worker.stop();

  EXPECT_EQ(cycles.load(), 1);
  EXPECT_FALSE(worker.isRunning());
  EXPECT_EQ(backupOf("app.log"), "{\"n\":1}\n");
}

TEST_F(BackupWorkerTest, StopInterruptsInterval) {
  BackupWorker worker(runner_, std::chrono::seconds(3600), logger_);
  worker.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  auto started = std::chrono::steady_clock::now();
  worker.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
  EXPECT_TRUE(worker.waitForStop(std::chrono::milliseconds(100)));
}

TEST_F(BackupWorkerTest, RepeatsOnInterval) {
  BackupWorker worker(runner_, std::chrono::milliseconds(20), logger_);
  std::atomic<int> cycles{0};
  worker.onCycle([&cycles](const CycleReport&) { ++cycles; });

  worker.start();
  for (int i = 0; i < 300 && cycles.load() < 3; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  worker.stop();

  EXPECT_GE(cycles.load(), 3);
}

TEST_F(BackupWorkerTest, PicksUpNewDataBetweenCycles) {
  BackupWorker worker(runner_, std::chrono::milliseconds(20), logger_);
  std::atomic<uint64_t> written{0};
  worker.onCycle([&written](const CycleReport& report) { written += report.statistics.lines_written; });

  worker.start();
  appendInput("app.log", "{\"n\":1}\n");
  for (int i = 0; i < 300 && written.load() < 1; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  worker.stop();

  EXPECT_EQ(backupOf("app.log"), "{\"n\":1}\n");
}

TEST_F(BackupWorkerTest, RestartAfterStop) {
  BackupWorker worker(runner_, std::chrono::seconds(60), logger_);
  worker.start();
  worker.stop();
  EXPECT_FALSE(worker.isRunning());

  worker.start();
  EXPECT_TRUE(worker.isRunning());
  worker.stop();
  EXPECT_FALSE(worker.isRunning());
}

TEST_F(BackupWorkerTest, LogsStartAndStop) {
  std::vector<std::string> messages;
  std::mutex messages_mutex;
  logger_->addCallback([&](Severity, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(messages_mutex);
    if (component == "worker") messages.push_back(message);
  });

  BackupWorker worker(runner_, std::chrono::seconds(60), logger_);
  worker.start();
  worker.stop();

  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0], "Log backup worker started");
  EXPECT_EQ(messages[1], "Log backup worker stopping");
}
