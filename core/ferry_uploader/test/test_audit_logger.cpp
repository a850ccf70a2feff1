// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for AuditLogger
 *
 * Covers header creation, append-only behavior across instances, torn-row
 * recovery, concurrent writers and fatal write errors.
 */

#include <gtest/gtest.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <sstream>
#include <string>

#include "audit_log_format.hpp"
#include "audit_logger.hpp"
#include "test_helpers.hpp"
#include "uploader_errors.hpp"

using namespace ferry::uploader;
using namespace ferry::uploader::test;

class AuditLoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = createTempDir("ferry_audit_logger_");
    log_path_ = test_dir_ + "/logs/transfer_log.csv";
  }

  void TearDown() override {
    cleanupTempDir(test_dir_);
  }

  TransferRecord makeRecord(const std::string& name, int64_t start_ms = 1714566600000) {
    TransferRecord record;
    record.file_name = name;
    record.source_path = test_dir_ + "/" + name;
    record.destination = "s3://bucket/" + name;
    record.status = TransferStatus::SUCCESS;
    record.start_time = Timestamp(std::chrono::milliseconds(start_ms));
    record.end_time = Timestamp(std::chrono::milliseconds(start_ms + 100));
    record.file_size_bytes = 42;
    record.validation_status = ValidationStatus::VERIFIED;
    return record;
  }

  std::string test_dir_;
  std::string log_path_;
};

TEST_F(AuditLoggerTest, CreatesParentDirectory) {
  AuditLogger logger(log_path_);
  EXPECT_TRUE(fs::is_directory(test_dir_ + "/logs"));
  // No file until the first record
  EXPECT_FALSE(fs::exists(log_path_));
}

TEST_F(AuditLoggerTest, FirstAppendWritesHeader) {
  AuditLogger logger(log_path_);
  TransferRecord record = makeRecord("a.txt");
  logger.append(record);

  EXPECT_EQ(readFile(log_path_), audit_format::headerLine() + audit_format::formatRecord(record));
  EXPECT_EQ(logger.appendedCount(), 1u);
}

TEST_F(AuditLoggerTest, SecondRunAppendsWithoutRewriting) {
  {
    AuditLogger first(log_path_);
    first.append(makeRecord("a.txt"));
    first.append(makeRecord("b.txt"));
  }
  std::string before = readFile(log_path_);

  AuditLogger second(log_path_);
  second.append(makeRecord("c.txt", 1714566700000));
  std::string after = readFile(log_path_);

  // Earlier bytes are untouched and the header appears once
  ASSERT_GT(after.size(), before.size());
  EXPECT_EQ(after.substr(0, before.size()), before);
  EXPECT_EQ(after.find("fileName,"), 0u);
  EXPECT_EQ(after.find("fileName,", 1), std::string::npos);

  auto records = readAuditLog(log_path_);
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].file_name, "a.txt");
  EXPECT_EQ(records[1].file_name, "b.txt");
  EXPECT_EQ(records[2].file_name, "c.txt");
}

TEST_F(AuditLoggerTest, RecordsReadBackExactly) {
  AuditLogger logger(log_path_, false);
  TransferRecord record = makeRecord("odd, \"name\".txt");
  record.file_size_bytes.reset();
  record.status = TransferStatus::FAILED;
  record.validation_status = ValidationStatus::NOT_APPLICABLE;
  logger.append(record);

  auto records = readAuditLog(log_path_);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0], record);
}

TEST_F(AuditLoggerTest, TornRowIsTerminatedBeforeNextAppend) {
  AuditLogger logger(log_path_);
  logger.append(makeRecord("a.txt"));

  // Simulate a writer that died mid-row
  {
    std::ofstream out(log_path_, std::ios::binary | std::ios::app);
    out << "b.txt,/data/b.txt,s3://bu";
  }

  logger.append(makeRecord("c.txt"));

  std::string content = readFile(log_path_);
  EXPECT_NE(content.find("s3://bu\nc.txt,"), std::string::npos);

  auto records = readAuditLog(log_path_, false);
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].file_name, "a.txt");
  EXPECT_EQ(records[1].file_name, "c.txt");
}

TEST_F(AuditLoggerTest, ExistingHeaderOnlyFileIsReused) {
  fs::create_directories(test_dir_ + "/logs");
  {
    std::ofstream out(log_path_, std::ios::binary);
    out << audit_format::headerLine();
  }

  AuditLogger logger(log_path_);
  logger.append(makeRecord("a.txt"));

  EXPECT_EQ(readFile(log_path_),
            audit_format::headerLine() + audit_format::formatRecord(makeRecord("a.txt")));
}

TEST_F(AuditLoggerTest, RepeatedAppendsFromOneLoggerKeepOrder) {
  AuditLogger logger(log_path_);
  for (int i = 0; i < 5; ++i) {
    logger.append(makeRecord("file_" + std::to_string(i) + ".bin", 1714566600000 + i));
  }

  auto records = readAuditLog(log_path_, true);
  ASSERT_EQ(records.size(), 5u);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(records[i].file_name, "file_" + std::to_string(i) + ".bin");
  }
  EXPECT_EQ(logger.appendedCount(), 5u);
}

TEST_F(AuditLoggerTest, ConcurrentProcessesDoNotInterleaveRows) {
  constexpr int kRecordsPerWriter = 40;
  // Parent directory exists before either writer starts
  { AuditLogger prepare(log_path_); }

  auto spawnWriter = [this](const std::string& tag) {
    pid_t pid = ::fork();
    if (pid == 0) {
      int status = 0;
      try {
        AuditLogger logger(log_path_);
        for (int i = 0; i < kRecordsPerWriter; ++i) {
          logger.append(makeRecord(tag + "_" + std::to_string(i) + ".bin"));
        }
      } catch (const std::exception&) {
        status = 1;
      }
      ::_exit(status);
    }
    return pid;
  };

  pid_t first = spawnWriter("alpha");
  pid_t second = spawnWriter("beta");
  ASSERT_GT(first, 0);
  ASSERT_GT(second, 0);

  for (pid_t pid : {first, second}) {
    int status = 0;
    ASSERT_EQ(::waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
  }

  auto records = readAuditLog(log_path_, true);
  ASSERT_EQ(records.size(), static_cast<size_t>(2 * kRecordsPerWriter));

  // Each writer's rows stay in its own order
  int next_alpha = 0;
  int next_beta = 0;
  for (const auto& record : records) {
    if (record.file_name.rfind("alpha_", 0) == 0) {
      EXPECT_EQ(record.file_name, "alpha_" + std::to_string(next_alpha++) + ".bin");
    } else {
      EXPECT_EQ(record.file_name, "beta_" + std::to_string(next_beta++) + ".bin");
    }
  }
  EXPECT_EQ(next_alpha, kRecordsPerWriter);
  EXPECT_EQ(next_beta, kRecordsPerWriter);

  std::string header = audit_format::headerLine();
  header.pop_back();
  std::istringstream lines(readFile(log_path_));
  int header_count = 0;
  for (std::string line; std::getline(lines, line);) {
    if (line == header) {
      ++header_count;
    }
  }
  EXPECT_EQ(header_count, 1);
}

TEST_F(AuditLoggerTest, EmptyPathThrows) {
  EXPECT_THROW(AuditLogger(""), AuditWriteError);
}

TEST_F(AuditLoggerTest, UncreatableDirectoryThrows) {
  // A regular file where the log directory should be
  std::string blocker = test_dir_ + "/blocker";
  generateTestFile(blocker, 1);
  EXPECT_THROW(AuditLogger(blocker + "/logs/transfer_log.csv"), AuditWriteError);
}

TEST_F(AuditLoggerTest, UnwritableLogThrowsWithPath) {
  // A directory at the log path makes open() fail even for root
  fs::create_directories(log_path_);
  AuditLogger logger(log_path_);

  try {
    logger.append(makeRecord("a.txt"));
    FAIL() << "Expected AuditWriteError";
  } catch (const AuditWriteError& e) {
    EXPECT_EQ(e.logPath(), log_path_);
  }
  EXPECT_EQ(logger.appendedCount(), 0u);
}

// =============================================================================
// Log Path Resolution Tests
// =============================================================================

TEST(ResolveAuditLogPathTest, FixedNameJoinsDirectory) {
  auto now = std::chrono::system_clock::now();
  EXPECT_EQ(resolveAuditLogPath("/data/logs", "transfer_log.csv", now),
            "/data/logs/transfer_log.csv");
  EXPECT_EQ(resolveAuditLogPath("", "transfer_log.csv", now), "transfer_log.csv");
}

TEST(ResolveAuditLogPathTest, ExpandsStrftimeInUtc) {
  // 2024-05-01T12:30:00Z
  auto now = std::chrono::system_clock::from_time_t(1714566600);
  EXPECT_EQ(resolveAuditLogPath("/data/logs", "log_%Y-%m-%dT%H-%M-%S.csv", now),
            "/data/logs/log_2024-05-01T12-30-00.csv");
}
