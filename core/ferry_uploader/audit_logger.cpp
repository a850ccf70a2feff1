// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "audit_logger.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>

#include "audit_log_format.hpp"
#include "transfer_record.hpp"
#include "uploader_errors.hpp"

#define FERRY_LOG_COMPONENT "audit_logger"
#include <ferry_log_macros.hpp>

namespace fs = std::filesystem;

namespace ferry {
namespace uploader {

namespace {

/**
 * Owns a file descriptor; closing also releases any flock held on it.
 */
class ScopedFd {
public:
  explicit ScopedFd(int fd)
      : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;

  int get() const {
    return fd_;
  }

  /**
   * Close explicitly so a failing close() is reported instead of ignored
   */
  int release_and_close() {
    int rc = ::close(fd_);
    fd_ = -1;
    return rc;
  }

private:
  int fd_;
};

std::string errnoText(int err) {
  return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
}

void writeAll(int fd, const std::string& payload, const std::string& path) {
  size_t written = 0;
  while (written < payload.size()) {
    ssize_t chunk = ::write(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      int err = errno;
      if (err == EINTR) {
        continue;
      }
      throw AuditWriteError(path, "write failed: " + errnoText(err));
    }
    written += static_cast<size_t>(chunk);
  }
}

void lockExclusive(int fd, const std::string& path) {
  while (::flock(fd, LOCK_EX) != 0) {
    int err = errno;
    if (err != EINTR) {
      throw AuditWriteError(path, "flock failed: " + errnoText(err));
    }
  }
}

/**
 * True when the last byte of a non-empty file is not a newline,
 * i.e. a previous writer was interrupted mid-row.
 */
bool endsWithTornRow(int fd, off_t size, const std::string& path) {
  if (size <= 0) {
    return false;
  }
  char last = '\n';
  ssize_t n = ::pread(fd, &last, 1, size - 1);
  if (n < 0) {
    throw AuditWriteError(path, "pread failed: " + errnoText(errno));
  }
  return n == 1 && last != '\n';
}

}  // namespace

std::string resolveAuditLogPath(
  const std::string& directory, const std::string& file_name,
  std::chrono::system_clock::time_point now
) {
  std::string name = file_name;
  if (name.find('%') != std::string::npos) {
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time, &tm);

    char buf[512];
    size_t len = std::strftime(buf, sizeof(buf), file_name.c_str(), &tm);
    if (len > 0) {
      name.assign(buf, len);
    }
  }

  if (directory.empty()) {
    return name;
  }
  return (fs::path(directory) / name).string();
}

AuditLogger::AuditLogger(const std::string& log_path, bool sync_each_record)
    : log_path_(log_path)
    , sync_each_record_(sync_each_record) {
  if (log_path_.empty()) {
    throw AuditWriteError(log_path_, "empty audit log path");
  }

  fs::path parent = fs::path(log_path_).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      throw AuditWriteError(log_path_, "cannot create directory " + parent.string() + ": " +
                                         ec.message());
    }
  }
}

void AuditLogger::append(const TransferRecord& record) {
  ScopedFd fd(::open(log_path_.c_str(), O_RDWR | O_APPEND | O_CREAT | O_CLOEXEC, 0644));
  if (fd.get() < 0) {
    int err = errno;
    FERRY_LOG_ERROR("Cannot open audit log" << ::ferry::logging::kv("path", log_path_)
                                            << ::ferry::logging::kv("error", errnoText(err)));
    throw AuditWriteError(log_path_, "open failed: " + errnoText(err));
  }

  lockExclusive(fd.get(), log_path_);

  struct stat st {};
  if (::fstat(fd.get(), &st) != 0) {
    throw AuditWriteError(log_path_, "fstat failed: " + errnoText(errno));
  }

  std::string payload;
  if (st.st_size == 0) {
    // Header is written under the lock, so only one writer ever adds it
    payload = audit_format::headerLine();
    FERRY_LOG_INFO("Created audit log" << ::ferry::logging::kv("path", log_path_));
  } else if (endsWithTornRow(fd.get(), st.st_size, log_path_)) {
    FERRY_LOG_WARN(
      "Audit log ends with an incomplete row, terminating it"
      << ::ferry::logging::kv("path", log_path_)
    );
    payload = "\n";
  }
  payload += audit_format::formatRecord(record);

  writeAll(fd.get(), payload, log_path_);

  if (sync_each_record_ && ::fsync(fd.get()) != 0) {
    throw AuditWriteError(log_path_, "fsync failed: " + errnoText(errno));
  }

  if (fd.release_and_close() != 0) {
    throw AuditWriteError(log_path_, "close failed: " + errnoText(errno));
  }

  ++appended_count_;
  FERRY_LOG_DEBUG("Appended audit row" << ::ferry::logging::kv("path", log_path_)
                                       << ::ferry::logging::kv("file", record.file_name));
}

}  // namespace uploader
}  // namespace ferry
