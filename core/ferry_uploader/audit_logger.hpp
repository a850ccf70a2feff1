// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_AUDIT_LOGGER_HPP
#define FERRY_AUDIT_LOGGER_HPP

#include <chrono>
#include <string>

#include "uploader_interfaces.hpp"

namespace ferry {
namespace uploader {

/**
 * Expand strftime tokens (UTC) in an audit log file name and join it to
 * its directory. A name without tokens is returned joined as-is.
 *
 * @param directory Directory holding the log (may be empty)
 * @param file_name File name, e.g. "transfer_log.csv" or "log_%Y-%m-%dT%H-%M-%S.csv"
 * @param now Instant used for the expansion
 */
std::string resolveAuditLogPath(
  const std::string& directory, const std::string& file_name,
  std::chrono::system_clock::time_point now
);

/**
 * Append-only CSV audit log of transfer attempts
 *
 * Every append() is a self-contained scoped operation:
 *   open(O_APPEND|O_CREAT) -> flock(LOCK_EX) -> [header if empty] -> write row
 *   -> fsync -> close
 *
 * The file is never truncated, rewritten or reordered. The exclusive lock
 * keeps rows from concurrent invocations against the same path from
 * interleaving; an interruption can only tear the row being written, and the
 * next append terminates a torn row before writing its own.
 *
 * Not thread-safe; one instance per run.
 */
class AuditLogger : public IAuditSink {
public:
  /**
   * @param log_path Path of the audit log
   * @param sync_each_record fsync after every row
   * @throws AuditWriteError if the parent directory cannot be created
   */
  explicit AuditLogger(const std::string& log_path, bool sync_each_record = true);

  // Non-copyable
  AuditLogger(const AuditLogger&) = delete;
  AuditLogger& operator=(const AuditLogger&) = delete;

  /**
   * Append one record, creating the file with a header row if needed
   * @throws AuditWriteError on any open/lock/write/sync failure
   */
  void append(const TransferRecord& record) override;

  const std::string& path() const {
    return log_path_;
  }

  /**
   * Number of rows appended by this instance
   */
  size_t appendedCount() const {
    return appended_count_;
  }

private:
  std::string log_path_;
  bool sync_each_record_;
  size_t appended_count_ = 0;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_AUDIT_LOGGER_HPP
