// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOAD_ORCHESTRATOR_HPP
#define FERRY_UPLOAD_ORCHESTRATOR_HPP

#include <cstdint>
#include <functional>
#include <string>

#include "directory_walker.hpp"
#include "transfer_record.hpp"
#include "upload_validator.hpp"
#include "uploader_interfaces.hpp"

namespace ferry {
namespace uploader {

/**
 * Aggregate counts for one pass over the source directory
 */
struct RunSummary {
  uint64_t total = 0;
  uint64_t succeeded = 0;
  uint64_t failed = 0;
  uint64_t verified = 0;
  uint64_t mismatched = 0;
  uint64_t unreachable = 0;
  uint64_t bytes_transferred = 0;  // Local sizes of successfully transferred files

  void add(const TransferRecord& record);

  /**
   * True when every file transferred and verified
   */
  bool clean() const {
    return failed == 0 && mismatched == 0 && unreachable == 0;
  }
};

/**
 * Invoked after each record has been written to the audit log
 */
using RecordCallback = std::function<void(const TransferRecord& record)>;

/**
 * Join a key prefix and a relative key with exactly one '/'.
 * Trailing separators on the prefix and leading separators on the relative
 * key are collapsed; an empty prefix yields the relative key alone.
 */
std::string joinDestinationKey(const std::string& prefix, const std::string& relative_key);

/**
 * Object URI recorded in the audit log: s3://bucket/key
 */
std::string destinationUri(const std::string& bucket, const std::string& key);

/**
 * Drives discover -> transfer -> validate -> record for every file
 *
 * Strictly sequential: one file's pipeline finishes before the next begins
 * and records reach the audit log in walk order. Per-file failures become
 * record fields and never stop the run. SourceUnreadableError and
 * AuditWriteError propagate to the caller.
 *
 * Usage:
 *   FileSystemImpl filesystem;
 *   AuditLogger audit("/data/logs/transfer_log.csv");
 *   UploadOrchestrator orchestrator(store, audit, filesystem);
 *   RunSummary summary = orchestrator.run("/data/outbox", "my_bucket", "backups/2024");
 */
class UploadOrchestrator {
public:
  UploadOrchestrator(
    IObjectStore& store, IAuditSink& audit_sink, const IFileSystem& filesystem,
    WalkOptions walk_options = {}
  );

  // Non-copyable
  UploadOrchestrator(const UploadOrchestrator&) = delete;
  UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

  /**
   * Upload every regular file under source_root
   *
   * @param source_root Directory to walk
   * @param bucket Bucket the store is bound to (recorded in the destination)
   * @param prefix Key prefix prepended to each relative path
   * @return Counts for the run
   * @throws SourceUnreadableError if source_root cannot be walked
   * @throws AuditWriteError if a record cannot be persisted
   */
  RunSummary run(
    const std::string& source_root, const std::string& bucket, const std::string& prefix
  );

  /**
   * Set callback for per-file outcomes
   */
  void setCallback(RecordCallback callback);

private:
  TransferRecord processFile(const WalkEntry& entry, const std::string& bucket,
                             const std::string& prefix);

  IObjectStore& store_;
  IAuditSink& audit_sink_;
  const IFileSystem& filesystem_;
  WalkOptions walk_options_;
  UploadValidator validator_;
  RecordCallback callback_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOAD_ORCHESTRATOR_HPP
