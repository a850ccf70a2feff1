// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_orchestrator.hpp"

#include <exception>
#include <filesystem>
#include <utility>

#define FERRY_LOG_COMPONENT "upload_orchestrator"
#include <ferry_log_macros.hpp>

namespace fs = std::filesystem;

namespace ferry {
namespace uploader {

using ::ferry::logging::kv;

void RunSummary::add(const TransferRecord& record) {
  ++total;
  if (record.status == TransferStatus::SUCCESS) {
    ++succeeded;
    if (record.file_size_bytes) {
      bytes_transferred += *record.file_size_bytes;
    }
  } else {
    ++failed;
  }

  switch (record.validation_status) {
    case ValidationStatus::VERIFIED:
      ++verified;
      break;
    case ValidationStatus::MISMATCH:
      ++mismatched;
      break;
    case ValidationStatus::UNREACHABLE:
      ++unreachable;
      break;
    case ValidationStatus::NOT_APPLICABLE:
      break;
  }
}

std::string joinDestinationKey(const std::string& prefix, const std::string& relative_key) {
  size_t prefix_end = prefix.find_last_not_of('/');
  std::string head = prefix_end == std::string::npos ? "" : prefix.substr(0, prefix_end + 1);

  size_t key_begin = relative_key.find_first_not_of('/');
  std::string tail = key_begin == std::string::npos ? "" : relative_key.substr(key_begin);

  if (head.empty()) {
    return tail;
  }
  if (tail.empty()) {
    return head;
  }
  return head + "/" + tail;
}

std::string destinationUri(const std::string& bucket, const std::string& key) {
  return "s3://" + bucket + "/" + key;
}

UploadOrchestrator::UploadOrchestrator(
  IObjectStore& store, IAuditSink& audit_sink, const IFileSystem& filesystem,
  WalkOptions walk_options
)
    : store_(store)
    , audit_sink_(audit_sink)
    , filesystem_(filesystem)
    , walk_options_(std::move(walk_options))
    , validator_(store, filesystem) {}

void UploadOrchestrator::setCallback(RecordCallback callback) {
  callback_ = std::move(callback);
}

RunSummary UploadOrchestrator::run(
  const std::string& source_root, const std::string& bucket, const std::string& prefix
) {
  DirectoryWalker walker(source_root, walk_options_);
  FERRY_LOG_INFO("Starting upload run" << kv("source", walker.root()) << kv("bucket", bucket)
                                       << kv("prefix", prefix));

  RunSummary summary;
  while (auto entry = walker.next()) {
    TransferRecord record = processFile(*entry, bucket, prefix);

    // Fatal on failure: the run must not continue without an audit trail
    audit_sink_.append(record);
    summary.add(record);

    if (callback_) {
      callback_(record);
    }
  }

  if (walker.skippedDirectories() > 0) {
    FERRY_LOG_WARN("Some directories could not be listed"
                   << kv("skipped", walker.skippedDirectories()));
  }

  FERRY_LOG_INFO("Upload run finished"
                 << kv("total", summary.total) << kv("succeeded", summary.succeeded)
                 << kv("failed", summary.failed) << kv("verified", summary.verified)
                 << kv("mismatched", summary.mismatched)
                 << kv("unreachable", summary.unreachable));
  return summary;
}

TransferRecord UploadOrchestrator::processFile(
  const WalkEntry& entry, const std::string& bucket, const std::string& prefix
) {
  FERRY_LOG_SCOPED_FILE(entry.relative_key);

  const std::string key = joinDestinationKey(prefix, entry.relative_key);

  TransferRecord record;
  record.file_name = fs::path(entry.local_path).filename().string();
  record.source_path = entry.local_path;
  record.destination = destinationUri(bucket, key);
  record.file_size_bytes = filesystem_.file_size(entry.local_path);
  record.start_time = nowTimestamp();

  PutResult result = PutResult::Failure("put not attempted");
  try {
    result = store_.put(entry.local_path, key);
  } catch (const std::exception& e) {
    result = PutResult::Failure(e.what(), "StoreException");
  }

  record.end_time = nowTimestamp();
  if (record.end_time < record.start_time) {
    // Wall clock stepped backwards during the transfer
    record.end_time = record.start_time;
  }

  if (!result.success) {
    record.status = TransferStatus::FAILED;
    record.validation_status = ValidationStatus::NOT_APPLICABLE;
    FERRY_LOG_ERROR("Transfer failed" << kv("key", key) << kv("error", result.error_message)
                                      << kv("code", result.error_code));
    return record;
  }

  record.status = TransferStatus::SUCCESS;
  record.validation_status = validator_.validate(record.file_size_bytes, key);
  FERRY_LOG_INFO("Transferred" << kv("key", key)
                               << kv("validation",
                                     validationStatusToString(record.validation_status)));
  return record;
}

}  // namespace uploader
}  // namespace ferry
