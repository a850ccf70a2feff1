// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_TRANSFER_RECORD_HPP
#define FERRY_TRANSFER_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ferry {
namespace uploader {

/**
 * Wall-clock instant truncated to milliseconds.
 * The audit log stores milliseconds, so records read back compare equal.
 */
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

/**
 * Current UTC time truncated to milliseconds
 */
Timestamp nowTimestamp();

/**
 * Format as ISO 8601 UTC with milliseconds: 2024-05-01T12:30:00.250Z
 */
std::string formatTimestamp(Timestamp ts);

/**
 * Parse the format produced by formatTimestamp()
 */
std::optional<Timestamp> parseTimestamp(const std::string& text);

/**
 * Outcome of the transfer attempt itself
 */
enum class TransferStatus {
  SUCCESS,  // Store accepted the object
  FAILED    // Store rejected it, or it was never reached
};

/**
 * Outcome of the post-transfer size comparison
 */
enum class ValidationStatus {
  VERIFIED,       // Local size == remote size
  MISMATCH,       // Sizes differ
  UNREACHABLE,    // Remote object not found or store unavailable
  NOT_APPLICABLE  // Transfer failed, nothing to check
};

std::string transferStatusToString(TransferStatus status);
std::optional<TransferStatus> transferStatusFromString(const std::string& str);

std::string validationStatusToString(ValidationStatus status);
std::optional<ValidationStatus> validationStatusFromString(const std::string& str);

/**
 * One file-upload attempt, exactly one per discovered file.
 *
 * Built by the orchestrator as the pipeline advances, handed to the audit
 * log once, and never modified afterwards.
 */
struct TransferRecord {
  std::string file_name;    // Base name
  std::string source_path;  // Absolute local path
  std::string destination;  // s3://bucket/key
  TransferStatus status;
  Timestamp start_time;
  Timestamp end_time;
  std::optional<uint64_t> file_size_bytes;  // Empty if the file could not be stat'd
  ValidationStatus validation_status;

  TransferRecord()
      : status(TransferStatus::FAILED)
      , validation_status(ValidationStatus::NOT_APPLICABLE) {}

  /**
   * end_time - start_time in seconds, never negative
   */
  double durationSeconds() const;

  bool operator==(const TransferRecord& other) const;
  bool operator!=(const TransferRecord& other) const {
    return !(*this == other);
  }
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_TRANSFER_RECORD_HPP
