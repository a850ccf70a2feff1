// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOADER_INTERFACES_HPP
#define FERRY_UPLOADER_INTERFACES_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace ferry {
namespace uploader {

struct TransferRecord;

/**
 * Interface for filesystem metadata queries
 * Allows mocking stat failures for testing
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  /**
   * Get the size of a regular file in bytes
   * @return Size, or std::nullopt if the file cannot be stat'd
   */
  virtual std::optional<uint64_t> file_size(const std::string& path) const = 0;
};

/**
 * Result of a put operation
 */
struct PutResult {
  bool success;
  std::string error_message;  // Error message if failed
  std::string error_code;     // Store-specific error code for diagnostics

  static PutResult Success() {
    return {true, "", ""};
  }

  static PutResult Failure(const std::string& message, const std::string& code = "") {
    return {false, message, code};
  }
};

/**
 * Classification of a head lookup
 */
enum class HeadStatus {
  FOUND,       // Object exists, size is valid
  NOT_FOUND,   // Store answered, object is absent
  UNREACHABLE  // Store could not be asked
};

/**
 * Result of a head operation
 */
struct HeadResult {
  HeadStatus status;
  uint64_t size;
  std::string error_message;

  static HeadResult Found(uint64_t size) {
    return {HeadStatus::FOUND, size, ""};
  }

  static HeadResult NotFound(const std::string& message = "") {
    return {HeadStatus::NOT_FOUND, 0, message};
  }

  static HeadResult Unreachable(const std::string& message) {
    return {HeadStatus::UNREACHABLE, 0, message};
  }
};

/**
 * Remote object store bound to one bucket.
 *
 * Implementations report failures through the result values. Calls are
 * blocking; any timeout policy belongs to the implementation.
 */
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  /**
   * Upload a local file under the given key in a single attempt
   */
  virtual PutResult put(const std::string& local_path, const std::string& key) = 0;

  /**
   * Look up the stored size of an object
   */
  virtual HeadResult head(const std::string& key) = 0;
};

/**
 * Destination for finalized transfer records
 */
class IAuditSink {
public:
  virtual ~IAuditSink() = default;

  /**
   * Durably append one record.
   * @throws AuditWriteError if the record could not be persisted
   */
  virtual void append(const TransferRecord& record) = 0;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOADER_INTERFACES_HPP
