// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOADER_ERRORS_HPP
#define FERRY_UPLOADER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ferry {
namespace uploader {

/**
 * Source root is missing, not a directory, or cannot be listed.
 * Raised before any file is known, so the whole run is abandoned.
 */
class SourceUnreadableError : public std::runtime_error {
public:
  SourceUnreadableError(const std::string& root, const std::string& reason)
      : std::runtime_error("Source directory unreadable: " + root + " (" + reason + ")")
      , root_(root) {}

  const std::string& root() const {
    return root_;
  }

private:
  std::string root_;
};

/**
 * The audit log could not be created, locked, written or synced.
 * Rows appended before the failure are left untouched.
 */
class AuditWriteError : public std::runtime_error {
public:
  AuditWriteError(const std::string& log_path, const std::string& reason)
      : std::runtime_error("Audit log write failed: " + log_path + " (" + reason + ")")
      , log_path_(log_path) {}

  const std::string& logPath() const {
    return log_path_;
  }

private:
  std::string log_path_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOADER_ERRORS_HPP
