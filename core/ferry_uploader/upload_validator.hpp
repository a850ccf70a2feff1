// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOAD_VALIDATOR_HPP
#define FERRY_UPLOAD_VALIDATOR_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "transfer_record.hpp"
#include "uploader_interfaces.hpp"

namespace ferry {
namespace uploader {

/**
 * Size-only post-transfer check of a local file against its remote copy
 */
class UploadValidator {
public:
  UploadValidator(IObjectStore& store, const IFileSystem& filesystem)
      : store_(store)
      , filesystem_(filesystem) {}

  /**
   * Compare local and remote sizes
   *
   * - head() fails (absent object or unreachable store) -> UNREACHABLE
   * - sizes equal -> VERIFIED
   * - otherwise (including an unreadable local file) -> MISMATCH
   */
  ValidationStatus validate(const std::string& local_path, const std::string& key) const;

  /**
   * Same check against a local size the caller already took, so the size
   * that gets logged is the size that gets verified. Empty -> MISMATCH.
   */
  ValidationStatus validate(std::optional<uint64_t> local_size, const std::string& key) const;

  /**
   * Classification used by validate(), exposed for testing
   */
  static ValidationStatus classify(std::optional<uint64_t> local_size, const HeadResult& remote);

private:
  IObjectStore& store_;
  const IFileSystem& filesystem_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOAD_VALIDATOR_HPP
