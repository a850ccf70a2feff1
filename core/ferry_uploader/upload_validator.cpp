// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_validator.hpp"

#include <exception>

#define FERRY_LOG_COMPONENT "upload_validator"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace uploader {

using ::ferry::logging::kv;

ValidationStatus UploadValidator::classify(
  std::optional<uint64_t> local_size, const HeadResult& remote
) {
  if (remote.status != HeadStatus::FOUND) {
    return ValidationStatus::UNREACHABLE;
  }
  if (local_size && *local_size == remote.size) {
    return ValidationStatus::VERIFIED;
  }
  return ValidationStatus::MISMATCH;
}

ValidationStatus UploadValidator::validate(
  const std::string& local_path, const std::string& key
) const {
  return validate(filesystem_.file_size(local_path), key);
}

ValidationStatus UploadValidator::validate(
  std::optional<uint64_t> local_size, const std::string& key
) const {
  HeadResult remote = HeadResult::Unreachable("head not attempted");
  try {
    remote = store_.head(key);
  } catch (const std::exception& e) {
    remote = HeadResult::Unreachable(e.what());
  }

  ValidationStatus status = classify(local_size, remote);

  switch (status) {
    case ValidationStatus::UNREACHABLE:
      FERRY_LOG_WARN(
        "Remote object could not be checked"
        << kv("key", key)
        << kv("reason", remote.status == HeadStatus::NOT_FOUND ? std::string("not found")
                                                               : remote.error_message)
      );
      break;
    case ValidationStatus::MISMATCH:
      if (local_size) {
        FERRY_LOG_WARN("Size mismatch after upload" << kv("key", key) << kv("local", *local_size)
                                                    << kv("remote", remote.size));
      } else {
        FERRY_LOG_WARN("Local file size unknown, cannot verify" << kv("key", key)
                                                                 << kv("remote", remote.size));
      }
      break;
    default:
      FERRY_LOG_DEBUG("Upload verified" << kv("key", key) << kv("size", remote.size));
      break;
  }

  return status;
}

}  // namespace uploader
}  // namespace ferry
