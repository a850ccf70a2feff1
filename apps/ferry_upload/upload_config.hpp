// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOAD_CONFIG_HPP
#define FERRY_UPLOAD_CONFIG_HPP

#include <cstddef>
#include <string>

#include "s3_config.hpp"

namespace ferry {
namespace app {

/**
 * Directory whose files are uploaded
 */
struct SourceConfig {
  std::string directory = "~/Documents/s3_upload";
  bool include_hidden = false;
};

/**
 * Bucket and key prefix the files land under
 */
struct DestinationConfig {
  std::string bucket = "my_bucket";
  std::string prefix = "s3_receive";
};

/**
 * Audit log location
 */
struct AuditConfig {
  std::string directory;                       // Empty: <source>/logs
  std::string file_name = "transfer_log.csv";  // strftime tokens expanded in UTC
  bool sync_each_record = true;
};

/**
 * Logging section as written in YAML (levels as strings)
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";  // debug, info, warn, error, fatal

  // File sink
  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/ferry";
  std::string file_pattern = "ferry_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";  // json or text
  size_t rotation_size_mb = 100;
  size_t max_files = 10;
  bool rotate_at_midnight = true;
};

/**
 * Complete run configuration
 */
struct UploadConfig {
  SourceConfig source;
  DestinationConfig destination;
  uploader::S3Config s3;  // bucket is taken from destination.bucket
  AuditConfig audit;
  LoggingConfig logging;
};

}  // namespace app
}  // namespace ferry

#endif  // FERRY_UPLOAD_CONFIG_HPP
