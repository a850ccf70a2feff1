// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_S3_CONFIG_HPP
#define FERRY_S3_CONFIG_HPP

#include <string>

namespace ferry {
namespace uploader {

/**
 * S3 connection options
 */
struct S3Config {
  std::string endpoint_url;  // e.g., "https://play.min.io"; empty for AWS S3
  std::string bucket;        // Bucket name
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // Credentials (if not using environment variables)
  // If empty, read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY, then the
  // SDK default provider chain
  std::string access_key;
  std::string secret_key;

  // Timeouts (in milliseconds)
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;  // 5 minutes for large files

  // Each transfer is a single attempt; keep SDK-internal retries off unless
  // transient errors should be absorbed below the audit log
  int max_sdk_retries = 0;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_S3_CONFIG_HPP
