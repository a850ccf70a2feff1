// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_S3_OBJECT_STORE_HPP
#define FERRY_S3_OBJECT_STORE_HPP

#include <memory>
#include <string>

#include "s3_config.hpp"
#include "uploader_interfaces.hpp"

namespace ferry {
namespace uploader {

/**
 * IObjectStore over the AWS SDK for C++
 *
 * Works against AWS S3 and S3-compatible storage (MinIO, etc.). Every call
 * is one blocking request: put() is a single PutObject with the file as the
 * body, head() is a HeadObject. SDK errors are mapped into PutResult and
 * HeadResult; nothing from the SDK escapes as an exception.
 */
class S3ObjectStore : public IObjectStore {
public:
  /**
   * Create a store bound to config.bucket
   */
  explicit S3ObjectStore(const S3Config& config);
  ~S3ObjectStore() override;

  // Non-copyable, non-movable
  S3ObjectStore(const S3ObjectStore&) = delete;
  S3ObjectStore& operator=(const S3ObjectStore&) = delete;
  S3ObjectStore(S3ObjectStore&&) = delete;
  S3ObjectStore& operator=(S3ObjectStore&&) = delete;

  PutResult put(const std::string& local_path, const std::string& key) override;

  HeadResult head(const std::string& key) override;

  const std::string& bucket() const;

  const std::string& endpoint() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_S3_OBJECT_STORE_HPP
