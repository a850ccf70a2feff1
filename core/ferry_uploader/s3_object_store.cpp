// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_object_store.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>

#include <cstdlib>
#include <fstream>
#include <mutex>

#include "s3_object_store_test_helpers.hpp"

#define FERRY_LOG_COMPONENT "s3_object_store"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace uploader {

using ::ferry::logging::kv;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// The AWS SDK requires InitAPI/ShutdownAPI to be paired once per process.
// A reference-counted singleton owns that lifecycle.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      // SDK logging stays off; failures are reported through ferry logging
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

// =============================================================================
// Helpers
// =============================================================================

HeadStatus classifyHeadError(int http_status, const std::string& exception_name) {
  if (http_status == 404 || exception_name == "NoSuchKey" ||
      exception_name == "ResourceNotFound" || exception_name == "NotFound") {
    return HeadStatus::NOT_FOUND;
  }
  return HeadStatus::UNREACHABLE;
}

std::string normalizeEndpoint(const std::string& endpoint_url) {
  std::string endpoint = endpoint_url;
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.pop_back();
  }
  return endpoint;
}

namespace {

bool endsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string contentTypeForKey(const std::string& key) {
  if (endsWith(key, ".json")) {
    return "application/json";
  }
  if (endsWith(key, ".csv")) {
    return "text/csv";
  }
  if (endsWith(key, ".txt") || endsWith(key, ".log")) {
    return "text/plain";
  }
  return "application/octet-stream";
}

// =============================================================================
// S3ObjectStore Implementation
// =============================================================================

class S3ObjectStore::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() { AwsSdkManager::instance().addRef(); }

  ~Impl() {
    // The client must be destroyed before release(), which may call
    // Aws::ShutdownAPI() when the reference count reaches zero
    client.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;
    client_config.region = config.region;

    // The endpoint should NOT include the bucket name
    if (!config.endpoint_url.empty()) {
      client_config.endpointOverride = normalizeEndpoint(config.endpoint_url);
    }

    client_config.verifySSL = config.verify_ssl;
    client_config.scheme = config.use_ssl ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;

    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(
      "FerryS3RetryStrategy", config.max_sdk_retries
    );

    // Path style (false) for custom endpoints such as MinIO,
    // virtual-hosted style (true) for AWS S3
    bool use_virtual_addressing = config.endpoint_url.empty();

    if (!config.access_key.empty() && !config.secret_key.empty()) {
      Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);
      client = std::make_shared<Aws::S3::S3Client>(
        credentials, client_config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        use_virtual_addressing
      );
    } else {
      // Fall back to the SDK default provider chain (profile, instance role)
      client = std::make_shared<Aws::S3::S3Client>(
        client_config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        use_virtual_addressing
      );
    }
  }
};

S3ObjectStore::S3ObjectStore(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  // Load credentials from environment if not provided
  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
  FERRY_LOG_DEBUG("S3 object store ready" << kv("bucket", impl_->config.bucket)
                                          << kv("endpoint", impl_->config.endpoint_url));
}

S3ObjectStore::~S3ObjectStore() = default;

PutResult S3ObjectStore::put(const std::string& local_path, const std::string& key) {
  auto body = Aws::MakeShared<Aws::FStream>(
    "FerryPutObjectBody", local_path.c_str(), std::ios_base::in | std::ios_base::binary
  );
  if (!body->good()) {
    FERRY_LOG_ERROR("Cannot open local file" << kv("path", local_path));
    return PutResult::Failure("Cannot open local file: " + local_path, "FileNotFound");
  }

  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);
  request.SetContentType(contentTypeForKey(key));
  request.SetBody(body);

  auto outcome = impl_->client->PutObject(request);
  if (outcome.IsSuccess()) {
    FERRY_LOG_DEBUG("S3 put succeeded" << kv("key", key)
                                       << kv("etag", std::string(outcome.GetResult().GetETag())));
    return PutResult::Success();
  }

  const auto& error = outcome.GetError();
  std::string error_code = error.GetExceptionName();
  std::string error_msg = error.GetMessage();
  int http_status = static_cast<int>(error.GetResponseCode());
  if (error_code.empty()) {
    error_code = "HttpStatus" + std::to_string(http_status);
  }
  if (error_msg.empty()) {
    error_msg = "PutObject failed with HTTP status " + std::to_string(http_status);
  }

  FERRY_LOG_ERROR("S3 put failed" << kv("key", key) << kv("code", error_code)
                                  << kv("error", error_msg));
  return PutResult::Failure(error_msg, error_code);
}

HeadResult S3ObjectStore::head(const std::string& key) {
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(impl_->config.bucket);
  request.SetKey(key);

  auto outcome = impl_->client->HeadObject(request);
  if (outcome.IsSuccess()) {
    long long length = outcome.GetResult().GetContentLength();
    return HeadResult::Found(length > 0 ? static_cast<uint64_t>(length) : 0);
  }

  const auto& error = outcome.GetError();
  int http_status = static_cast<int>(error.GetResponseCode());
  std::string exception_name = error.GetExceptionName();
  std::string message = error.GetMessage();
  if (message.empty()) {
    message = "HeadObject failed with HTTP status " + std::to_string(http_status);
  }

  if (classifyHeadError(http_status, exception_name) == HeadStatus::NOT_FOUND) {
    FERRY_LOG_DEBUG("S3 object not found" << kv("key", key));
    return HeadResult::NotFound(message);
  }

  FERRY_LOG_WARN("S3 head failed" << kv("key", key) << kv("code", exception_name)
                                  << kv("status", http_status) << kv("error", message));
  return HeadResult::Unreachable(message);
}

const std::string& S3ObjectStore::bucket() const {
  return impl_->config.bucket;
}

const std::string& S3ObjectStore::endpoint() const {
  return impl_->config.endpoint_url;
}

}  // namespace uploader
}  // namespace ferry
