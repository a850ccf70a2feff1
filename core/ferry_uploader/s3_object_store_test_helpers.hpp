// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_S3_OBJECT_STORE_TEST_HELPERS_HPP
#define FERRY_S3_OBJECT_STORE_TEST_HELPERS_HPP

// This header is for testing only - exposes internal implementations
// These are defined in s3_object_store.cpp

#include <string>

#include "uploader_interfaces.hpp"

namespace ferry {
namespace uploader {

/**
 * Map a failed HeadObject to NOT_FOUND or UNREACHABLE
 * @param http_status HTTP response code (0 or negative if no response)
 * @param exception_name SDK exception name
 */
HeadStatus classifyHeadError(int http_status, const std::string& exception_name);

/**
 * Strip trailing slashes from a custom endpoint URL
 */
std::string normalizeEndpoint(const std::string& endpoint_url);

/**
 * Content type sent with PutObject, chosen from the key's extension
 */
std::string contentTypeForKey(const std::string& key);

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_S3_OBJECT_STORE_TEST_HELPERS_HPP
