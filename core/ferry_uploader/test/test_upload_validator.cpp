// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for UploadValidator using GoogleMock
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>

#include "upload_validator.hpp"
#include "uploader_mocks.hpp"

using namespace ferry::uploader;
using namespace ferry::uploader::test;
using ::testing::Return;
using ::testing::Throw;

class UploadValidatorTest : public ::testing::Test {
protected:
  MockObjectStore store_;
  MockFileSystem filesystem_;
  std::string local_path_ = "/data/outbox/report.csv";
  std::string key_ = "backups/2024/report.csv";
};

TEST_F(UploadValidatorTest, EqualSizesAreVerified) {
  EXPECT_CALL(store_, head(key_)).WillOnce(Return(HeadResult::Found(1024)));
  EXPECT_CALL(filesystem_, file_size(local_path_)).WillOnce(Return(std::optional<uint64_t>(1024)));

  UploadValidator validator(store_, filesystem_);
  EXPECT_EQ(validator.validate(local_path_, key_), ValidationStatus::VERIFIED);
}

TEST_F(UploadValidatorTest, DifferentSizesAreMismatch) {
  EXPECT_CALL(store_, head(key_)).WillOnce(Return(HeadResult::Found(1000)));
  EXPECT_CALL(filesystem_, file_size(local_path_)).WillOnce(Return(std::optional<uint64_t>(1024)));

  UploadValidator validator(store_, filesystem_);
  EXPECT_EQ(validator.validate(local_path_, key_), ValidationStatus::MISMATCH);
}

TEST_F(UploadValidatorTest, AbsentObjectIsUnreachable) {
  EXPECT_CALL(store_, head(key_)).WillOnce(Return(HeadResult::NotFound("NoSuchKey")));
  EXPECT_CALL(filesystem_, file_size(local_path_)).WillOnce(Return(std::optional<uint64_t>(1024)));

  UploadValidator validator(store_, filesystem_);
  EXPECT_EQ(validator.validate(local_path_, key_), ValidationStatus::UNREACHABLE);
}

TEST_F(UploadValidatorTest, StoreOutageIsUnreachable) {
  EXPECT_CALL(store_, head(key_)).WillOnce(Return(HeadResult::Unreachable("connection refused")));
  EXPECT_CALL(filesystem_, file_size(local_path_)).WillOnce(Return(std::optional<uint64_t>(1024)));

  UploadValidator validator(store_, filesystem_);
  EXPECT_EQ(validator.validate(local_path_, key_), ValidationStatus::UNREACHABLE);
}

TEST_F(UploadValidatorTest, ThrowingStoreIsUnreachable) {
  EXPECT_CALL(store_, head(key_)).WillOnce(Throw(std::runtime_error("socket closed")));
  EXPECT_CALL(filesystem_, file_size(local_path_)).WillOnce(Return(std::optional<uint64_t>(1024)));

  UploadValidator validator(store_, filesystem_);
  EXPECT_EQ(validator.validate(local_path_, key_), ValidationStatus::UNREACHABLE);
}

TEST_F(UploadValidatorTest, VanishedLocalFileIsMismatch) {
  EXPECT_CALL(store_, head(key_)).WillOnce(Return(HeadResult::Found(1024)));
  EXPECT_CALL(filesystem_, file_size(local_path_)).WillOnce(Return(std::nullopt));

  UploadValidator validator(store_, filesystem_);
  EXPECT_EQ(validator.validate(local_path_, key_), ValidationStatus::MISMATCH);
}

TEST_F(UploadValidatorTest, GivenLocalSizeSkipsFilesystem) {
  EXPECT_CALL(store_, head(key_)).WillOnce(Return(HeadResult::Found(1024)));
  EXPECT_CALL(filesystem_, file_size(::testing::_)).Times(0);

  UploadValidator validator(store_, filesystem_);
  EXPECT_EQ(validator.validate(std::optional<uint64_t>(1024), key_), ValidationStatus::VERIFIED);
}

TEST_F(UploadValidatorTest, UnknownGivenLocalSizeIsMismatch) {
  EXPECT_CALL(store_, head(key_)).WillOnce(Return(HeadResult::Found(1024)));
  EXPECT_CALL(filesystem_, file_size(::testing::_)).Times(0);

  UploadValidator validator(store_, filesystem_);
  EXPECT_EQ(
    validator.validate(std::optional<uint64_t>(), key_), ValidationStatus::MISMATCH
  );
}

TEST(UploadValidatorClassifyTest, ZeroByteFileVerifies) {
  EXPECT_EQ(UploadValidator::classify(uint64_t{0}, HeadResult::Found(0)), ValidationStatus::VERIFIED);
}

TEST(UploadValidatorClassifyTest, LookupFailureWinsOverLocalState) {
  EXPECT_EQ(UploadValidator::classify(std::nullopt, HeadResult::NotFound()),
            ValidationStatus::UNREACHABLE);
}
