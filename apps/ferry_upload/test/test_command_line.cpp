// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_command_line.cpp
 * @brief Unit tests for argv parsing and config overrides
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "command_line.hpp"

using namespace ferry::app;

namespace {

bool parse(std::vector<const char*> args, CommandLineOptions& options, std::string& error) {
  args.insert(args.begin(), "ferry_upload");
  return parse_command_line(static_cast<int>(args.size()), args.data(), options, error);
}

}  // namespace

// ============================================================================
// Parsing Tests
// ============================================================================

TEST(CommandLineTest, NoArgumentsLeavesDefaults) {
  CommandLineOptions options;
  std::string error;
  ASSERT_TRUE(parse({}, options, error));
  EXPECT_TRUE(options.source.empty());
  EXPECT_FALSE(options.prefix_given);
  EXPECT_FALSE(options.help);
}

TEST(CommandLineTest, ParsesAllFlags) {
  CommandLineOptions options;
  std::string error;
  ASSERT_TRUE(parse(
    {"--config", "f.yaml", "--source", "/data", "--bucket", "b", "--prefix", "p/q", "--log",
     "/tmp/l.csv", "--endpoint", "http://localhost:9000", "--region", "eu-west-1",
     "--include-hidden", "-v"},
    options, error
  )) << error;

  EXPECT_EQ(options.config_file, "f.yaml");
  EXPECT_EQ(options.source, "/data");
  EXPECT_EQ(options.bucket, "b");
  EXPECT_EQ(options.prefix, "p/q");
  EXPECT_TRUE(options.prefix_given);
  EXPECT_EQ(options.log_path, "/tmp/l.csv");
  EXPECT_EQ(options.endpoint, "http://localhost:9000");
  EXPECT_EQ(options.region, "eu-west-1");
  EXPECT_TRUE(options.include_hidden);
  EXPECT_TRUE(options.verbose);
}

TEST(CommandLineTest, HelpFlag) {
  CommandLineOptions short_form;
  CommandLineOptions long_form;
  std::string error;
  ASSERT_TRUE(parse({"-h"}, short_form, error));
  ASSERT_TRUE(parse({"--help"}, long_form, error));
  EXPECT_TRUE(short_form.help);
  EXPECT_TRUE(long_form.help);
}

TEST(CommandLineTest, MissingValueIsError) {
  CommandLineOptions options;
  std::string error;
  EXPECT_FALSE(parse({"--bucket"}, options, error));
  EXPECT_EQ(error, "--bucket requires a bucket name");
}

TEST(CommandLineTest, UnknownOptionIsError) {
  CommandLineOptions options;
  std::string error;
  EXPECT_FALSE(parse({"--source", "/data", "--retries", "3"}, options, error));
  EXPECT_EQ(error, "Unknown option: --retries");
}

TEST(CommandLineTest, EmptyPrefixIsRecorded) {
  CommandLineOptions options;
  std::string error;
  ASSERT_TRUE(parse({"--prefix", ""}, options, error));
  EXPECT_TRUE(options.prefix_given);
  EXPECT_TRUE(options.prefix.empty());
}

// ============================================================================
// Override Tests
// ============================================================================

TEST(CommandLineTest, OverridesConfigValues) {
  UploadConfig config;
  config.source.directory = "/from/file";
  config.destination.bucket = "file-bucket";

  CommandLineOptions options;
  options.bucket = "cli-bucket";
  options.region = "ap-south-1";
  options.verbose = true;
  apply_command_line(options, config);

  EXPECT_EQ(config.source.directory, "/from/file");
  EXPECT_EQ(config.destination.bucket, "cli-bucket");
  EXPECT_EQ(config.destination.prefix, "s3_receive");
  EXPECT_EQ(config.s3.region, "ap-south-1");
  EXPECT_EQ(config.logging.console_level, "debug");
}

TEST(CommandLineTest, EmptyPrefixClearsConfiguredPrefix) {
  UploadConfig config;
  CommandLineOptions options;
  options.prefix_given = true;
  apply_command_line(options, config);
  EXPECT_TRUE(config.destination.prefix.empty());
}

TEST(CommandLineTest, LogPathSplitsIntoDirectoryAndName) {
  UploadConfig config;
  CommandLineOptions options;
  options.log_path = "/var/log/ferry/run.csv";
  apply_command_line(options, config);
  EXPECT_EQ(config.audit.directory, "/var/log/ferry");
  EXPECT_EQ(config.audit.file_name, "run.csv");
}

TEST(CommandLineTest, BareLogNameIsRelativeToWorkingDirectory) {
  UploadConfig config;
  CommandLineOptions options;
  options.log_path = "run.csv";
  apply_command_line(options, config);
  EXPECT_EQ(config.audit.directory, ".");
  EXPECT_EQ(config.audit.file_name, "run.csv");
}

TEST(CommandLineTest, EndpointSchemeSelectsSsl) {
  UploadConfig plain;
  CommandLineOptions minio;
  minio.endpoint = "http://localhost:9000";
  apply_command_line(minio, plain);
  EXPECT_EQ(plain.s3.endpoint_url, "http://localhost:9000");
  EXPECT_FALSE(plain.s3.use_ssl);

  UploadConfig secure;
  secure.s3.use_ssl = false;
  CommandLineOptions https;
  https.endpoint = "https://s3.example.com";
  apply_command_line(https, secure);
  EXPECT_TRUE(secure.s3.use_ssl);
}

TEST(CommandLineTest, UsageListsOptions) {
  std::ostringstream out;
  print_usage("ferry_upload", out);
  const std::string usage = out.str();
  EXPECT_NE(usage.find("Usage: ferry_upload [OPTIONS]"), std::string::npos);
  EXPECT_NE(usage.find("--bucket"), std::string::npos);
  EXPECT_NE(usage.find("--log"), std::string::npos);
}
