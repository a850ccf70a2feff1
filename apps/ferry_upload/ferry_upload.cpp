// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <exception>
#include <iostream>
#include <string>

#include "command_line.hpp"
#include "config_parser.hpp"
#include "s3_object_store.hpp"
#include "upload_app.hpp"

#define FERRY_LOG_COMPONENT "ferry_upload"
#include <ferry_log_init.hpp>
#include <ferry_log_macros.hpp>

int main(int argc, char* argv[]) {
  using namespace ferry::app;

  // Step 1: Parse command line arguments
  CommandLineOptions options;
  std::string error_msg;
  if (!parse_command_line(argc, argv, options, error_msg)) {
    std::cerr << "Error: " << error_msg << std::endl;
    print_usage(argv[0], std::cerr);
    return exit_code::USAGE_ERROR;
  }
  if (options.help) {
    print_usage(argv[0], std::cout);
    return exit_code::OK;
  }

  // Step 2: Load config file, then apply CLI overrides
  UploadConfig config;
  if (!options.config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(options.config_file, config)) {
      std::cerr << "Error: " << parser.get_last_error() << std::endl;
      return exit_code::USAGE_ERROR;
    }
  }
  apply_command_line(options, config);

  if (!ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: Invalid configuration: " << error_msg << std::endl;
    return exit_code::USAGE_ERROR;
  }

  // Step 3: Initialize logging (environment variables win over the file)
  ferry::logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  ferry::logging::apply_env_overrides(log_config);
  ferry::logging::init_logging(log_config);

  // Step 4: Run
  int status = exit_code::OK;
  try {
    ferry::uploader::S3Config s3_config = config.s3;
    s3_config.bucket = config.destination.bucket;
    ferry::uploader::S3ObjectStore store(s3_config);

    status = run_upload(config, store, std::cout, std::cerr);
  } catch (const std::exception& e) {
    FERRY_LOG_FATAL("Unhandled error" << ferry::logging::kv("error", e.what()));
    std::cerr << "Error: " << e.what() << std::endl;
    status = exit_code::USAGE_ERROR;
  }

  ferry::logging::shutdown_logging();
  return status;
}
