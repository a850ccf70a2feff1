// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "command_line.hpp"

#include <cstring>
#include <filesystem>

namespace ferry {
namespace app {

namespace {

bool take_value(
  int argc, const char* const argv[], int& i, std::string& value, std::string& error_msg,
  const char* what
) {
  if (i + 1 < argc) {
    value = argv[++i];
    return true;
  }
  error_msg = std::string(argv[i]) + " requires " + what;
  return false;
}

}  // namespace

bool parse_command_line(
  int argc, const char* const argv[], CommandLineOptions& options, std::string& error_msg
) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
      options.help = true;
    } else if (strcmp(arg, "--config") == 0) {
      if (!take_value(argc, argv, i, options.config_file, error_msg, "a file argument")) {
        return false;
      }
    } else if (strcmp(arg, "--source") == 0) {
      if (!take_value(argc, argv, i, options.source, error_msg, "a directory argument")) {
        return false;
      }
    } else if (strcmp(arg, "--bucket") == 0) {
      if (!take_value(argc, argv, i, options.bucket, error_msg, "a bucket name")) {
        return false;
      }
    } else if (strcmp(arg, "--prefix") == 0) {
      if (!take_value(argc, argv, i, options.prefix, error_msg, "a key prefix")) {
        return false;
      }
      options.prefix_given = true;
    } else if (strcmp(arg, "--log") == 0) {
      if (!take_value(argc, argv, i, options.log_path, error_msg, "a file argument")) {
        return false;
      }
    } else if (strcmp(arg, "--endpoint") == 0) {
      if (!take_value(argc, argv, i, options.endpoint, error_msg, "a URL argument")) {
        return false;
      }
    } else if (strcmp(arg, "--region") == 0) {
      if (!take_value(argc, argv, i, options.region, error_msg, "a region argument")) {
        return false;
      }
    } else if (strcmp(arg, "--include-hidden") == 0) {
      options.include_hidden = true;
    } else if (strcmp(arg, "--verbose") == 0 || strcmp(arg, "-v") == 0) {
      options.verbose = true;
    } else {
      error_msg = std::string("Unknown option: ") + arg;
      return false;
    }
  }
  return true;
}

void apply_command_line(const CommandLineOptions& options, UploadConfig& config) {
  if (!options.source.empty()) {
    config.source.directory = options.source;
  }
  if (options.include_hidden) {
    config.source.include_hidden = true;
  }
  if (!options.bucket.empty()) {
    config.destination.bucket = options.bucket;
  }
  if (options.prefix_given) {
    config.destination.prefix = options.prefix;
  }
  if (!options.log_path.empty()) {
    std::filesystem::path log_path(options.log_path);
    // A bare file name is relative to the working directory, not <source>/logs
    config.audit.directory = log_path.has_parent_path() ? log_path.parent_path().string() : ".";
    config.audit.file_name = log_path.filename().string();
  }
  if (!options.endpoint.empty()) {
    config.s3.endpoint_url = options.endpoint;
    config.s3.use_ssl = options.endpoint.find("https://") == 0;
  }
  if (!options.region.empty()) {
    config.s3.region = options.region;
  }
  if (options.verbose) {
    config.logging.console_level = "debug";
  }
}

void print_usage(const char* program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [OPTIONS]\n"
      << "\n"
      << "Ferry - upload a directory to S3, verify each object and keep a CSV audit log\n"
      << "\n"
      << "Options:\n"
      << "  --config PATH          Path to YAML configuration file\n"
      << "  --source DIR           Directory to upload (default: ~/Documents/s3_upload)\n"
      << "  --bucket NAME          Destination bucket (default: my_bucket)\n"
      << "  --prefix PREFIX        Key prefix (default: s3_receive)\n"
      << "  --log FILE             Audit log file (default: <source>/logs/transfer_log.csv)\n"
      << "  --endpoint URL         S3-compatible endpoint, e.g. http://localhost:9000\n"
      << "  --region REGION        AWS region (default: us-east-1)\n"
      << "  --include-hidden       Also upload files and directories starting with '.'\n"
      << "  --verbose, -v          Debug-level console logging\n"
      << "  --help, -h             Show this help message\n"
      << "\n"
      << "Credentials are read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY, then\n"
      << "from the AWS SDK default provider chain.\n"
      << "\n"
      << "Command-line arguments OVERRIDE config file values.\n"
      << "\n"
      << "Exit status:\n"
      << "  0  every file transferred and verified\n"
      << "  1  at least one file failed, mismatched or could not be verified\n"
      << "  2  configuration or usage error\n"
      << "  3  source directory unreadable\n"
      << "  4  audit log could not be written\n"
      << "\n"
      << "Examples:\n"
      << "  " << program_name << " --config config/ferry_upload.yaml\n"
      << "  " << program_name << " --source /data/outbox --bucket archive --prefix backups/2024\n"
      << "  " << program_name << " --config config/ferry_upload.yaml \\\n"
      << "    --endpoint http://localhost:9000 --log /var/log/ferry/transfer_log.csv\n";
}

}  // namespace app
}  // namespace ferry
