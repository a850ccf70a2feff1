// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOAD_CONFIG_PARSER_HPP
#define FERRY_UPLOAD_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "upload_config.hpp"

// Forward declaration in global namespace
namespace ferry {
namespace logging {
struct LoggingConfig;
}
}  // namespace ferry

namespace ferry {
namespace app {

/**
 * Convert LoggingConfig to ferry::logging::LoggingConfig.
 * This bridges the YAML parser output to the logging library input.
 */
void convert_logging_config(
  const LoggingConfig& yaml_config, ::ferry::logging::LoggingConfig& log_config
);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, UploadConfig& config);

  /**
   * Load configuration from YAML string.
   * Keys that are absent keep the values already in config.
   */
  bool load_from_string(const std::string& yaml_content, UploadConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const UploadConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  void parse_source(const YAML::Node& node, SourceConfig& source);
  void parse_destination(const YAML::Node& node, DestinationConfig& destination);
  void parse_s3(const YAML::Node& node, uploader::S3Config& s3);
  void parse_audit(const YAML::Node& node, AuditConfig& audit);
  void parse_logging(const YAML::Node& node, LoggingConfig& logging);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace app
}  // namespace ferry

#endif  // FERRY_UPLOAD_CONFIG_PARSER_HPP
