// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <fstream>

#include <ferry_log_init.hpp>

namespace ferry {
namespace app {

bool ConfigParser::load_from_file(const std::string& path, UploadConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, UploadConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (!node.IsDefined() || node.IsNull()) {
      return true;  // Empty document: defaults stand
    }
    if (!node.IsMap()) {
      last_error_ = "Config root must be a mapping";
      return false;
    }

    if (node["source"]) {
      parse_source(node["source"], config.source);
    }
    if (node["destination"]) {
      parse_destination(node["destination"], config.destination);
    }
    if (node["s3"]) {
      parse_s3(node["s3"], config.s3);
    }
    if (node["audit"]) {
      parse_audit(node["audit"], config.audit);
    }
    if (node["logging"]) {
      parse_logging(node["logging"], config.logging);
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

void ConfigParser::parse_source(const YAML::Node& node, SourceConfig& source) {
  if (node["directory"]) {
    source.directory = node["directory"].as<std::string>();
  }
  if (node["include_hidden"]) {
    source.include_hidden = node["include_hidden"].as<bool>();
  }
}

void ConfigParser::parse_destination(const YAML::Node& node, DestinationConfig& destination) {
  if (node["bucket"]) {
    destination.bucket = node["bucket"].as<std::string>();
  }
  if (node["prefix"]) {
    destination.prefix = node["prefix"].as<std::string>();
  }
}

void ConfigParser::parse_s3(const YAML::Node& node, uploader::S3Config& s3) {
  if (node["endpoint_url"]) {
    s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["region"]) {
    s3.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["connect_timeout_ms"]) {
    s3.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    s3.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  if (node["max_sdk_retries"]) {
    s3.max_sdk_retries = node["max_sdk_retries"].as<int>();
  }
}

void ConfigParser::parse_audit(const YAML::Node& node, AuditConfig& audit) {
  if (node["directory"]) {
    audit.directory = node["directory"].as<std::string>();
  }
  if (node["file_name"]) {
    audit.file_name = node["file_name"].as<std::string>();
  }
  if (node["sync_each_record"]) {
    audit.sync_each_record = node["sync_each_record"].as<bool>();
  }
}

void ConfigParser::parse_logging(const YAML::Node& node, LoggingConfig& logging) {
  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }
}

bool ConfigParser::validate(const UploadConfig& config, std::string& error_msg) {
  if (config.source.directory.empty()) {
    error_msg = "source.directory is not configured";
    return false;
  }

  if (config.destination.bucket.empty()) {
    error_msg = "destination.bucket is not configured";
    return false;
  }

  // Validate endpoint_url format if provided
  if (!config.s3.endpoint_url.empty()) {
    if (config.s3.endpoint_url.find("http://") != 0 &&
        config.s3.endpoint_url.find("https://") != 0) {
      error_msg = "Invalid s3.endpoint_url - must start with http:// or https://";
      return false;
    }
  }

  if (config.s3.connect_timeout_ms <= 0 || config.s3.request_timeout_ms <= 0) {
    error_msg = "Invalid s3 timeouts - must be > 0";
    return false;
  }

  if (config.s3.max_sdk_retries < 0) {
    error_msg = "Invalid s3.max_sdk_retries - must be >= 0";
    return false;
  }

  if (config.audit.file_name.empty()) {
    error_msg = "audit.file_name is empty";
    return false;
  }

  if (config.audit.file_name.find('/') != std::string::npos) {
    error_msg = "audit.file_name must not contain '/' - use audit.directory";
    return false;
  }

  if (!::ferry::logging::parse_severity_level(config.logging.console_level)) {
    error_msg = "Invalid logging.console.level: " + config.logging.console_level;
    return false;
  }

  if (!::ferry::logging::parse_severity_level(config.logging.file_level)) {
    error_msg = "Invalid logging.file.level: " + config.logging.file_level;
    return false;
  }

  if (config.logging.file_format != "json" && config.logging.file_format != "text") {
    error_msg = "logging.file.format must be 'json' or 'text'";
    return false;
  }

  return true;
}

void convert_logging_config(
  const LoggingConfig& yaml_config, ::ferry::logging::LoggingConfig& log_config
) {
  // Console settings
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;

  if (auto level = ::ferry::logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  // File settings
  log_config.file_enabled = yaml_config.file_enabled;

  if (auto level = ::ferry::logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  // File sink config
  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (yaml_config.file_format == "json");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = static_cast<int>(yaml_config.max_files);
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

}  // namespace app
}  // namespace ferry
