// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_INIT_HPP
#define FERRY_LOG_INIT_HPP

#include <optional>
#include <string>

#include "ferry_console_sink.hpp"
#include "ferry_file_sink.hpp"
#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

/**
 * Diagnostic logging configuration (console and rotating file sinks).
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  // File sink
  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse a string to severity_level.
 * Accepts: "debug", "info", "warn", "warning", "error", "fatal" (case-insensitive)
 *
 * @return The parsed severity_level, or std::nullopt if invalid
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 * Supported environment variables:
 *   FERRY_LOG_LEVEL           - Global level (overrides both console and file)
 *   FERRY_LOG_CONSOLE_LEVEL   - Console sink level
 *   FERRY_LOG_FILE_LEVEL      - File sink level
 *   FERRY_LOG_FILE_DIR        - Log file directory
 *   FERRY_LOG_FORMAT          - File format ("json" or "text")
 *   FERRY_LOG_FILE_ENABLED    - Enable file logging ("true" or "false")
 *   FERRY_LOG_CONSOLE_ENABLED - Enable console logging ("true" or "false")
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Initialize console and file sinks. Calling it twice is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Initialize with console at INFO and the file sink disabled.
 */
void init_logging_default();

/**
 * Stop async sink threads, flush pending records and detach all sinks.
 */
void shutdown_logging();

void flush_logging();

/**
 * Shut down existing sinks and reinitialize with new settings.
 * Environment variable overrides are applied on top of config.
 */
void reconfigure_logging(const LoggingConfig& config);

bool is_logging_initialized();

}  // namespace logging
}  // namespace ferry

#endif  // FERRY_LOG_INIT_HPP
