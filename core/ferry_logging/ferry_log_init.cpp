// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <cctype>
#include <cstdlib>
#include <mutex>

#include "ferry_log_macros.hpp"

namespace ferry {
namespace logging {

namespace {

/**
 * Sinks currently attached to the Boost.Log core. One per process.
 */
struct SinkRegistry {
  std::mutex mutex;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  bool initialized = false;
};

SinkRegistry& registry() {
  static SinkRegistry instance;
  return instance;
}

struct LevelName {
  const char* name;
  severity_level level;
};

const LevelName kLevelNames[] = {
  {"debug", severity_level::debug}, {"info", severity_level::info},
  {"warn", severity_level::warn},   {"warning", severity_level::warn},
  {"error", severity_level::error}, {"fatal", severity_level::fatal},
};

std::string lowercase(std::string s) {
  for (auto& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

// Empty variables count as unset
const char* env_value(const char* name) {
  const char* value = std::getenv(name);
  return (value && value[0] != '\0') ? value : nullptr;
}

void read_level_env(const char* name, severity_level& target) {
  if (const char* value = env_value(name)) {
    if (auto level = parse_severity_level(value)) {
      target = *level;
    }
  }
}

void read_flag_env(const char* name, bool& target) {
  const char* value = env_value(name);
  if (!value) {
    return;
  }
  std::string flag = lowercase(value);
  if (flag == "true" || flag == "1" || flag == "yes" || flag == "on") {
    target = true;
  } else if (flag == "false" || flag == "0" || flag == "no" || flag == "off") {
    target = false;
  }
}

// Stop first so the async feeding thread drains its queue into the backend
template<typename Sink>
void detach(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string wanted = lowercase(level_str);
  for (const auto& entry : kLevelNames) {
    if (wanted == entry.name) {
      return entry.level;
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  // Global level first so the per-sink variables can refine it
  if (const char* value = env_value("FERRY_LOG_LEVEL")) {
    if (auto level = parse_severity_level(value)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }
  read_level_env("FERRY_LOG_CONSOLE_LEVEL", config.console_level);
  read_level_env("FERRY_LOG_FILE_LEVEL", config.file_level);
  read_flag_env("FERRY_LOG_CONSOLE_ENABLED", config.console_enabled);
  read_flag_env("FERRY_LOG_FILE_ENABLED", config.file_enabled);

  if (const char* dir = env_value("FERRY_LOG_FILE_DIR")) {
    config.file_config.directory = dir;
  }
  if (const char* format = env_value("FERRY_LOG_FORMAT")) {
    config.file_config.format_json = lowercase(format) == "json";
  }
}

logger_type& get_logger() {
  static logger_type logger;
  return logger;
}

void init_logging(const LoggingConfig& config) {
  SinkRegistry& sinks = registry();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.initialized) {
    return;
  }

  boost::log::add_common_attributes();
  auto core = boost::log::core::get();

  if (config.console_enabled) {
    sinks.console = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(sinks.console);
  }
  if (config.file_enabled) {
    sinks.file = create_file_sink(config.file_config, config.file_level);
    core->add_sink(sinks.file);
  }

  sinks.initialized = true;
}

void init_logging_default() {
  init_logging(LoggingConfig{});
}

void shutdown_logging() {
  SinkRegistry& sinks = registry();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (!sinks.initialized) {
    return;
  }

  detach(sinks.console);
  detach(sinks.file);
  sinks.initialized = false;
}

void flush_logging() {
  SinkRegistry& sinks = registry();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.console) {
    sinks.console->flush();
  }
  if (sinks.file) {
    sinks.file->flush();
  }
}

void reconfigure_logging(const LoggingConfig& config) {
  LoggingConfig effective = config;
  apply_env_overrides(effective);

  shutdown_logging();
  init_logging(effective);
}

bool is_logging_initialized() {
  SinkRegistry& sinks = registry();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  return sinks.initialized;
}

}  // namespace logging
}  // namespace ferry
