// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_LOG_MACROS_HPP
#define FERRY_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <sstream>
#include <string>

#include "ferry_log_severity.hpp"

namespace ferry {
namespace logging {

typedef boost::log::sources::severity_logger<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in ferry_log_init.cpp
 */
logger_type& get_logger();

/**
 * key=value fragment for structured messages. Strings are quoted.
 * Usage: FERRY_LOG_INFO("Transferred" << kv("key", key) << kv("bytes", size));
 */
template<typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

inline std::string kv(const char* name, const std::string& value) {
  return std::string(" ") + name + "=\"" + value + "\"";
}

inline std::string kv(const char* name, const char* value) {
  return kv(name, std::string(value ? value : ""));
}

}  // namespace logging
}  // namespace ferry

// =============================================================================
// Component identification
// Define FERRY_LOG_COMPONENT before including this header:
//
//   #define FERRY_LOG_COMPONENT "audit_logger"
//   #include <ferry_log_macros.hpp>
// =============================================================================
#ifndef FERRY_LOG_COMPONENT
#define FERRY_LOG_COMPONENT "ferry"
#endif

// DEBUG records are compiled out of release builds
#ifdef NDEBUG
#define FERRY_LOG_ENABLE_DEBUG 0
#else
#define FERRY_LOG_ENABLE_DEBUG 1
#endif

// Every record is prefixed with "[component] "
#define FERRY_LOG_AT(level, msg)                                                               \
  BOOST_LOG_SEV(::ferry::logging::get_logger(), ::ferry::logging::severity_level::level)       \
    << "[" << FERRY_LOG_COMPONENT << "] " << msg

#define FERRY_LOG_DEBUG(msg)          \
  do {                                \
    if (FERRY_LOG_ENABLE_DEBUG) {     \
      FERRY_LOG_AT(debug, msg);       \
    }                                 \
  } while (0)

#define FERRY_LOG_INFO(msg) \
  do {                      \
    FERRY_LOG_AT(info, msg); \
  } while (0)

#define FERRY_LOG_WARN(msg) \
  do {                      \
    FERRY_LOG_AT(warn, msg); \
  } while (0)

#define FERRY_LOG_ERROR(msg)  \
  do {                        \
    FERRY_LOG_AT(error, msg); \
  } while (0)

#define FERRY_LOG_FATAL(msg)  \
  do {                        \
    FERRY_LOG_AT(fatal, msg); \
  } while (0)

// =============================================================================
// Tag every record in the enclosing scope with the file being transferred.
// Usage: FERRY_LOG_SCOPED_FILE(entry.relative_key);
// =============================================================================
#define FERRY_LOG_SCOPED_FILE(file_name_val) \
  BOOST_LOG_SCOPED_THREAD_ATTR(              \
    "FileName", boost::log::attributes::constant<std::string>(file_name_val))

#endif  // FERRY_LOG_MACROS_HPP
