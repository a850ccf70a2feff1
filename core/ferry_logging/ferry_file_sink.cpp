// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_file_sink.hpp"

#include <boost/filesystem.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <cstdio>
#include <iostream>

namespace ferry {
namespace logging {

namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;

namespace {

const char* short_escape(unsigned char c) {
  switch (c) {
    case '"':
      return "\\\"";
    case '\\':
      return "\\\\";
    case '\b':
      return "\\b";
    case '\f':
      return "\\f";
    case '\n':
      return "\\n";
    case '\r':
      return "\\r";
    case '\t':
      return "\\t";
    default:
      return nullptr;
  }
}

/**
 * One record per line, either a JSON object or the console layout without colors.
 */
struct FileFormatter {
  bool json;

  void operator()(
    boost::log::record_view const& rec, boost::log::formatting_ostream& strm
  ) const {
    auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec);
    auto sev = boost::log::extract<severity_level>("Severity", rec);
    auto file = boost::log::extract<std::string>("FileName", rec);
    const std::string message = rec[boost::log::expressions::smessage].get();

    if (!json) {
      if (ts) {
        strm << "[" << *ts << "] ";
      }
      if (sev) {
        strm << "[" << *sev << "] ";
      }
      strm << message;
      if (file) {
        strm << " | file=" << *file;
      }
      return;
    }

    strm << "{\"ts\":\"";
    if (ts) {
      strm << *ts;
    }
    strm << "\",\"level\":\"";
    if (sev) {
      strm << *sev;
    }
    strm << "\",\"msg\":\"" << escape_json(message) << "\"";

    auto thread_id =
      boost::log::extract<boost::log::attributes::current_thread_id::value_type>("ThreadID", rec);
    if (thread_id) {
      strm << ",\"thread_id\":\"" << *thread_id << "\"";
    }
    if (file) {
      strm << ",\"file\":\"" << escape_json(*file) << "\"";
    }
    strm << "}";
  }
};

// Falls back to /tmp when the configured directory cannot be created
std::string resolve_log_directory(const std::string& configured) {
  boost::system::error_code ec;
  boost::filesystem::create_directories(configured, ec);
  if (!ec) {
    return configured;
  }
  // Logging is not up yet, so stderr is the only channel
  std::cerr << "[ferry_logging] Warning: Could not create log directory '" << configured
            << "': " << ec.message() << ". Falling back to /tmp\n";
  return "/tmp";
}

}  // namespace

std::string escape_json(const std::string& s) {
  std::string result;
  result.reserve(s.size() + 16);
  for (unsigned char c : s) {
    if (const char* escaped = short_escape(c)) {
      result += escaped;
    } else if (c < 0x20) {
      char buf[8];
      snprintf(buf, sizeof(buf), "\\u%04x", c);
      result += buf;
    } else {
      result += static_cast<char>(c);
    }
  }
  return result;
}

boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level
) {
  const std::string log_directory = resolve_log_directory(config.directory);

  auto backend = boost::make_shared<sinks::text_file_backend>(
    keywords::file_name = log_directory + "/" + config.file_pattern,
    keywords::rotation_size = config.rotation_size_mb * 1024 * 1024,
    keywords::auto_flush = true
  );
  if (config.rotate_at_midnight) {
    backend->set_time_based_rotation(sinks::file::rotation_at_time_point(0, 0, 0));
  }
  backend->set_file_collector(sinks::file::make_collector(
    keywords::target = log_directory, keywords::max_files = config.max_files
  ));
  backend->scan_for_files();

  auto sink = boost::make_shared<async_file_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(FileFormatter{config.format_json});
  return sink;
}

}  // namespace logging
}  // namespace ferry
