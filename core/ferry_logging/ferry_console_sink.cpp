// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "ferry_console_sink.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time_io.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>

#include <iostream>

namespace ferry {
namespace logging {

namespace {

// Indexed by severity_level
const char* const kLevelColors[] = {
  "\033[36m",  // debug: cyan
  "\033[32m",  // info: green
  "\033[33m",  // warn: yellow
  "\033[31m",  // error: red
  "\033[35m",  // fatal: magenta
};
const char* const kColorReset = "\033[0m";

/**
 * [time] [LEVEL] message | file=<key>
 */
struct ConsoleFormatter {
  bool colors;

  void operator()(
    boost::log::record_view const& rec, boost::log::formatting_ostream& strm
  ) const {
    if (auto ts = boost::log::extract<boost::posix_time::ptime>("TimeStamp", rec)) {
      strm << "[" << *ts << "] ";
    }

    if (auto sev = boost::log::extract<severity_level>("Severity", rec)) {
      auto index = static_cast<size_t>(*sev);
      bool paint = colors && index < sizeof(kLevelColors) / sizeof(*kLevelColors);
      if (paint) {
        strm << kLevelColors[index];
      }
      strm << "[" << *sev << "]";
      if (paint) {
        strm << kColorReset;
      }
      strm << " ";
    }

    strm << rec[boost::log::expressions::smessage];

    if (auto file = boost::log::extract<std::string>("FileName", rec)) {
      strm << " | file=" << *file;
    }
  }
};

}  // namespace

boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level, bool use_colors
) {
  auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
  // std::clog keeps diagnostics off stdout, where the transfer report goes
  backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  backend->auto_flush(true);

  auto sink = boost::make_shared<async_console_sink_t>(backend);
  sink->set_filter(severity >= min_level);
  sink->set_formatter(ConsoleFormatter{use_colors});
  return sink;
}

}  // namespace logging
}  // namespace ferry
