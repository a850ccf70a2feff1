// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOAD_COMMAND_LINE_HPP
#define FERRY_UPLOAD_COMMAND_LINE_HPP

#include <ostream>
#include <string>

#include "upload_config.hpp"

namespace ferry {
namespace app {

/**
 * Values given on the command line. Empty strings mean "not given".
 */
struct CommandLineOptions {
  std::string config_file;
  std::string source;
  std::string bucket;
  std::string prefix;
  bool prefix_given = false;  // --prefix "" clears the configured prefix
  std::string log_path;
  std::string endpoint;
  std::string region;
  bool include_hidden = false;
  bool verbose = false;
  bool help = false;
};

/**
 * Parse argv
 *
 * @return false with error_msg set on an unknown flag or a missing value
 */
bool parse_command_line(
  int argc, const char* const argv[], CommandLineOptions& options, std::string& error_msg
);

/**
 * Apply command-line values on top of the file configuration.
 * Command-line arguments OVERRIDE config file values.
 */
void apply_command_line(const CommandLineOptions& options, UploadConfig& config);

void print_usage(const char* program_name, std::ostream& out);

}  // namespace app
}  // namespace ferry

#endif  // FERRY_UPLOAD_COMMAND_LINE_HPP
