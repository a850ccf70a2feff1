// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOAD_APP_HPP
#define FERRY_UPLOAD_APP_HPP

#include <chrono>
#include <ostream>
#include <string>

#include "directory_walker.hpp"
#include "transfer_record.hpp"
#include "upload_config.hpp"
#include "uploader_interfaces.hpp"

namespace ferry {
namespace app {

/**
 * Process exit status
 */
namespace exit_code {
constexpr int OK = 0;                  // Every file transferred and verified
constexpr int RUN_HAD_FAILURES = 1;    // Some file failed, mismatched or was unreachable
constexpr int USAGE_ERROR = 2;         // Bad flags or configuration
constexpr int SOURCE_UNREADABLE = 3;   // Source root could not be walked
constexpr int AUDIT_WRITE_FAILED = 4;  // Audit log could not be written
}  // namespace exit_code

/**
 * Expand a leading "~" to $HOME
 */
std::string expand_user_path(const std::string& path);

/**
 * Full audit log path for this run: audit.directory (or <source>/logs)
 * joined with audit.file_name after strftime expansion
 */
std::string resolve_audit_log_path(
  const UploadConfig& config, std::chrono::system_clock::time_point now
);

/**
 * Walk filters: hidden-file setting plus the audit log itself, and its
 * directory when that lies inside the source tree
 */
uploader::WalkOptions build_walk_options(
  const UploadConfig& config, const std::string& audit_log_path
);

/**
 * Human-readable block for one transfer
 */
void print_record(const uploader::TransferRecord& record, std::ostream& out);

/**
 * Run one upload pass with an already-constructed store
 *
 * Per-file results and the summary go to out; fatal errors go to err and
 * the diagnostic log.
 *
 * @return One of exit_code
 */
int run_upload(
  const UploadConfig& config, uploader::IObjectStore& store, std::ostream& out, std::ostream& err
);

}  // namespace app
}  // namespace ferry

#endif  // FERRY_UPLOAD_APP_HPP
