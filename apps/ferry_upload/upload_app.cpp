// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_app.hpp"

#include <cstdlib>
#include <filesystem>
#include <iomanip>

#include "audit_logger.hpp"
#include "upload_orchestrator.hpp"
#include "uploader_errors.hpp"
#include "uploader_impl.hpp"

#define FERRY_LOG_COMPONENT "ferry_upload"
#include <ferry_log_macros.hpp>

namespace fs = std::filesystem;

namespace ferry {
namespace app {

using ::ferry::logging::kv;

namespace {

bool is_strictly_inside(const fs::path& child, const fs::path& parent) {
  fs::path relative = child.lexically_relative(parent);
  if (relative.empty() || relative == ".") {
    return false;
  }
  return *relative.begin() != "..";
}

fs::path normalized(const std::string& path) {
  std::error_code ec;
  fs::path result = fs::weakly_canonical(path, ec);
  if (ec) {
    return fs::absolute(path).lexically_normal();
  }
  return result;
}

}  // namespace

std::string expand_user_path(const std::string& path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  if (path.size() > 1 && path[1] != '/') {
    return path;  // ~user is not expanded
  }
  const char* home = std::getenv("HOME");
  if (!home || home[0] == '\0') {
    return path;
  }
  return std::string(home) + path.substr(1);
}

std::string resolve_audit_log_path(
  const UploadConfig& config, std::chrono::system_clock::time_point now
) {
  std::string directory = expand_user_path(config.audit.directory);
  if (directory.empty()) {
    directory = (fs::path(expand_user_path(config.source.directory)) / "logs").string();
  }
  return uploader::resolveAuditLogPath(directory, config.audit.file_name, now);
}

uploader::WalkOptions build_walk_options(
  const UploadConfig& config, const std::string& audit_log_path
) {
  uploader::WalkOptions options;
  options.include_hidden = config.source.include_hidden;
  options.excluded_paths.push_back(audit_log_path);

  fs::path source = normalized(expand_user_path(config.source.directory));
  fs::path log_dir = normalized(audit_log_path).parent_path();
  if (is_strictly_inside(log_dir, source)) {
    options.excluded_paths.push_back(log_dir.string());
  }
  return options;
}

void print_record(const uploader::TransferRecord& record, std::ostream& out) {
  out << "Filename:\t" << record.file_name << "\n"
      << "Source:\t\t" << record.source_path << "\n"
      << "Destination:\t" << record.destination << "\n"
      << "Status:\t\t" << uploader::transferStatusToString(record.status) << "\n"
      << "Start Time:\t" << uploader::formatTimestamp(record.start_time) << "\n"
      << "End Time:\t" << uploader::formatTimestamp(record.end_time) << "\n"
      << "Duration:\t" << std::fixed << std::setprecision(3) << record.durationSeconds()
      << " seconds\n"
      << "File Size:\t";
  if (record.file_size_bytes) {
    out << *record.file_size_bytes;
  } else {
    out << "unknown";
  }
  out << "\n"
      << "Validated:\t" << uploader::validationStatusToString(record.validation_status) << "\n"
      << std::endl;
}

int run_upload(
  const UploadConfig& config, uploader::IObjectStore& store, std::ostream& out, std::ostream& err
) {
  const std::string source = expand_user_path(config.source.directory);
  const std::string log_path = resolve_audit_log_path(config, std::chrono::system_clock::now());

  out << "Source directory: " << source << "\n"
      << "S3 bucket name: " << config.destination.bucket << "\n"
      << "S3 prefix: " << config.destination.prefix << "\n"
      << "Audit log: " << log_path << "\n"
      << std::endl;

  uploader::RunSummary summary;
  try {
    // Checked before the audit logger, which would otherwise create <source>/logs
    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
      throw uploader::SourceUnreadableError(source, ec ? ec.message() : "not a directory");
    }

    uploader::AuditLogger audit(log_path, config.audit.sync_each_record);
    uploader::FileSystemImpl filesystem;
    uploader::UploadOrchestrator orchestrator(
      store, audit, filesystem, build_walk_options(config, log_path)
    );
    orchestrator.setCallback([&out](const uploader::TransferRecord& record) {
      print_record(record, out);
    });

    summary = orchestrator.run(source, config.destination.bucket, config.destination.prefix);
  } catch (const uploader::SourceUnreadableError& e) {
    FERRY_LOG_ERROR("Source directory unreadable" << kv("root", e.root())
                                                  << kv("error", e.what()));
    err << "Error: " << e.what() << std::endl;
    return exit_code::SOURCE_UNREADABLE;
  } catch (const uploader::AuditWriteError& e) {
    FERRY_LOG_FATAL("Audit log write failed, run aborted" << kv("path", e.logPath())
                                                          << kv("error", e.what()));
    err << "Error: " << e.what() << std::endl;
    return exit_code::AUDIT_WRITE_FAILED;
  }

  out << "Transfer summary: Uploaded " << summary.succeeded << " files, Failed "
      << summary.failed << " files, Log file saved as " << log_path << "\n"
      << "Validation: " << summary.verified << " verified, " << summary.mismatched
      << " mismatched, " << summary.unreachable << " unreachable" << std::endl;

  return summary.clean() ? exit_code::OK : exit_code::RUN_HAD_FAILURES;
}

}  // namespace app
}  // namespace ferry
