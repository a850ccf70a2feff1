// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "directory_walker.hpp"

#include <algorithm>
#include <utility>

#include "uploader_errors.hpp"

#define FERRY_LOG_COMPONENT "directory_walker"
#include <ferry_log_macros.hpp>

namespace fs = std::filesystem;

namespace ferry {
namespace uploader {

DirectoryWalker::DirectoryWalker(const std::string& root, WalkOptions options)
    : options_(std::move(options)) {
  std::error_code ec;
  if (root.empty()) {
    throw SourceUnreadableError(root, "empty path");
  }
  if (!fs::exists(root, ec)) {
    throw SourceUnreadableError(root, ec ? ec.message() : "does not exist");
  }
  if (!fs::is_directory(root, ec)) {
    throw SourceUnreadableError(root, "not a directory");
  }

  root_ = fs::canonical(root, ec);
  if (ec) {
    throw SourceUnreadableError(root, ec.message());
  }
  root_string_ = root_.string();

  for (const auto& excluded : options_.excluded_paths) {
    if (excluded.empty()) {
      continue;
    }
    fs::path normalized = fs::weakly_canonical(excluded, ec);
    if (ec) {
      normalized = fs::absolute(excluded).lexically_normal();
      ec.clear();
    }
    excluded_.insert(normalized);
  }

  reset();
}

void DirectoryWalker::reset() {
  stack_.clear();
  skipped_directories_ = 0;
  stack_.push_back(Level{listSorted(root_, true), 0});
}

std::optional<WalkEntry> DirectoryWalker::next() {
  while (!stack_.empty()) {
    Level& level = stack_.back();
    if (level.index >= level.entries.size()) {
      stack_.pop_back();
      continue;
    }
    fs::path path = level.entries[level.index++];

    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    if (ec) {
      FERRY_LOG_WARN("Cannot stat entry, skipping" << ::ferry::logging::kv("path", path.string())
                                                   << ::ferry::logging::kv("error", ec.message()));
      continue;
    }

    if (fs::is_symlink(status)) {
      FERRY_LOG_DEBUG("Skipping symbolic link" << ::ferry::logging::kv("path", path.string()));
      continue;
    }

    if (fs::is_directory(status)) {
      // `level` is invalidated by the push
      stack_.push_back(Level{listSorted(path, false), 0});
      continue;
    }

    if (fs::is_regular_file(status)) {
      WalkEntry entry;
      entry.local_path = path.string();
      entry.relative_key = path.lexically_relative(root_).generic_string();
      return entry;
    }

    FERRY_LOG_DEBUG("Skipping special file" << ::ferry::logging::kv("path", path.string()));
  }
  return std::nullopt;
}

std::vector<fs::path> DirectoryWalker::listSorted(const fs::path& dir, bool is_root) {
  std::vector<fs::path> entries;
  std::error_code ec;

  fs::directory_iterator it(dir, ec);
  fs::directory_iterator end;
  while (!ec && it != end) {
    fs::path path = it->path();
    std::string name = path.filename().string();
    if (!options_.include_hidden && !name.empty() && name[0] == '.') {
      FERRY_LOG_DEBUG("Skipping hidden entry" << ::ferry::logging::kv("path", path.string()));
    } else if (isExcluded(path)) {
      FERRY_LOG_DEBUG("Skipping excluded entry" << ::ferry::logging::kv("path", path.string()));
    } else {
      entries.push_back(std::move(path));
    }
    it.increment(ec);
  }

  if (ec) {
    if (is_root) {
      throw SourceUnreadableError(dir.string(), ec.message());
    }
    ++skipped_directories_;
    FERRY_LOG_WARN("Cannot list directory, skipping" << ::ferry::logging::kv("path", dir.string())
                                                     << ::ferry::logging::kv("error", ec.message()));
    return {};
  }

  std::sort(entries.begin(), entries.end(), [](const fs::path& a, const fs::path& b) {
    return a.filename().string() < b.filename().string();
  });
  return entries;
}

bool DirectoryWalker::isExcluded(const fs::path& path) const {
  if (excluded_.empty()) {
    return false;
  }
  return excluded_.count(path) > 0;
}

}  // namespace uploader
}  // namespace ferry
