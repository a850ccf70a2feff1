// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_DIRECTORY_WALKER_HPP
#define FERRY_DIRECTORY_WALKER_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ferry {
namespace uploader {

/**
 * A regular file found under the source root
 */
struct WalkEntry {
  std::string local_path;    // Absolute path
  std::string relative_key;  // Path below the root, '/' separated
};

/**
 * Filters applied while walking
 */
struct WalkOptions {
  bool include_hidden = false;              // Yield names starting with '.'
  std::vector<std::string> excluded_paths;  // Files or directories never yielded/entered
};

/**
 * Lazy depth-first enumeration of regular files under a root directory
 *
 * Each directory is listed only when the walk reaches it and its entries are
 * visited in byte-wise name order, so the sequence is deterministic for a
 * given filesystem state. Symbolic links (to files or directories) and
 * special files are never yielded. reset() restarts from the first file.
 *
 * An unreadable subdirectory is logged and skipped; an unreadable root is
 * fatal.
 */
class DirectoryWalker {
public:
  /**
   * @param root Source root directory
   * @param options Hidden-file and exclusion filters
   * @throws SourceUnreadableError if root is missing, not a directory, or unlistable
   */
  explicit DirectoryWalker(const std::string& root, WalkOptions options = {});

  /**
   * Advance to the next regular file
   * @return Entry, or std::nullopt once the walk is exhausted
   */
  std::optional<WalkEntry> next();

  /**
   * Restart the walk from the beginning
   * @throws SourceUnreadableError if the root can no longer be listed
   */
  void reset();

  /**
   * Absolute, canonical root path
   */
  const std::string& root() const {
    return root_string_;
  }

  /**
   * Subdirectories skipped because they could not be listed
   */
  size_t skippedDirectories() const {
    return skipped_directories_;
  }

private:
  struct Level {
    std::vector<std::filesystem::path> entries;
    size_t index = 0;
  };

  std::vector<std::filesystem::path> listSorted(const std::filesystem::path& dir, bool is_root);
  bool isExcluded(const std::filesystem::path& path) const;

  std::filesystem::path root_;
  std::string root_string_;
  WalkOptions options_;
  std::set<std::filesystem::path> excluded_;
  std::vector<Level> stack_;
  size_t skipped_directories_ = 0;
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_DIRECTORY_WALKER_HPP
