// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_UPLOADER_IMPL_HPP
#define FERRY_UPLOADER_IMPL_HPP

#include <filesystem>

#include "uploader_interfaces.hpp"

namespace ferry {
namespace uploader {

/**
 * Default implementation of IFileSystem using std::filesystem
 */
class FileSystemImpl : public IFileSystem {
public:
  std::optional<uint64_t> file_size(const std::string& path) const override {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);  // LCOV_EXCL_BR_LINE
    if (ec) {
      return std::nullopt;
    }
    return static_cast<uint64_t>(size);
  }
};

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_UPLOADER_IMPL_HPP
