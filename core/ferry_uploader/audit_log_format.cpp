// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "audit_log_format.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#define FERRY_LOG_COMPONENT "audit_log_format"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace uploader {
namespace audit_format {

namespace {

bool needsQuoting(const std::string& value) {
  if (value.empty()) {
    return false;
  }
  if (value.front() == ' ' || value.front() == '\t' || value.back() == ' ' ||
      value.back() == '\t') {
    return true;
  }
  for (char c : value) {
    if (c == DELIMITER || c == QUOTE || c == '\n' || c == '\r') {
      return true;
    }
  }
  return false;
}

std::string formatDuration(double seconds) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%.3f", seconds);
  return buf;
}

std::optional<uint64_t> parseSize(const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || end != text.c_str() + text.size()) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(value);
}

}  // namespace

const std::vector<std::string>& columns() {
  static const std::vector<std::string> names = {
    "fileName",
    "sourcePath",
    "destination",
    "status",
    "startTime",
    "endTime",
    "durationSeconds",
    "fileSizeBytes",
    "validationStatus"
  };
  return names;
}

std::string headerLine() {
  std::string line;
  for (size_t i = 0; i < columns().size(); ++i) {
    if (i > 0) {
      line += DELIMITER;
    }
    line += columns()[i];
  }
  line += '\n';
  return line;
}

std::string encodeField(const std::string& value) {
  if (!needsQuoting(value)) {
    return value;
  }

  std::string result;
  result.reserve(value.size() + 8);
  result += QUOTE;
  for (char c : value) {
    switch (c) {
      case QUOTE:
        result += "\"\"";
        break;
      case ESCAPE:
        result += "\\\\";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      default:
        result += c;
    }
  }
  result += QUOTE;
  return result;
}

std::optional<std::vector<std::string>> splitLine(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  size_t i = 0;
  const size_t n = line.size();

  while (true) {
    current.clear();
    if (i < n && line[i] == QUOTE) {
      ++i;
      bool closed = false;
      while (i < n) {
        char c = line[i];
        if (c == QUOTE) {
          if (i + 1 < n && line[i + 1] == QUOTE) {
            current += QUOTE;
            i += 2;
            continue;
          }
          closed = true;
          ++i;
          break;
        }
        if (c == ESCAPE) {
          if (i + 1 >= n) {
            return std::nullopt;
          }
          char next = line[i + 1];
          if (next == ESCAPE) {
            current += ESCAPE;
          } else if (next == 'n') {
            current += '\n';
          } else if (next == 'r') {
            current += '\r';
          } else {
            return std::nullopt;
          }
          i += 2;
          continue;
        }
        current += c;
        ++i;
      }
      if (!closed) {
        return std::nullopt;
      }
      // Closing quote must end the field
      if (i < n && line[i] != DELIMITER) {
        return std::nullopt;
      }
    } else {
      while (i < n && line[i] != DELIMITER) {
        if (line[i] == QUOTE || line[i] == '\r') {
          return std::nullopt;
        }
        current += line[i];
        ++i;
      }
    }

    fields.push_back(current);

    if (i >= n) {
      break;
    }
    // Skip the delimiter; a trailing delimiter yields a final empty field
    ++i;
    if (i == n) {
      fields.emplace_back();
      break;
    }
  }

  return fields;
}

std::string formatRecord(const TransferRecord& record) {
  std::string row;
  row += encodeField(record.file_name);
  row += DELIMITER;
  row += encodeField(record.source_path);
  row += DELIMITER;
  row += encodeField(record.destination);
  row += DELIMITER;
  row += transferStatusToString(record.status);
  row += DELIMITER;
  row += formatTimestamp(record.start_time);
  row += DELIMITER;
  row += formatTimestamp(record.end_time);
  row += DELIMITER;
  row += formatDuration(record.durationSeconds());
  row += DELIMITER;
  if (record.file_size_bytes) {
    row += std::to_string(*record.file_size_bytes);
  }
  row += DELIMITER;
  row += validationStatusToString(record.validation_status);
  row += '\n';
  return row;
}

std::optional<TransferRecord> parseRecord(const std::string& line) {
  std::string trimmed = line;
  if (!trimmed.empty() && trimmed.back() == '\n') {
    trimmed.pop_back();
  }

  auto fields = splitLine(trimmed);
  if (!fields || fields->size() != COLUMN_COUNT) {
    return std::nullopt;
  }
  const auto& f = *fields;

  TransferRecord record;
  record.file_name = f[0];
  record.source_path = f[1];
  record.destination = f[2];

  auto status = transferStatusFromString(f[3]);
  auto start = parseTimestamp(f[4]);
  auto end = parseTimestamp(f[5]);
  auto validation = validationStatusFromString(f[8]);
  if (!status || !start || !end || !validation) {
    return std::nullopt;
  }
  record.status = *status;
  record.start_time = *start;
  record.end_time = *end;
  record.validation_status = *validation;

  // durationSeconds is derived from the timestamps; only check it is numeric
  char* end_ptr = nullptr;
  std::strtod(f[6].c_str(), &end_ptr);
  if (f[6].empty() || end_ptr != f[6].c_str() + f[6].size()) {
    return std::nullopt;
  }

  if (!f[7].empty()) {
    auto size = parseSize(f[7]);
    if (!size) {
      return std::nullopt;
    }
    record.file_size_bytes = *size;
  }

  return record;
}

}  // namespace audit_format

std::vector<TransferRecord> readAuditLog(const std::string& path, bool strict) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open audit log: " + path);
  }

  std::vector<TransferRecord> records;
  std::string line;

  if (!std::getline(file, line)) {
    return records;  // Empty file
  }
  std::string expected_header = audit_format::headerLine();
  expected_header.pop_back();
  if (line != expected_header) {
    throw std::runtime_error("Audit log header mismatch in " + path);
  }

  size_t line_number = 1;
  while (std::getline(file, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }
    auto record = audit_format::parseRecord(line);
    if (!record) {
      if (strict) {
        throw std::runtime_error(
          "Malformed audit log row at " + path + ":" + std::to_string(line_number)
        );
      }
      FERRY_LOG_WARN(
        "Skipping malformed audit log row" << ::ferry::logging::kv("path", path)
                                           << ::ferry::logging::kv("line", line_number)
      );
      continue;
    }
    records.push_back(std::move(*record));
  }

  return records;
}

}  // namespace uploader
}  // namespace ferry
