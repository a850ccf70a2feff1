// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_record.hpp"

#include <cstdio>
#include <ctime>

namespace ferry {
namespace uploader {

Timestamp nowTimestamp() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

std::string formatTimestamp(Timestamp ts) {
  auto since_epoch = ts.time_since_epoch().count();
  auto seconds = since_epoch / 1000;
  auto millis = since_epoch % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::time_t time = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&time, &tm);

  char buf[32];
  snprintf(
    buf,
    sizeof(buf),
    "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
    tm.tm_year + 1900,
    tm.tm_mon + 1,
    tm.tm_mday,
    tm.tm_hour,
    tm.tm_min,
    tm.tm_sec,
    static_cast<int>(millis)
  );
  return buf;
}

std::optional<Timestamp> parseTimestamp(const std::string& text) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
  char zone = '\0';
  int consumed = 0;
  int fields = sscanf(
    text.c_str(),
    "%4d-%2d-%2dT%2d:%2d:%2d.%3d%c%n",
    &year,
    &month,
    &day,
    &hour,
    &minute,
    &second,
    &millis,
    &zone,
    &consumed
  );
  if (fields != 8 || zone != 'Z' || static_cast<size_t>(consumed) != text.size()) {
    return std::nullopt;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60 || millis < 0 || millis > 999) {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  std::time_t seconds = timegm(&tm);

  return Timestamp(std::chrono::milliseconds(static_cast<int64_t>(seconds) * 1000 + millis));
}

std::string transferStatusToString(TransferStatus status) {
  switch (status) {
    case TransferStatus::SUCCESS:
      return "Success";
    case TransferStatus::FAILED:
      return "Failed";
    default:
      return "Unknown";
  }
}

std::optional<TransferStatus> transferStatusFromString(const std::string& str) {
  if (str == "Success") return TransferStatus::SUCCESS;
  if (str == "Failed") return TransferStatus::FAILED;
  return std::nullopt;
}

std::string validationStatusToString(ValidationStatus status) {
  switch (status) {
    case ValidationStatus::VERIFIED:
      return "Verified";
    case ValidationStatus::MISMATCH:
      return "Mismatch";
    case ValidationStatus::UNREACHABLE:
      return "Unreachable";
    case ValidationStatus::NOT_APPLICABLE:
      return "NotApplicable";
    default:
      return "Unknown";
  }
}

std::optional<ValidationStatus> validationStatusFromString(const std::string& str) {
  if (str == "Verified") return ValidationStatus::VERIFIED;
  if (str == "Mismatch") return ValidationStatus::MISMATCH;
  if (str == "Unreachable") return ValidationStatus::UNREACHABLE;
  if (str == "NotApplicable") return ValidationStatus::NOT_APPLICABLE;
  return std::nullopt;
}

double TransferRecord::durationSeconds() const {
  if (end_time < start_time) {
    return 0.0;
  }
  return std::chrono::duration<double>(end_time - start_time).count();
}

bool TransferRecord::operator==(const TransferRecord& other) const {
  return file_name == other.file_name && source_path == other.source_path &&
         destination == other.destination && status == other.status &&
         start_time == other.start_time && end_time == other.end_time &&
         file_size_bytes == other.file_size_bytes &&
         validation_status == other.validation_status;
}

}  // namespace uploader
}  // namespace ferry
