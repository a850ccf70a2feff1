// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_AUDIT_LOG_FORMAT_HPP
#define FERRY_AUDIT_LOG_FORMAT_HPP

#include <optional>
#include <string>
#include <vector>

#include "transfer_record.hpp"

namespace ferry {
namespace uploader {

/**
 * Audit log row format
 *
 * Comma separated, one physical line per record. A field is quoted when it
 * contains a comma, a quote, CR or LF, or has leading/trailing whitespace.
 * Inside quotes: `"` -> `""`, `\` -> `\\`, LF -> `\n`, CR -> `\r`.
 * Unquoted fields are taken literally.
 */
namespace audit_format {

constexpr char DELIMITER = ',';
constexpr char QUOTE = '"';
constexpr char ESCAPE = '\\';
constexpr size_t COLUMN_COUNT = 9;

/**
 * Column names, in file order
 */
const std::vector<std::string>& columns();

/**
 * Header row including the trailing newline
 */
std::string headerLine();

/**
 * Encode a single field value
 */
std::string encodeField(const std::string& value);

/**
 * Split one line (without the trailing newline) into decoded fields
 * @return Fields, or std::nullopt if quoting/escaping is malformed
 */
std::optional<std::vector<std::string>> splitLine(const std::string& line);

/**
 * Serialize a record as one row including the trailing newline
 */
std::string formatRecord(const TransferRecord& record);

/**
 * Parse a row produced by formatRecord()
 * @return Record, or std::nullopt if the row is malformed
 */
std::optional<TransferRecord> parseRecord(const std::string& line);

}  // namespace audit_format

/**
 * Read an audit log back into records.
 *
 * @param path Audit log path
 * @param strict Throw on a malformed row instead of skipping it. A row torn
 *               by an interrupted process is the only expected malformed row.
 * @return Records in file order
 * @throws std::runtime_error if the file cannot be read, the header does not
 *         match, or (strict) a row is malformed
 */
std::vector<TransferRecord> readAuditLog(const std::string& path, bool strict = true);

}  // namespace uploader
}  // namespace ferry

#endif  // FERRY_AUDIT_LOG_FORMAT_HPP
