#pragma once

#include "scru128/core/result.h"
#include "scru128/id/identifier.h"

#include <string>

struct sqlite3_stmt;

namespace scru128::storage::sqlite {

// ColumnEncoding selects how an identifier is stored in a column.
// Both encodings sort in identifier order under SQLite's default BINARY collation / memcmp.
enum class ColumnEncoding {
  kText,  // 25-digit canonical string (TEXT)
  kBlob,  // 16 raw bytes (BLOB)
};

// bind_identifier binds id to the 1-based parameter `index` of stmt.
// Returns the SQLite error message on failure.
[[nodiscard]] core::Result<bool, std::string> bind_identifier(sqlite3_stmt* stmt, int index,
                                                              const id::Identifier& id,
                                                              ColumnEncoding encoding);

// scan_identifier reads the 0-based result `column` of the current row.
//
// Accepts:
//   TEXT -> 25-digit text form (either letter case)
//   BLOB -> 16 raw bytes, or the 25-digit text form stored as bytes
// Rejects with ParseError::kUnsupportedValue: NULL, INTEGER, FLOAT.
[[nodiscard]] core::Result<id::Identifier, core::ParseError> scan_identifier(sqlite3_stmt* stmt,
                                                                            int column);

}  // namespace scru128::storage::sqlite
