#include "scru128/storage/sqlite/identifier_column.h"

#include <sqlite3.h>

#include <cstdint>
#include <span>
#include <string_view>

namespace scru128::storage::sqlite {

core::Result<bool, std::string> bind_identifier(sqlite3_stmt* stmt, int index,
                                                const id::Identifier& id,
                                                ColumnEncoding encoding) {
  int rc = SQLITE_OK;
  switch (encoding) {
    case ColumnEncoding::kText: {
      const std::string text = id.to_string();
      rc = sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()),
                             SQLITE_TRANSIENT);
      break;
    }
    case ColumnEncoding::kBlob:
      rc = sqlite3_bind_blob(stmt, index, id.bytes().data(), static_cast<int>(id.bytes().size()),
                             SQLITE_TRANSIENT);
      break;
  }

  if (rc != SQLITE_OK) {
    return core::Result<bool, std::string>::err("Failed to bind identifier: " +
                                                std::string(sqlite3_errstr(rc)));
  }
  return core::Result<bool, std::string>::ok(true);
}

core::Result<id::Identifier, core::ParseError> scan_identifier(sqlite3_stmt* stmt, int column) {
  switch (sqlite3_column_type(stmt, column)) {
    case SQLITE_TEXT: {
      const auto* raw = sqlite3_column_text(stmt, column);
      const int size = sqlite3_column_bytes(stmt, column);
      const std::string_view text(reinterpret_cast<const char*>(raw),  // NOLINT
                                  static_cast<std::size_t>(size));
      return id::Identifier::from_string(text);
    }
    case SQLITE_BLOB: {
      const auto* raw = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, column));
      const int size = sqlite3_column_bytes(stmt, column);
      return id::Identifier::from_bytes(
          std::span<const std::uint8_t>(raw, static_cast<std::size_t>(size)));
    }
    default:
      return core::Result<id::Identifier, core::ParseError>::err(
          core::ParseError::kUnsupportedValue);
  }
}

}  // namespace scru128::storage::sqlite
