#include "scru128/id/identifier.h"
#include "scru128/storage/sqlite/identifier_column.h"
#include "scru128/storage/sqlite/sqlite_db.h"

#include <catch2/catch.hpp>

#include <sqlite3.h>

#include <memory>
#include <string>
#include <vector>

using namespace scru128;
using storage::sqlite::ColumnEncoding;
using storage::sqlite::PreparedStatement;
using storage::sqlite::SqliteDb;

namespace {

std::shared_ptr<SqliteDb> make_db() {
  auto result = SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  auto db = result.value();
  auto created = db->exec("CREATE TABLE events (id_text TEXT, id_blob BLOB, note TEXT);");
  REQUIRE(created.has_value());
  return db;
}

void insert(SqliteDb& db, const id::Identifier& x, const std::string& note) {
  PreparedStatement stmt(db.connection(),
                         "INSERT INTO events (id_text, id_blob, note) VALUES (?, ?, ?);");
  REQUIRE(stmt.is_valid());
  REQUIRE(storage::sqlite::bind_identifier(stmt.get(), 1, x, ColumnEncoding::kText).has_value());
  REQUIRE(storage::sqlite::bind_identifier(stmt.get(), 2, x, ColumnEncoding::kBlob).has_value());
  REQUIRE(sqlite3_bind_text(stmt.get(), 3, note.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK);
  REQUIRE(sqlite3_step(stmt.get()) == SQLITE_DONE);
}

}  // namespace

TEST_CASE("identifiers round-trip through TEXT and BLOB columns", "[sqlite]") {
  auto db = make_db();
  const auto x = id::Identifier::from_fields(1'700'000'000'000ULL, 0x010203, 0x040506, 7);
  insert(*db, x, "only");

  PreparedStatement stmt(db->connection(),
                         "SELECT id_text, id_blob, typeof(id_text), typeof(id_blob) FROM events;");
  REQUIRE(stmt.is_valid());
  REQUIRE(sqlite3_step(stmt.get()) == SQLITE_ROW);

  CHECK(std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 2))) ==
        "text");
  CHECK(std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), 3))) ==
        "blob");

  const auto from_text = storage::sqlite::scan_identifier(stmt.get(), 0);
  REQUIRE(from_text.has_value());
  CHECK(from_text.value() == x);

  const auto from_blob = storage::sqlite::scan_identifier(stmt.get(), 1);
  REQUIRE(from_blob.has_value());
  CHECK(from_blob.value() == x);
}

TEST_CASE("ORDER BY on either encoding follows identifier order", "[sqlite]") {
  auto db = make_db();
  const std::vector<id::Identifier> ascending = {
      id::Identifier::from_fields(1, 0, 0, 0),
      id::Identifier::from_fields(1, 0, 0, 1),
      id::Identifier::from_fields(1, 0, 1, 0),
      id::Identifier::from_fields(2, 0, 0, 0),
      id::Identifier::max(),
  };
  for (auto it = ascending.rbegin(); it != ascending.rend(); ++it) {
    insert(*db, *it, "row");
  }

  for (const char* column : {"id_text", "id_blob"}) {
    CAPTURE(column);
    PreparedStatement stmt(db->connection(),
                           std::string("SELECT ") + column + " FROM events ORDER BY " + column +
                               ";");
    REQUIRE(stmt.is_valid());

    std::vector<id::Identifier> scanned;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
      const auto x = storage::sqlite::scan_identifier(stmt.get(), 0);
      REQUIRE(x.has_value());
      scanned.push_back(x.value());
    }
    CHECK(scanned == ascending);
  }
}

TEST_CASE("scan_identifier accepts text stored in a BLOB", "[sqlite]") {
  auto db = make_db();
  PreparedStatement stmt(db->connection(), "SELECT CAST(? AS BLOB);");
  REQUIRE(stmt.is_valid());
  const std::string text = "036Z8PUQ4TSXSIGK6O19Y164Q";
  REQUIRE(sqlite3_bind_text(stmt.get(), 1, text.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK);
  REQUIRE(sqlite3_step(stmt.get()) == SQLITE_ROW);
  REQUIRE(sqlite3_column_type(stmt.get(), 0) == SQLITE_BLOB);

  const auto x = storage::sqlite::scan_identifier(stmt.get(), 0);
  REQUIRE(x.has_value());
  CHECK(x.value().to_string() == "036z8puq4tsxsigk6o19y164q");
}

TEST_CASE("scan_identifier rejects values that cannot hold an identifier", "[sqlite]") {
  auto db = make_db();

  SECTION("NULL, INTEGER and REAL") {
    PreparedStatement stmt(db->connection(), "SELECT NULL, 42, 1.5;");
    REQUIRE(stmt.is_valid());
    REQUIRE(sqlite3_step(stmt.get()) == SQLITE_ROW);
    for (int col = 0; col < 3; ++col) {
      CAPTURE(col);
      const auto x = storage::sqlite::scan_identifier(stmt.get(), col);
      REQUIRE_FALSE(x.has_value());
      CHECK(x.error() == core::ParseError::kUnsupportedValue);
    }
  }

  SECTION("malformed text and wrong-sized blobs") {
    PreparedStatement stmt(db->connection(), "SELECT 'not-an-id', x'0102';");
    REQUIRE(stmt.is_valid());
    REQUIRE(sqlite3_step(stmt.get()) == SQLITE_ROW);

    const auto text = storage::sqlite::scan_identifier(stmt.get(), 0);
    REQUIRE_FALSE(text.has_value());
    CHECK(text.error() == core::ParseError::kInvalidLength);

    const auto blob = storage::sqlite::scan_identifier(stmt.get(), 1);
    REQUIRE_FALSE(blob.has_value());
    CHECK(blob.error() == core::ParseError::kInvalidLength);
  }
}

TEST_CASE("bind_identifier reports SQLite errors", "[sqlite]") {
  auto db = make_db();
  PreparedStatement stmt(db->connection(), "SELECT ?;");
  REQUIRE(stmt.is_valid());

  const auto result = storage::sqlite::bind_identifier(stmt.get(), 5, id::Identifier::min(),
                                                       ColumnEncoding::kText);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().find("Failed to bind identifier") != std::string::npos);
}
