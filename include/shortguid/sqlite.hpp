#pragma once

#include <shortguid/short_guid.hpp>

struct sqlite3_stmt;

// Binding ShortGuid values to prepared SQLite statements.
namespace shortguid::sqlite {

// 22-character TEXT value.
Status bind_text(sqlite3_stmt* stmt, int index, const ShortGuid& id);

// 16-byte BLOB in big-endian field order.
Status bind_blob(sqlite3_stmt* stmt, int index, const ShortGuid& id);

// Reads column `col` of the current row. TEXT accepts any of the three
// text forms, BLOB must be 16 bytes, NULL is NotFound.
Result<ShortGuid> column(sqlite3_stmt* stmt, int col);

} // namespace shortguid::sqlite
