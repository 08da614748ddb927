#include <shortguid/sqlite.hpp>
#include <sqlite3.h>
#include <string>
#include <string_view>

namespace shortguid::sqlite {

static Status check_bind(int rc, int index) {
    if (rc != SQLITE_OK) {
        return ShortGuidError(ShortGuidError::IO,
            "SQLite bind failed for parameter " + std::to_string(index)
                + ": " + sqlite3_errstr(rc));
    }
    return ok_status();
}

Status bind_text(sqlite3_stmt* stmt, int index, const ShortGuid& id) {
    std::string text = id.to_string();
    int rc = sqlite3_bind_text(stmt, index, text.c_str(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    return check_bind(rc, index);
}

Status bind_blob(sqlite3_stmt* stmt, int index, const ShortGuid& id) {
    const Bytes& bytes = id.as_bytes();
    int rc = sqlite3_bind_blob(stmt, index, bytes.data(),
                               static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
    return check_bind(rc, index);
}

Result<ShortGuid> column(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_TEXT: {
            auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            int len = sqlite3_column_bytes(stmt, col);
            return ShortGuid::try_parse(std::string_view(text, static_cast<size_t>(len)));
        }
        case SQLITE_BLOB: {
            auto data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
            int len = sqlite3_column_bytes(stmt, col);
            if (!data) {
                return ShortGuidError(ShortGuidError::InvalidLength,
                    "Invalid slice; expected 16 bytes, got 0");
            }
            return ShortGuid::from_slice(data, static_cast<size_t>(len));
        }
        case SQLITE_NULL:
            return ShortGuidError(ShortGuidError::NotFound,
                "column " + std::to_string(col) + " is NULL");
        default:
            return ShortGuidError(ShortGuidError::InvalidEncoding,
                "column " + std::to_string(col) + " holds a number, not an ID",
                "store IDs as TEXT or as a 16-byte BLOB");
    }
}

} // namespace shortguid::sqlite
