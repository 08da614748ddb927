#include <catch2/catch.hpp>
#include <shortguid/sqlite.hpp>
#include <sqlite3.h>
#include <string>

using namespace shortguid;

// In-memory database with a single two-column table.
struct TestDb {
    sqlite3* db = nullptr;

    TestDb() {
        REQUIRE(sqlite3_open(":memory:", &db) == SQLITE_OK);
        REQUIRE(sqlite3_exec(db, "CREATE TABLE ids (k INTEGER PRIMARY KEY, v)",
                             nullptr, nullptr, nullptr) == SQLITE_OK);
    }
    ~TestDb() { sqlite3_close(db); }

    sqlite3_stmt* prepare(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        REQUIRE(sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) == SQLITE_OK);
        return stmt;
    }

    void exec(const char* sql) {
        REQUIRE(sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK);
    }

    Result<ShortGuid> read(int key) {
        sqlite3_stmt* stmt = prepare("SELECT v FROM ids WHERE k = ?");
        sqlite3_bind_int(stmt, 1, key);
        REQUIRE(sqlite3_step(stmt) == SQLITE_ROW);
        auto r = sqlite::column(stmt, 0);
        sqlite3_finalize(stmt);
        return r;
    }

    std::string type_of(int key) {
        sqlite3_stmt* stmt = prepare("SELECT typeof(v) FROM ids WHERE k = ?");
        sqlite3_bind_int(stmt, 1, key);
        REQUIRE(sqlite3_step(stmt) == SQLITE_ROW);
        std::string t = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        sqlite3_finalize(stmt);
        return t;
    }
};

static void insert(TestDb& t, int key, const ShortGuid& id, bool as_blob) {
    sqlite3_stmt* stmt = t.prepare("INSERT INTO ids (k, v) VALUES (?, ?)");
    sqlite3_bind_int(stmt, 1, key);
    auto st = as_blob ? sqlite::bind_blob(stmt, 2, id) : sqlite::bind_text(stmt, 2, id);
    REQUIRE(st.is_ok());
    REQUIRE(sqlite3_step(stmt) == SQLITE_DONE);
    sqlite3_finalize(stmt);
}

TEST_CASE("bind_text stores the short form", "[sqlite]") {
    TestDb t;
    auto id = ShortGuid::try_parse("c9a646d3-9c61-4cb7-bfcd-ee2522c8f633").value();
    insert(t, 1, id, false);

    REQUIRE(t.type_of(1) == "text");
    auto back = t.read(1);
    REQUIRE(back.is_ok());
    REQUIRE(back.value() == id);

    sqlite3_stmt* stmt = t.prepare("SELECT v FROM ids WHERE k = 1");
    REQUIRE(sqlite3_step(stmt) == SQLITE_ROW);
    std::string text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    sqlite3_finalize(stmt);
    REQUIRE(text == "yaZG05xhTLe_ze4lIsj2Mw");
}

TEST_CASE("bind_blob stores 16 raw bytes", "[sqlite]") {
    TestDb t;
    auto id = ShortGuid::try_parse("a1a2a3a4-b1b2-c1c2-d1d2-d3d4d5d6d7d8").value();
    insert(t, 1, id, true);

    REQUIRE(t.type_of(1) == "blob");
    auto back = t.read(1);
    REQUIRE(back.is_ok());
    REQUIRE(back.value() == id);
}

TEST_CASE("column accepts long text forms", "[sqlite]") {
    TestDb t;
    t.exec("INSERT INTO ids VALUES (1, 'c9a646d3-9c61-4cb7-bfcd-ee2522c8f633')");
    t.exec("INSERT INTO ids VALUES (2, 'c9a646d39c614cb7bfcdee2522c8f633')");
    REQUIRE(t.read(1).value() == "yaZG05xhTLe_ze4lIsj2Mw");
    REQUIRE(t.read(2).value() == "yaZG05xhTLe_ze4lIsj2Mw");
}

TEST_CASE("column rejects bad values", "[sqlite]") {
    TestDb t;
    t.exec("INSERT INTO ids VALUES (1, NULL)");
    t.exec("INSERT INTO ids VALUES (2, 42)");
    t.exec("INSERT INTO ids VALUES (3, X'0102')");
    t.exec("INSERT INTO ids VALUES (4, 'yaZG05xhTLe/ze4lIsj2Mw')");
    t.exec("INSERT INTO ids VALUES (5, X'')");

    REQUIRE(t.read(1).is_err(ShortGuidError::NotFound));
    REQUIRE(t.read(2).is_err(ShortGuidError::InvalidEncoding));
    REQUIRE(t.read(3).is_err(ShortGuidError::InvalidLength));
    REQUIRE(t.read(4).is_err(ShortGuidError::InvalidEncoding));
    REQUIRE(t.read(5).is_err(ShortGuidError::InvalidLength));
}

TEST_CASE("bind reports SQLite errors", "[sqlite]") {
    TestDb t;
    sqlite3_stmt* stmt = t.prepare("SELECT ?");
    auto st = sqlite::bind_text(stmt, 5, ShortGuid());
    sqlite3_finalize(stmt);
    REQUIRE(st.is_err(ShortGuidError::IO));
    REQUIRE(st.error().message.find("parameter 5") != std::string::npos);
}
