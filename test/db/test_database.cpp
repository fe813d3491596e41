#include <catch2/catch_test_macros.hpp>

#include <toolpipe/db/database.hpp>

#include <nlohmann/json.hpp>

using namespace toolpipe;
using json = nlohmann::json;

namespace {

std::unique_ptr<Database> OpenMemory() {
    auto db = Database::Open(":memory:");
    REQUIRE(db.IsOk());
    return std::move(db).Value();
}

} // anonymous namespace

TEST_CASE("Database: opens an in-memory database", "[db]") {
    auto db = OpenMemory();
    CHECK(db->Path() == ":memory:");

    auto exists = db->TableExists("users");
    REQUIRE(exists.IsOk());
    CHECK_FALSE(exists.Value());
}

TEST_CASE("Database: unopenable path is a database error", "[db]") {
    auto db = Database::Open("/nonexistent-dir/sub/toolpipe.db");
    REQUIRE(db.IsErr());
    CHECK(db.Error().category == ErrorCategory::Database);
    CHECK(db.Error().ExitCode() == 6);
}

TEST_CASE("Database: bound values come back with their types", "[db]") {
    auto db = OpenMemory();
    REQUIRE(db->ExecuteScript("CREATE TABLE t (i INTEGER, r REAL, s TEXT, n TEXT, b INTEGER, j TEXT);")
                .IsOk());

    REQUIRE(db->Execute("INSERT INTO t VALUES (?, ?, ?, ?, ?, ?);",
                        {json(42), json(2.5), json("text"), json(nullptr), json(true),
                         json{{"k", 1}}})
                .IsOk());
    CHECK(db->Changes() == 1);
    CHECK(db->LastInsertRowId() == 1);

    auto rows = db->Query("SELECT * FROM t;");
    REQUIRE(rows.IsOk());
    REQUIRE(rows.Value().size() == 1);
    const auto& row = rows.Value()[0];
    CHECK(row["i"] == 42);
    CHECK(row["r"] == 2.5);
    CHECK(row["s"] == "text");
    CHECK(row["n"].is_null());
    CHECK(row["b"] == 1);
    CHECK(row["j"] == R"({"k":1})");
}

TEST_CASE("Database: query with bindings filters rows", "[db]") {
    auto db = OpenMemory();
    REQUIRE(db->ExecuteScript("CREATE TABLE t (id INTEGER, name TEXT);"
                              "INSERT INTO t VALUES (1, 'a'), (2, 'b'), (3, 'c');")
                .IsOk());

    auto rows = db->Query("SELECT name FROM t WHERE id >= ? ORDER BY id;", {json(2)});
    REQUIRE(rows.IsOk());
    CHECK(rows.Value() == json::array({{{"name", "b"}}, {{"name", "c"}}}));
}

TEST_CASE("Database: SQL errors carry SQLite's message", "[db]") {
    auto db = OpenMemory();

    auto bad = db->Query("SELECT * FROM nowhere;");
    REQUIRE(bad.IsErr());
    CHECK(bad.Error().category == ErrorCategory::Database);
    CHECK(bad.Error().message.find("no such table: nowhere") != std::string::npos);

    auto script = db->ExecuteScript("CREATE TABLE x (;");
    REQUIRE(script.IsErr());
    CHECK(script.Error().operation == "Database::ExecuteScript");
}

TEST_CASE("Database: constraint violations fail Execute", "[db]") {
    auto db = OpenMemory();
    REQUIRE(db->ExecuteScript("CREATE TABLE u (email TEXT UNIQUE NOT NULL);").IsOk());
    REQUIRE(db->Execute("INSERT INTO u VALUES (?);", {json("a@example.com")}).IsOk());

    auto dup = db->Execute("INSERT INTO u VALUES (?);", {json("a@example.com")});
    REQUIRE(dup.IsErr());
    CHECK(dup.Error().message.find("UNIQUE") != std::string::npos);
}
