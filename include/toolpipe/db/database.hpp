#pragma once

#include <toolpipe/core/result.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

struct sqlite3;

namespace toolpipe {

// ---------------------------------------------------------------------------
// Database: one open SQLite connection.
//
// Statements take positional `?` bindings as JSON scalars (null, bool,
// integer, float, string); arrays and objects are bound as their JSON text.
// Rows come back as JSON objects keyed by column name. All failures are
// Database errors carrying SQLite's message.
// ---------------------------------------------------------------------------
class Database {
public:
    static Result<std::unique_ptr<Database>, Error> Open(const std::string& path);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] Result<void, Error> Execute(
        std::string_view sql, const std::vector<nlohmann::json>& bindings = {});

    // Runs several ';'-separated statements without bindings.
    [[nodiscard]] Result<void, Error> ExecuteScript(const std::string& sql);

    // Array of row objects.
    [[nodiscard]] Result<nlohmann::json, Error> Query(
        std::string_view sql, const std::vector<nlohmann::json>& bindings = {});

    [[nodiscard]] Result<bool, Error> TableExists(const std::string& table);

    // Rows changed by the most recent INSERT/UPDATE/DELETE.
    [[nodiscard]] std::int64_t Changes() const;
    [[nodiscard]] std::int64_t LastInsertRowId() const;

    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

private:
    Database(sqlite3* handle, std::string path);

    sqlite3* handle_;
    std::string path_;
};

} // namespace toolpipe
