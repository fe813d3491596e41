#include <toolpipe/db/database.hpp>

#include <toolpipe/core/log.hpp>

#include <sqlite3.h>

namespace toolpipe {

namespace {

constexpr const char* kComponent = "database";

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Error DatabaseError(const std::string& operation, const std::string& message) {
    return Error::Make(ErrorCategory::Database, operation, message);
}

Result<StatementPtr, Error> Prepare(sqlite3* db, std::string_view sql,
                                    const std::vector<nlohmann::json>& bindings) {
    sqlite3_stmt* raw = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()),
                                      &raw, nullptr);
    StatementPtr stmt(raw);
    if (rc != SQLITE_OK) {
        return Result<StatementPtr, Error>::Err(
            DatabaseError("Database::Prepare", sqlite3_errmsg(db)));
    }

    for (std::size_t i = 0; i < bindings.size(); ++i) {
        const auto& value = bindings[i];
        const int index = static_cast<int>(i) + 1;
        int bound = SQLITE_OK;
        if (value.is_null()) {
            bound = sqlite3_bind_null(stmt.get(), index);
        } else if (value.is_boolean()) {
            bound = sqlite3_bind_int(stmt.get(), index, value.get<bool>() ? 1 : 0);
        } else if (value.is_number_integer()) {
            bound = sqlite3_bind_int64(stmt.get(), index,
                                       static_cast<sqlite3_int64>(value.get<std::int64_t>()));
        } else if (value.is_number_float()) {
            bound = sqlite3_bind_double(stmt.get(), index, value.get<double>());
        } else {
            const auto text = value.is_string() ? value.get<std::string>()
                                                : value.dump();
            bound = sqlite3_bind_text(stmt.get(), index, text.c_str(),
                                      static_cast<int>(text.size()), SQLITE_TRANSIENT);
        }
        if (bound != SQLITE_OK) {
            return Result<StatementPtr, Error>::Err(
                DatabaseError("Database::Bind", sqlite3_errmsg(db)));
        }
    }
    return Result<StatementPtr, Error>::Ok(std::move(stmt));
}

nlohmann::json ColumnValue(sqlite3_stmt* stmt, int column) {
    switch (sqlite3_column_type(stmt, column)) {
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt, column));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, column);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(
                sqlite3_column_text(stmt, column));
            return std::string(text, static_cast<std::size_t>(
                                         sqlite3_column_bytes(stmt, column)));
        }
        case SQLITE_BLOB:
            return "<blob " + std::to_string(sqlite3_column_bytes(stmt, column)) +
                   " bytes>";
        default:
            return nullptr;
    }
}

} // anonymous namespace

Result<std::unique_ptr<Database>, Error> Database::Open(const std::string& path) {
    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &handle,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                   nullptr);
    if (rc != SQLITE_OK) {
        std::string message = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return Result<std::unique_ptr<Database>, Error>::Err(DatabaseError(
            "Database::Open", "Cannot open '" + path + "': " + message));
    }
    sqlite3_extended_result_codes(handle, 1);
    LogInfo(kComponent, "Opened " + path);

    std::unique_ptr<Database> db(new Database(handle, path));
    auto fk = db->Execute("PRAGMA foreign_keys = ON;");
    if (fk.IsErr()) {
        return Result<std::unique_ptr<Database>, Error>::Err(fk.Error());
    }
    return Result<std::unique_ptr<Database>, Error>::Ok(std::move(db));
}

Database::Database(sqlite3* handle, std::string path)
    : handle_(handle), path_(std::move(path)) {}

Database::~Database() {
    sqlite3_close(handle_);
}

Result<void, Error> Database::Execute(std::string_view sql,
                                      const std::vector<nlohmann::json>& bindings) {
    auto stmt = Prepare(handle_, sql, bindings);
    if (stmt.IsErr()) return Result<void, Error>::Err(stmt.Error());

    int rc = SQLITE_ROW;
    while (rc == SQLITE_ROW) {
        rc = sqlite3_step(stmt.Value().get());
    }
    if (rc != SQLITE_DONE) {
        return Result<void, Error>::Err(
            DatabaseError("Database::Execute", sqlite3_errmsg(handle_)));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> Database::ExecuteScript(const std::string& sql) {
    char* message = nullptr;
    const int rc = sqlite3_exec(handle_, sql.c_str(), nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string text = message ? message : sqlite3_errstr(rc);
        sqlite3_free(message);
        return Result<void, Error>::Err(DatabaseError("Database::ExecuteScript", text));
    }
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> Database::Query(
    std::string_view sql, const std::vector<nlohmann::json>& bindings) {
    auto prepared = Prepare(handle_, sql, bindings);
    if (prepared.IsErr()) {
        return Result<nlohmann::json, Error>::Err(prepared.Error());
    }
    sqlite3_stmt* stmt = prepared.Value().get();

    nlohmann::json rows = nlohmann::json::array();
    const int columns = sqlite3_column_count(stmt);
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        nlohmann::json row = nlohmann::json::object();
        for (int c = 0; c < columns; ++c) {
            row[sqlite3_column_name(stmt, c)] = ColumnValue(stmt, c);
        }
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        return Result<nlohmann::json, Error>::Err(
            DatabaseError("Database::Query", sqlite3_errmsg(handle_)));
    }
    return Result<nlohmann::json, Error>::Ok(std::move(rows));
}

Result<bool, Error> Database::TableExists(const std::string& table) {
    auto rows = Query("SELECT name FROM sqlite_master WHERE type='table' AND name=?;",
                      {nlohmann::json(table)});
    if (rows.IsErr()) return Result<bool, Error>::Err(rows.Error());
    return Result<bool, Error>::Ok(!rows.Value().empty());
}

std::int64_t Database::Changes() const {
    return sqlite3_changes(handle_);
}

std::int64_t Database::LastInsertRowId() const {
    return sqlite3_last_insert_rowid(handle_);
}

} // namespace toolpipe
