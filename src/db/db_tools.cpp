#include <toolpipe/db/db_tools.hpp>

#include <toolpipe/core/log.hpp>

#include <cctype>
#include <string>
#include <vector>

namespace toolpipe {

namespace {

constexpr const char* kComponent = "db_tools";

using json = nlohmann::json;
using ToolResult = Result<json, Error>;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::string Trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

void RequireIdentifier(const std::string& what, const std::string& name) {
    if (!IsSqlIdentifier(name)) {
        throw DomainError("Invalid " + what + " '" + name +
                          "': only letters, digits and '_' are allowed");
    }
}

// "id, name" -> "id, name"; "" or "*" -> "*". Each entry must be an
// identifier.
std::string ColumnList(const std::string& columns) {
    const auto trimmed = Trim(columns);
    if (trimmed.empty() || trimmed == "*") return "*";

    std::string out;
    std::size_t start = 0;
    while (start <= trimmed.size()) {
        auto comma = trimmed.find(',', start);
        if (comma == std::string::npos) comma = trimmed.size();
        const auto column = Trim(trimmed.substr(start, comma - start));
        RequireIdentifier("column name", column);
        if (!out.empty()) out += ", ";
        out += column;
        start = comma + 1;
    }
    return out;
}

std::string OptionalString(const json& params, const char* key) {
    if (!params.contains(key)) return "";
    return params[key].get<std::string>();
}

json Outcome(bool success, std::string message) {
    return json{{"success", success}, {"message", std::move(message)}};
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

ToolResult HandleListTables(Database& db, const json& /*params*/) {
    auto rows = db.Query(
        "SELECT name FROM sqlite_master WHERE type='table';");
    if (rows.IsErr()) {
        auto result = Outcome(false, "Error listing tables: " + rows.Error().message);
        result["tables"] = json::array();
        return ToolResult::Ok(std::move(result));
    }

    json tables = json::array();
    for (const auto& row : rows.Value()) {
        tables.push_back(row["name"]);
    }
    auto result = Outcome(true, "Tables listed successfully.");
    result["tables"] = std::move(tables);
    return ToolResult::Ok(std::move(result));
}

ToolResult HandleGetTableSchema(Database& db, const json& params) {
    const auto table = params["table_name"].get<std::string>();
    auto rows = db.Query("SELECT name, type FROM pragma_table_info(?);",
                         {json(table)});
    if (rows.IsErr()) {
        return ToolResult::Err(rows.Error());
    }
    if (rows.Value().empty()) {
        throw DomainError("Table '" + table +
                          "' not found or no schema information.");
    }

    json columns = json::array();
    for (const auto& row : rows.Value()) {
        columns.push_back({{"name", row["name"]}, {"type", row["type"]}});
    }
    return ToolResult::Ok(json{{"table_name", table}, {"columns", std::move(columns)}});
}

ToolResult HandleQueryTable(Database& db, const json& params) {
    const auto table = params["table_name"].get<std::string>();
    RequireIdentifier("table name", table);
    const auto columns = ColumnList(OptionalString(params, "columns"));
    const auto condition = Trim(OptionalString(params, "condition"));

    std::string sql = "SELECT " + columns + " FROM " + table;
    if (!condition.empty()) sql += " WHERE " + condition;
    sql += ";";

    LogDebug(kComponent, sql);
    auto rows = db.Query(sql);
    if (rows.IsErr()) {
        throw DomainError("Error querying table '" + table + "': " +
                          rows.Error().message);
    }
    return rows;
}

ToolResult HandleInsertData(Database& db, const json& params) {
    const auto table = params["table_name"].get<std::string>();
    const auto& data = params["data"];
    if (data.empty()) {
        return ToolResult::Ok(Outcome(false, "No data provided for insertion."));
    }
    RequireIdentifier("table name", table);

    std::string columns;
    std::string placeholders;
    std::vector<json> values;
    for (auto it = data.begin(); it != data.end(); ++it) {
        RequireIdentifier("column name", it.key());
        if (!columns.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += it.key();
        placeholders += "?";
        values.push_back(it.value());
    }

    const auto sql = "INSERT INTO " + table + " (" + columns + ") VALUES (" +
                     placeholders + ");";
    auto inserted = db.Execute(sql, values);
    if (inserted.IsErr()) {
        LogWarn(kComponent, inserted.Error().ToString());
        return ToolResult::Ok(Outcome(false, "Error inserting data into table '" +
                                                 table + "': " +
                                                 inserted.Error().message));
    }

    const auto row_id = db.LastInsertRowId();
    auto result = Outcome(true, "Data inserted successfully. Row ID: " +
                                    std::to_string(row_id));
    result["row_id"] = row_id;
    return ToolResult::Ok(std::move(result));
}

ToolResult HandleDeleteData(Database& db, const json& params) {
    const auto table = params["table_name"].get<std::string>();
    const auto condition = Trim(params["condition"].get<std::string>());
    if (condition.empty()) {
        return ToolResult::Ok(Outcome(
            false, "Deletion condition cannot be empty. This is a safety measure "
                   "to prevent accidental deletion of all rows."));
    }
    RequireIdentifier("table name", table);

    auto deleted = db.Execute("DELETE FROM " + table + " WHERE " + condition + ";");
    if (deleted.IsErr()) {
        LogWarn(kComponent, deleted.Error().ToString());
        return ToolResult::Ok(Outcome(false, "Error deleting data from table '" +
                                                 table + "': " +
                                                 deleted.Error().message));
    }

    const auto rows = db.Changes();
    auto result = Outcome(true, std::to_string(rows) +
                                    " row(s) deleted successfully from table '" +
                                    table + "'.");
    result["rows_deleted"] = rows;
    return ToolResult::Ok(std::move(result));
}

// ---------------------------------------------------------------------------
// Seed data
// ---------------------------------------------------------------------------

constexpr const char* kSchemaSql = R"sql(
CREATE TABLE IF NOT EXISTS users (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    username TEXT NOT NULL,
    email TEXT UNIQUE NOT NULL
);
CREATE TABLE IF NOT EXISTS todos (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id INTEGER NOT NULL,
    task TEXT NOT NULL,
    completed BOOLEAN NOT NULL DEFAULT 0,
    FOREIGN KEY (user_id) REFERENCES users (id)
);
)sql";

struct SeedUser {
    const char* username;
    const char* email;
};

struct SeedTodo {
    int user_id;
    const char* task;
    bool completed;
};

const SeedUser kSeedUsers[] = {
    {"user1", "user1@example.com"},
    {"user2", "user2@example.com"},
};

const SeedTodo kSeedTodos[] = {
    {1, "Complete MCP project", false},
    {1, "Read about SQL injection", true},
    {2, "Buy groceries", false},
};

Result<void, Error> Seed(Database& db) {
    auto schema = db.ExecuteScript(kSchemaSql);
    if (schema.IsErr()) return schema;

    for (const auto& user : kSeedUsers) {
        auto r = db.Execute("INSERT INTO users (username, email) VALUES (?, ?);",
                            {json(user.username), json(user.email)});
        if (r.IsErr()) return r;
    }
    for (const auto& todo : kSeedTodos) {
        auto r = db.Execute(
            "INSERT INTO todos (user_id, task, completed) VALUES (?, ?, ?);",
            {json(todo.user_id), json(todo.task), json(todo.completed)});
        if (r.IsErr()) return r;
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

bool IsSqlIdentifier(std::string_view name) {
    if (name.empty()) return false;
    if (std::isdigit(static_cast<unsigned char>(name.front()))) return false;
    for (char c : name) {
        const auto u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && c != '_') return false;
    }
    return true;
}

Result<bool, Error> CreateDatabase(Database& db) {
    auto exists = db.TableExists("users");
    if (exists.IsErr()) return Result<bool, Error>::Err(exists.Error());
    if (exists.Value()) {
        LogInfo(kComponent, "Database " + db.Path() + " already initialized");
        return Result<bool, Error>::Ok(false);
    }

    auto begin = db.ExecuteScript("BEGIN;");
    if (begin.IsErr()) return Result<bool, Error>::Err(begin.Error());

    auto seeded = Seed(db);
    if (seeded.IsErr()) {
        auto rollback = db.ExecuteScript("ROLLBACK;");
        if (rollback.IsErr()) {
            LogError(kComponent, "Rollback failed: " + rollback.Error().message);
        }
        return Result<bool, Error>::Err(seeded.Error());
    }

    auto commit = db.ExecuteScript("COMMIT;");
    if (commit.IsErr()) return Result<bool, Error>::Err(commit.Error());

    LogInfo(kComponent, "Created and seeded database " + db.Path());
    return Result<bool, Error>::Ok(true);
}

Result<void, Error> RegisterDatabaseTools(ToolRegistry& registry, Database& db) {
    auto r = registry.Register(
        "list_db_tables",
        "Lists all tables in the SQLite database. "
        "Returns {success, message, tables}.",
        InputSchema().Required("dummy_param", FieldType::String,
                               "Not used; any non-empty string."),
        [&db](const json& params) { return HandleListTables(db, params); });
    if (r.IsErr()) return r;

    r = registry.Register(
        "get_table_schema",
        "Gets the column names and types of a table.",
        InputSchema().Required("table_name", FieldType::String,
                               "Name of the table"),
        [&db](const json& params) { return HandleGetTableSchema(db, params); });
    if (r.IsErr()) return r;

    r = registry.Register(
        "query_db_table",
        "Queries a table and returns the matching rows as objects.",
        InputSchema()
            .Required("table_name", FieldType::String, "Name of the table")
            .Optional("columns", FieldType::String,
                      "Comma-separated columns (e.g., \"id, name\"); default *")
            .Optional("condition", FieldType::String,
                      "SQL WHERE condition (e.g., \"completed = 0\")"),
        [&db](const json& params) { return HandleQueryTable(db, params); });
    if (r.IsErr()) return r;

    r = registry.Register(
        "insert_data",
        "Inserts one row. Keys of data are column names. "
        "Returns {success, message, row_id}.",
        InputSchema()
            .Required("table_name", FieldType::String, "Name of the table")
            .Required("data", FieldType::Object, "Column name to value"),
        [&db](const json& params) { return HandleInsertData(db, params); });
    if (r.IsErr()) return r;

    r = registry.Register(
        "delete_data",
        "Deletes the rows matching a non-empty SQL WHERE condition. "
        "Returns {success, message, rows_deleted}.",
        InputSchema()
            .Required("table_name", FieldType::String, "Name of the table")
            .Required("condition", FieldType::String,
                      "SQL WHERE condition; must not be empty"),
        [&db](const json& params) { return HandleDeleteData(db, params); });
    if (r.IsErr()) return r;

    LogInfo(kComponent, "Registered " + std::to_string(registry.Size()) + " tools");
    return Result<void, Error>::Ok();
}

} // namespace toolpipe
