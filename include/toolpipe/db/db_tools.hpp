#pragma once

#include <toolpipe/core/result.hpp>
#include <toolpipe/db/database.hpp>
#include <toolpipe/protocol/tool_registry.hpp>

#include <string_view>

namespace toolpipe {

// Creates the users and todos tables and inserts the sample rows, unless a
// users table already exists. Returns true when the database was seeded.
[[nodiscard]] Result<bool, Error> CreateDatabase(Database& db);

// Registers list_db_tables, get_table_schema, query_db_table, insert_data
// and delete_data, in that order. The handlers keep a reference to db.
[[nodiscard]] Result<void, Error> RegisterDatabaseTools(ToolRegistry& registry,
                                                        Database& db);

// ASCII letters, digits and '_', not starting with a digit.
[[nodiscard]] bool IsSqlIdentifier(std::string_view name);

} // namespace toolpipe
