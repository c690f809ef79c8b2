#include "db/sqlite/sqlite_connection.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlmcp {

// ============================================================================
// SqliteConnection
// ============================================================================

SqliteConnection::SqliteConnection(sqlite3* db)
    : db_(db) {}

SqliteConnection::~SqliteConnection() {
    close();
}

DbResultSet SqliteConnection::execute(const std::string& sql) {
    if (!db_) {
        return DbResultSet::error("Connection is null");
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return DbResultSet::error(std::move(error));
    }

    DbResultSet result;

    // Empty input or comment-only input compiles to no statement
    if (!stmt) {
        result.success = true;
        return result;
    }

    const int ncols = sqlite3_column_count(stmt);
    for (int i = 0; i < ncols; i++) {
        const char* name = sqlite3_column_name(stmt, i);
        result.column_names.emplace_back(name ? name : "");
    }

    const auto changes_before = sqlite3_total_changes(db_);

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::vector<CellValue> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; j++) {
            row.push_back(read_cell(stmt, j));
        }
        result.rows.push_back(std::move(row));
    }

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_finalize(stmt);
        return DbResultSet::error(std::move(error));
    }

    // DDL leaves sqlite3_changes() at the previous DML's count
    if (sqlite3_total_changes(db_) != changes_before) {
        result.affected_rows = static_cast<uint64_t>(sqlite3_changes(db_));
    }

    sqlite3_finalize(stmt);
    result.success = true;
    return result;
}

bool SqliteConnection::is_connected() const {
    return db_ != nullptr;
}

void SqliteConnection::close() {
    if (db_) {
        const int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            utils::log::warn(std::format("sqlite3_close_v2 failed: {}", sqlite3_errstr(rc)));
        }
        db_ = nullptr;
    }
}

CellValue SqliteConnection::read_cell(sqlite3_stmt* stmt, int column) {
    switch (sqlite3_column_type(stmt, column)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, column));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, column);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
            const int len = sqlite3_column_bytes(stmt, column);
            return std::string(text ? text : "", static_cast<size_t>(len));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, column));
            const int len = sqlite3_column_bytes(stmt, column);
            if (!data || len <= 0) {
                return Blob{};
            }
            return Blob(data, data + len);
        }
        case SQLITE_NULL:
        default:
            return std::monostate{};
    }
}

// ============================================================================
// SqliteConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> SqliteConnectionFactory::create(
    const std::string& location) {

    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(location.c_str(), &db, flags, nullptr);

    if (!db) {
        utils::log::error("Failed to allocate sqlite3 handle");
        return nullptr;
    }

    if (rc != SQLITE_OK) {
        utils::log::error(std::format("Failed to open database {}: {}", location, sqlite3_errmsg(db)));
        sqlite3_close_v2(db);
        return nullptr;
    }

    if (config_.busy_timeout_ms > 0) {
        sqlite3_busy_timeout(db, config_.busy_timeout_ms);
    }

    return std::make_unique<SqliteConnection>(db);
}

} // namespace sqlmcp
