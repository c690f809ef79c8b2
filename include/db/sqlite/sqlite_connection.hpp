#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <sqlite3.h>
#include <string>

namespace sqlmcp {

/**
 * @brief SQLite connection implementing IDbConnection
 *
 * Wraps sqlite3* and provides the database-agnostic interface.
 * All sqlite3 calls are encapsulated here.
 */
class SqliteConnection : public IDbConnection {
public:
    /**
     * @brief Construct from an open sqlite3* (takes ownership)
     */
    explicit SqliteConnection(sqlite3* db);

    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    /**
     * Prepares the first statement of sql (any tail is ignored), steps it to
     * completion and copies every produced row. affected_rows is
     * sqlite3_changes() when the statement modified rows, otherwise 0.
     */
    DbResultSet execute(const std::string& sql) override;
    bool is_connected() const override;
    void close() override;

private:
    static CellValue read_cell(sqlite3_stmt* stmt, int column);

    sqlite3* db_;
};

/**
 * @brief SQLite connection factory
 *
 * Opens (creating if missing) the database file read-write.
 */
class SqliteConnectionFactory : public IConnectionFactory {
public:
    struct Config {
        int busy_timeout_ms = 0;
    };

    SqliteConnectionFactory() = default;
    explicit SqliteConnectionFactory(const Config& config) : config_(config) {}

    std::unique_ptr<IDbConnection> create(const std::string& location) override;

private:
    Config config_;
};

} // namespace sqlmcp
