#pragma once

#include "db/idb_connection.hpp"
#include "db/iquery_executor.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace sqlmcp {

/**
 * @brief Query executor - sole owner of the database connection
 *
 * Handles statement branching:
 * - read: execute + fetch rows
 * - write / schema definition: execute + capture affected_rows
 *
 * Every call holds connection_mutex_ for its whole duration, so concurrent
 * transport workers are serialized on the single connection in lock order.
 * No transaction wrapping: each statement commits on its own.
 */
class QueryExecutor : public IQueryExecutor {
public:
    /**
     * @brief Take exclusive ownership of an open connection
     * @throws std::invalid_argument if connection is null
     */
    explicit QueryExecutor(std::unique_ptr<IDbConnection> connection);

    ~QueryExecutor() override;

    QueryExecutor(const QueryExecutor&) = delete;
    QueryExecutor& operator=(const QueryExecutor&) = delete;

    QueryResult execute_read(const std::string& sql) override;
    QueryResult execute_write(const std::string& sql) override;
    QueryResult list_tables() override;
    QueryResult describe_table(const std::string& table_name) override;

    /**
     * @brief Render a table name as a double-quoted SQL identifier
     *
     * Embedded double quotes are doubled, so the name cannot terminate the
     * identifier and inject SQL into the introspection statement.
     */
    [[nodiscard]] static std::string quote_identifier(std::string_view name);

private:
    [[nodiscard]] DbResultSet run(const std::string& sql);

    std::unique_ptr<IDbConnection> connection_;
    std::mutex connection_mutex_;
};

} // namespace sqlmcp
