#include "executor/query_executor.hpp"
#include "core/utils.hpp"
#include <format>
#include <stdexcept>

namespace sqlmcp {

namespace {

constexpr const char* kListTablesSql = "SELECT name FROM sqlite_master WHERE type='table'";

QueryResult engine_failure(const DbResultSet& db_result) {
    return QueryResult::failure(ErrorCode::DATABASE_ERROR, db_result.error_message);
}

QueryResult rows_result(DbResultSet&& db_result) {
    QueryResult result;
    result.success = true;
    result.column_names = std::move(db_result.column_names);
    result.rows = std::move(db_result.rows);
    result.affected_rows = db_result.affected_rows;
    return result;
}

} // anonymous namespace

QueryExecutor::QueryExecutor(std::unique_ptr<IDbConnection> connection)
    : connection_(std::move(connection)) {
    if (!connection_) {
        throw std::invalid_argument("QueryExecutor requires an open connection");
    }
}

QueryExecutor::~QueryExecutor() {
    std::lock_guard lock(connection_mutex_);
    connection_->close();
}

DbResultSet QueryExecutor::run(const std::string& sql) {
    std::lock_guard lock(connection_mutex_);
    if (!connection_->is_connected()) {
        return DbResultSet::error("Database connection is closed");
    }
    return connection_->execute(sql);
}

QueryResult QueryExecutor::execute_read(const std::string& sql) {
    auto db_result = run(sql);

    if (!db_result.success) {
        utils::log::warn(std::format("Read failed: {}", db_result.error_message));
        return engine_failure(db_result);
    }

    return rows_result(std::move(db_result));
}

QueryResult QueryExecutor::execute_write(const std::string& sql) {
    auto db_result = run(sql);

    if (!db_result.success) {
        utils::log::warn(std::format("Write failed: {}", db_result.error_message));
        return engine_failure(db_result);
    }

    QueryResult result;
    result.success = true;
    result.affected_rows = db_result.affected_rows;
    return result;
}

QueryResult QueryExecutor::list_tables() {
    return execute_read(kListTablesSql);
}

QueryResult QueryExecutor::describe_table(const std::string& table_name) {
    return execute_read(std::format("PRAGMA table_info({})", quote_identifier(table_name)));
}

std::string QueryExecutor::quote_identifier(std::string_view name) {
    std::string quoted;
    quoted.reserve(name.size() + 2);
    quoted += '"';
    for (const char c : name) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace sqlmcp
