#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sqlmcp {

/**
 * @brief Result set from a statement execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied out of the native statement handle).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    // Statements that produce columns (SELECT, PRAGMA table_info, ...)
    std::vector<std::string> column_names;
    std::vector<std::vector<CellValue>> rows;

    // Rows changed by INSERT/UPDATE/DELETE; 0 for everything else
    uint64_t affected_rows = 0;

    static DbResultSet error(std::string message) {
        DbResultSet r;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Implementations are not
 * thread-safe; QueryExecutor serializes access.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute the first SQL statement in sql
     * @return Rows (if the statement yields columns) and affected count.
     *         Engine failures set success = false and carry the engine's
     *         message unmodified.
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace sqlmcp
