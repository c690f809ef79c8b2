#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace sqlmcp {

/**
 * @brief Abstract factory for creating database connections
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a new database connection
     * @param location Backend-specific location (file path for SQLite)
     * @return New connection, or nullptr on failure (failure is logged)
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& location) = 0;
};

} // namespace sqlmcp
