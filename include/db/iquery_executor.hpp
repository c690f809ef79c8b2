#pragma once

#include "core/types.hpp"
#include <string>

namespace sqlmcp {

/**
 * @brief Abstract query executor interface
 *
 * OperationDispatcher holds shared_ptr<IQueryExecutor>. Statement category
 * checks happen before any of these calls; implementations execute what
 * they are given.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /** @brief Run a statement and return its rows */
    [[nodiscard]] virtual QueryResult execute_read(const std::string& sql) = 0;

    /** @brief Run a statement and return the affected-row count */
    [[nodiscard]] virtual QueryResult execute_write(const std::string& sql) = 0;

    /** @brief Names of all user tables */
    [[nodiscard]] virtual QueryResult list_tables() = 0;

    /** @brief Column metadata of one table, in declaration order */
    [[nodiscard]] virtual QueryResult describe_table(const std::string& table_name) = 0;
};

} // namespace sqlmcp
