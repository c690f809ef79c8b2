#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace sqlmcp {

// ============================================================================
// Basic Enums
// ============================================================================

enum class ErrorCode {
    NONE,
    VALIDATION_ERROR,     // Argument bag does not match shape, or unknown operation
    CATEGORY_MISMATCH,    // Statement category conflicts with the operation
    DATABASE_ERROR,       // Engine rejected or failed the statement
    INTERNAL_ERROR
};

/**
 * @brief Category of a SQL statement, derived from its leading keyword
 */
enum class StatementCategory {
    READ,                 // SELECT ...
    WRITE,                // anything that is neither READ nor SCHEMA_DEFINITION
    SCHEMA_DEFINITION     // CREATE TABLE ...
};

/**
 * @brief What an operation does once its arguments are validated
 */
enum class OperationCategory {
    READ_QUERY,
    WRITE_QUERY,
    SCHEMA_DEFINITION,
    LIST_TABLES,
    DESCRIBE_TABLE,
    APPEND_INSIGHT
};

[[nodiscard]] inline constexpr const char* error_code_str(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:              return "NONE";
        case ErrorCode::VALIDATION_ERROR:  return "VALIDATION_ERROR";
        case ErrorCode::CATEGORY_MISMATCH: return "CATEGORY_MISMATCH";
        case ErrorCode::DATABASE_ERROR:    return "DATABASE_ERROR";
        case ErrorCode::INTERNAL_ERROR:    return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

[[nodiscard]] inline constexpr const char* statement_category_str(StatementCategory c) noexcept {
    switch (c) {
        case StatementCategory::READ:              return "READ";
        case StatementCategory::WRITE:             return "WRITE";
        case StatementCategory::SCHEMA_DEFINITION: return "SCHEMA_DEFINITION";
    }
    return "UNKNOWN";
}

// ============================================================================
// Cell values and query results
// ============================================================================

using Blob = std::vector<uint8_t>;

/**
 * @brief One column value of a result row
 *
 * Alternatives follow SQLite's storage classes:
 * NULL, INTEGER, REAL, TEXT, BLOB.
 */
using CellValue = std::variant<std::monostate, int64_t, double, std::string, Blob>;

/**
 * @brief Outcome of one executor call
 *
 * Reads fill column_names + rows (a row is rows[i][j] for column_names[j]).
 * Writes fill affected_rows.
 */
struct QueryResult {
    bool success;
    ErrorCode error_code;
    std::string error_message;

    // For reads
    std::vector<std::string> column_names;
    std::vector<std::vector<CellValue>> rows;

    // For writes
    uint64_t affected_rows;

    QueryResult()
        : success(false),
          error_code(ErrorCode::NONE),
          affected_rows(0) {}

    static QueryResult failure(ErrorCode code, std::string message) {
        QueryResult r;
        r.success = false;
        r.error_code = code;
        r.error_message = std::move(message);
        return r;
    }
};

} // namespace sqlmcp
