#pragma once

#include "core/json.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace sqlmcp {

/**
 * @brief Uniform success/error envelope returned for every operation call
 *
 * Serializes to {"content":[{"type":"text","text":...}], "isError":true}.
 * isError is only emitted on the error path.
 */
struct ToolResponse {
    std::vector<std::string> content;
    bool is_error = false;
    ErrorCode error_code = ErrorCode::NONE;

    static ToolResponse text(std::string body) {
        ToolResponse r;
        r.content.push_back(std::move(body));
        return r;
    }

    /// Text becomes "Error: <message>"
    static ToolResponse error(ErrorCode code, const std::string& message) {
        ToolResponse r;
        r.content.push_back("Error: " + message);
        r.is_error = true;
        r.error_code = code;
        return r;
    }

    [[nodiscard]] std::string first_text() const {
        return content.empty() ? std::string{} : content.front();
    }

    [[nodiscard]] Json to_json() const;
};

// ============================================================================
// Result formatting
// ============================================================================

/**
 * @brief One cell as JSON
 *
 * NULL -> null, INTEGER/REAL -> number, TEXT -> string,
 * BLOB -> {"type":"Buffer","data":[byte, ...]}.
 */
[[nodiscard]] Json cell_to_json(const CellValue& value);

/**
 * @brief Rows as an array of objects keyed by column name, in engine order
 */
[[nodiscard]] Json rows_to_json(const QueryResult& result);

/**
 * @brief Rows pretty-printed with 2-space indentation ("[]" when empty)
 */
[[nodiscard]] std::string format_rows(const QueryResult& result);

/**
 * @brief [{"affectedRows": N}] pretty-printed with 2-space indentation
 */
[[nodiscard]] std::string format_affected_rows(const QueryResult& result);

} // namespace sqlmcp
