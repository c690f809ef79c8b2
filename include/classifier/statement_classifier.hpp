#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sqlmcp {

/**
 * @brief Classifies a raw SQL statement by its leading keyword
 *
 * Algorithm: trim surrounding whitespace, uppercase a copy, then
 *   "SELECT"       prefix -> READ
 *   "CREATE TABLE" prefix -> SCHEMA_DEFINITION
 *   otherwise             -> WRITE
 *
 * This is a textual prefix check, not a parser. Leading comments, CTEs
 * ("WITH ... SELECT") and multi-statement payloads are not recognized;
 * a CTE read therefore classifies as WRITE.
 */
class StatementClassifier {
public:
    [[nodiscard]] static StatementCategory classify(std::string_view sql);

    /**
     * @brief Check a statement against the category an operation requires
     * @return std::nullopt if allowed, otherwise the rejection message
     *
     * Only READ_QUERY, WRITE_QUERY and SCHEMA_DEFINITION operations carry SQL;
     * every other operation category is always allowed.
     */
    [[nodiscard]] static std::optional<std::string> check(
        OperationCategory operation, std::string_view sql);
};

} // namespace sqlmcp
