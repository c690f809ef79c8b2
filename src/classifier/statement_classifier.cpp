#include "classifier/statement_classifier.hpp"
#include "core/utils.hpp"

namespace sqlmcp {

namespace {

constexpr std::string_view kSelectPrefix = "SELECT";
constexpr std::string_view kCreateTablePrefix = "CREATE TABLE";

} // anonymous namespace

StatementCategory StatementClassifier::classify(std::string_view sql) {
    const std::string normalized = utils::to_upper(utils::trim(sql));

    if (utils::starts_with(normalized, kSelectPrefix)) {
        return StatementCategory::READ;
    }
    if (utils::starts_with(normalized, kCreateTablePrefix)) {
        return StatementCategory::SCHEMA_DEFINITION;
    }
    return StatementCategory::WRITE;
}

std::optional<std::string> StatementClassifier::check(
    OperationCategory operation, std::string_view sql) {

    switch (operation) {
        case OperationCategory::READ_QUERY:
            if (classify(sql) != StatementCategory::READ) {
                return "Only SELECT queries are allowed for read_query";
            }
            break;
        case OperationCategory::WRITE_QUERY:
            if (classify(sql) == StatementCategory::READ) {
                return "SELECT queries are not allowed for write_query";
            }
            break;
        case OperationCategory::SCHEMA_DEFINITION:
            if (classify(sql) != StatementCategory::SCHEMA_DEFINITION) {
                return "Only CREATE TABLE statements are allowed";
            }
            break;
        case OperationCategory::LIST_TABLES:
        case OperationCategory::DESCRIBE_TABLE:
        case OperationCategory::APPEND_INSIGHT:
            break;
    }
    return std::nullopt;
}

} // namespace sqlmcp
