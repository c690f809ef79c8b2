#include "catalog/operation_catalog.hpp"

#include <format>
#include <stdexcept>
#include <unordered_set>

namespace sqlmcp {

namespace {

constexpr const char* kJsonSchemaDraft = "http://json-schema.org/draft-07/schema#";

FieldSpec string_field(std::string name, std::string description) {
    return FieldSpec{std::move(name), FieldType::STRING, true, std::move(description)};
}

} // anonymous namespace

OperationCatalog::OperationCatalog(std::vector<OperationDescriptor> operations)
    : operations_(std::move(operations)) {
    std::unordered_set<std::string> seen;
    for (const auto& descriptor : operations_) {
        if (!seen.insert(descriptor.name).second) {
            throw std::invalid_argument(
                std::format("Duplicate operation name in catalog: {}", descriptor.name));
        }
    }
}

std::shared_ptr<const OperationCatalog> OperationCatalog::standard() {
    static const auto catalog = std::make_shared<const OperationCatalog>(
        std::vector<OperationDescriptor>{
            {std::string(op::kReadQuery),
             "Execute a SELECT query on the SQLite database",
             OperationCategory::READ_QUERY,
             {string_field("query", "SELECT SQL query to execute")}},
            {std::string(op::kWriteQuery),
             "Execute an INSERT, UPDATE, or DELETE query on the SQLite database",
             OperationCategory::WRITE_QUERY,
             {string_field("query", "INSERT, UPDATE, or DELETE SQL query to execute")}},
            {std::string(op::kCreateTable),
             "Create a new table in the SQLite database",
             OperationCategory::SCHEMA_DEFINITION,
             {string_field("query", "CREATE TABLE SQL statement")}},
            {std::string(op::kListTables),
             "List all tables in the SQLite database",
             OperationCategory::LIST_TABLES,
             {}},
            {std::string(op::kDescribeTable),
             "Get the schema information for a specific table",
             OperationCategory::DESCRIBE_TABLE,
             {string_field("table_name", "Name of the table to describe")}},
            {std::string(op::kAppendInsight),
             "Add a business insight to the memo",
             OperationCategory::APPEND_INSIGHT,
             {string_field("insight", "Business insight discovered from data analysis")}},
        });
    return catalog;
}

const OperationDescriptor* OperationCatalog::find(std::string_view name) const {
    for (const auto& descriptor : operations_) {
        if (descriptor.name == name) {
            return &descriptor;
        }
    }
    return nullptr;
}

Json OperationCatalog::input_schema(const OperationDescriptor& descriptor) {
    Json schema = Json::object();
    schema["type"] = "object";
    schema["properties"] = Json::object();

    if (descriptor.fields.empty()) {
        return schema;
    }

    Json required = Json::array();
    for (const auto& field : descriptor.fields) {
        Json property = Json::object();
        property["type"] = field_type_str(field.type);
        if (!field.description.empty()) {
            property["description"] = field.description;
        }
        schema["properties"][field.name] = std::move(property);
        if (field.required) {
            required.push_back(field.name);
        }
    }
    if (!required.empty()) {
        schema["required"] = std::move(required);
    }
    schema["additionalProperties"] = false;
    schema["$schema"] = kJsonSchemaDraft;
    return schema;
}

Json OperationCatalog::to_tools_json() const {
    Json tools = Json::array();
    for (const auto& descriptor : operations_) {
        Json tool = Json::object();
        tool["name"] = descriptor.name;
        tool["description"] = descriptor.description;
        tool["inputSchema"] = input_schema(descriptor);
        tools.push_back(std::move(tool));
    }
    return tools;
}

} // namespace sqlmcp
