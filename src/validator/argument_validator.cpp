#include "validator/argument_validator.hpp"

#include <format>

namespace sqlmcp {

namespace {

bool matches_type(const Json& value, FieldType type) {
    switch (type) {
        case FieldType::STRING:  return value.is_string();
        case FieldType::NUMBER:  return value.is_number();
        case FieldType::BOOLEAN: return value.is_boolean();
    }
    return false;
}

// Only called after check_fields accepted the bag
std::string string_arg(const Json& arguments, const char* field) {
    const auto it = arguments.find(field);
    if (it == arguments.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // anonymous namespace

// ============================================================================
// ValidationResult
// ============================================================================

std::string ValidationResult::error_message() const {
    if (unknown_operation) {
        return std::format("Unknown tool: {}", operation);
    }
    std::string details;
    for (const auto& err : errors) {
        if (!details.empty()) {
            details += "; ";
        }
        details += err.describe();
    }
    return std::format("Invalid arguments for {}: {}", operation, details);
}

// ============================================================================
// ArgumentValidator
// ============================================================================

ArgumentValidator::ArgumentValidator(std::shared_ptr<const OperationCatalog> catalog)
    : catalog_(std::move(catalog)) {}

ValidationResult ArgumentValidator::validate(
    std::string_view operation, const Json& arguments) const {

    const OperationDescriptor* descriptor = catalog_ ? catalog_->find(operation) : nullptr;
    if (!descriptor) {
        return ValidationResult::unknown(std::string(operation));
    }

    const Json empty_bag = Json::object();
    const Json& effective = arguments.is_null() ? empty_bag : arguments;

    auto errors = check_fields(*descriptor, effective);
    if (!errors.empty()) {
        return ValidationResult::invalid(descriptor->name, std::move(errors));
    }
    return ValidationResult::ok(descriptor->name, build_args(*descriptor, effective));
}

std::vector<FieldError> ArgumentValidator::check_fields(
    const OperationDescriptor& descriptor, const Json& arguments) {

    std::vector<FieldError> errors;

    if (!arguments.is_object()) {
        errors.push_back({"", std::format("Expected object, received {}", json_type_name(arguments))});
        return errors;
    }

    for (const auto& field : descriptor.fields) {
        const auto it = arguments.find(field.name);
        if (it == arguments.end()) {
            if (field.required) {
                errors.push_back({field.name, "Required"});
            }
            continue;
        }
        if (!matches_type(*it, field.type)) {
            errors.push_back({field.name, std::format("Expected {}, received {}",
                field_type_str(field.type), json_type_name(*it))});
        }
    }
    return errors;
}

OperationArgs ArgumentValidator::build_args(
    const OperationDescriptor& descriptor, const Json& arguments) {

    switch (descriptor.category) {
        case OperationCategory::READ_QUERY:
            return ReadQueryArgs{string_arg(arguments, "query")};
        case OperationCategory::WRITE_QUERY:
            return WriteQueryArgs{string_arg(arguments, "query")};
        case OperationCategory::SCHEMA_DEFINITION:
            return CreateTableArgs{string_arg(arguments, "query")};
        case OperationCategory::LIST_TABLES:
            return ListTablesArgs{};
        case OperationCategory::DESCRIBE_TABLE:
            return DescribeTableArgs{string_arg(arguments, "table_name")};
        case OperationCategory::APPEND_INSIGHT:
            return AppendInsightArgs{string_arg(arguments, "insight")};
    }
    return ListTablesArgs{};
}

} // namespace sqlmcp
