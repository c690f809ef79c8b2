#pragma once

#include "catalog/operation_catalog.hpp"
#include "core/json.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sqlmcp {

// ============================================================================
// Typed arguments (one alternative per operation)
// ============================================================================

struct ReadQueryArgs     { std::string query; };
struct WriteQueryArgs    { std::string query; };
struct CreateTableArgs   { std::string query; };
struct ListTablesArgs    {};
struct DescribeTableArgs { std::string table_name; };
struct AppendInsightArgs { std::string insight; };

using OperationArgs = std::variant<
    ReadQueryArgs,
    WriteQueryArgs,
    CreateTableArgs,
    ListTablesArgs,
    DescribeTableArgs,
    AppendInsightArgs>;

/**
 * @brief A single shape violation
 *
 * field is empty when the argument bag itself has the wrong type.
 */
struct FieldError {
    std::string field;
    std::string message;

    [[nodiscard]] std::string describe() const {
        return field.empty() ? message : field + ": " + message;
    }
};

struct ValidationResult {
    bool success = false;
    bool unknown_operation = false;
    std::string operation;
    std::optional<OperationArgs> args;
    std::vector<FieldError> errors;

    static ValidationResult ok(std::string operation, OperationArgs args) {
        ValidationResult r;
        r.success = true;
        r.operation = std::move(operation);
        r.args = std::move(args);
        return r;
    }

    static ValidationResult unknown(std::string operation) {
        ValidationResult r;
        r.unknown_operation = true;
        r.operation = std::move(operation);
        return r;
    }

    static ValidationResult invalid(std::string operation, std::vector<FieldError> errors) {
        ValidationResult r;
        r.operation = std::move(operation);
        r.errors = std::move(errors);
        return r;
    }

    /**
     * @brief "Unknown tool: <op>" or "Invalid arguments for <op>: <errors>"
     */
    [[nodiscard]] std::string error_message() const;
};

/**
 * @brief Checks untyped argument bags against the catalog's declared shapes
 *
 * Fails closed and never throws: unknown operation, non-object argument bag,
 * missing required field and wrong primitive type all come back as a
 * ValidationResult with success == false. Extra fields are ignored. A null
 * (absent) argument bag is treated as an empty object.
 */
class ArgumentValidator {
public:
    explicit ArgumentValidator(std::shared_ptr<const OperationCatalog> catalog);

    [[nodiscard]] ValidationResult validate(
        std::string_view operation, const Json& arguments) const;

private:
    [[nodiscard]] static std::vector<FieldError> check_fields(
        const OperationDescriptor& descriptor, const Json& arguments);

    [[nodiscard]] static OperationArgs build_args(
        const OperationDescriptor& descriptor, const Json& arguments);

    std::shared_ptr<const OperationCatalog> catalog_;
};

} // namespace sqlmcp
