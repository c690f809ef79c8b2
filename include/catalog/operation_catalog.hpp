#pragma once

#include "core/json.hpp"
#include "core/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sqlmcp {

// ============================================================================
// Operation names
// ============================================================================

namespace op {
    inline constexpr std::string_view kReadQuery     = "read_query";
    inline constexpr std::string_view kWriteQuery    = "write_query";
    inline constexpr std::string_view kCreateTable   = "create_table";
    inline constexpr std::string_view kListTables    = "list_tables";
    inline constexpr std::string_view kDescribeTable = "describe_table";
    inline constexpr std::string_view kAppendInsight = "append_insight";
}

// ============================================================================
// Argument shape declarations
// ============================================================================

enum class FieldType { STRING, NUMBER, BOOLEAN };

[[nodiscard]] inline constexpr const char* field_type_str(FieldType t) noexcept {
    switch (t) {
        case FieldType::STRING:  return "string";
        case FieldType::NUMBER:  return "number";
        case FieldType::BOOLEAN: return "boolean";
    }
    return "unknown";
}

/**
 * @brief One named argument of an operation
 *
 * description is advertised to callers but never enforced.
 */
struct FieldSpec {
    std::string name;
    FieldType type = FieldType::STRING;
    bool required = true;
    std::string description;
};

struct OperationDescriptor {
    std::string name;
    std::string description;
    OperationCategory category;
    std::vector<FieldSpec> fields;
};

/**
 * @brief Immutable list of advertised operations
 *
 * Single source of truth for both argument validation and the tools/list
 * advertisement: input schemas are rendered from the same FieldSpec data the
 * validator checks against.
 */
class OperationCatalog {
public:
    explicit OperationCatalog(std::vector<OperationDescriptor> operations);

    /**
     * @brief The six SQLite tools (read_query ... append_insight)
     */
    [[nodiscard]] static std::shared_ptr<const OperationCatalog> standard();

    /** @brief Lookup by name, nullptr if not in the catalog */
    [[nodiscard]] const OperationDescriptor* find(std::string_view name) const;

    [[nodiscard]] const std::vector<OperationDescriptor>& operations() const {
        return operations_;
    }

    [[nodiscard]] size_t size() const { return operations_.size(); }

    /**
     * @brief JSON Schema (draft-07) describing an operation's argument object
     *
     * Operations without fields render as {"type":"object","properties":{}}.
     */
    [[nodiscard]] static Json input_schema(const OperationDescriptor& descriptor);

    /**
     * @brief Array of {name, description, inputSchema} in catalog order
     */
    [[nodiscard]] Json to_tools_json() const;

private:
    std::vector<OperationDescriptor> operations_;
};

} // namespace sqlmcp
