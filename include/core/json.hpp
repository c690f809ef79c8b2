#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace sqlmcp {

/**
 * @brief JSON DOM used by the protocol, catalog and result serialization
 *
 * ordered_json keeps object members in insertion order: result rows keep
 * the engine's column order and advertised schemas keep declaration order.
 */
using Json = nlohmann::ordered_json;

/**
 * @brief Type name of a JSON value as it appears in validation messages
 */
[[nodiscard]] inline std::string json_type_name(const Json& value) {
    switch (value.type()) {
        case Json::value_t::null:            return "null";
        case Json::value_t::boolean:         return "boolean";
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:    return "number";
        case Json::value_t::string:          return "string";
        case Json::value_t::array:           return "array";
        case Json::value_t::object:          return "object";
        case Json::value_t::binary:          return "binary";
        case Json::value_t::discarded:       return "undefined";
    }
    return "unknown";
}

/**
 * @brief Serialize without throwing on invalid UTF-8 (replaced with U+FFFD)
 * @param indent -1 for compact output, otherwise spaces per level
 */
[[nodiscard]] inline std::string dump_json(const Json& value, int indent = -1) {
    return value.dump(indent, ' ', false, Json::error_handler_t::replace);
}

} // namespace sqlmcp
